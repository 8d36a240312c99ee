#include "geoscene/crs.hpp"
#include "geoscene/error.hpp"

#include <concord/concord.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace geoscene {

    namespace {
        constexpr double Pi = 3.14159265358979323846;

        // WGS84 ellipsoid
        constexpr double SemiMajorAxis = 6378137.0;
        constexpr double Flattening = 1.0 / 298.257223563;
        constexpr double EccentricitySquared = Flattening * (2.0 - Flattening);

        std::string memberString(const boost::json::object &obj, const char *key) {
            auto const *v = obj.if_contains(key);
            if (!v || !v->is_string())
                return "";
            return std::string(v->as_string());
        }
    } // namespace

    dp::Point wgs84ToCartesian(const Coordinate &coordinate) {
        double lon = coordinate.x * Pi / 180.0;
        double lat = coordinate.y * Pi / 180.0;
        double height = coordinate.z.value_or(0.0);

        double sinLat = std::sin(lat);
        double cosLat = std::cos(lat);
        double n = SemiMajorAxis / std::sqrt(1.0 - EccentricitySquared * sinLat * sinLat);

        return dp::Point{(n + height) * cosLat * std::cos(lon), (n + height) * cosLat * std::sin(lon),
                         (n * (1.0 - EccentricitySquared) + height) * sinLat};
    }

    CoordinateTransform localTangentPlane(const dp::Geo &datum) {
        return [datum](const Coordinate &coordinate) {
            concord::earth::WGS wgs{coordinate.y, coordinate.x, coordinate.z.value_or(0.0)};
            auto enu = concord::frame::to_enu(datum, wgs);
            return dp::Point{enu.east(), enu.north(), enu.up()};
        };
    }

    std::future<CoordinateTransform> makeReadyTransform(CoordinateTransform transform) {
        std::promise<CoordinateTransform> promise;
        promise.set_value(std::move(transform));
        return promise.get_future();
    }

    CrsRegistry::CrsRegistry() {
        names_[Crs84Name] = wgs84ToCartesian;
        names_[Epsg4326Name] = wgs84ToCartesian;
    }

    CrsRegistry &CrsRegistry::global() {
        static CrsRegistry registry;
        return registry;
    }

    void CrsRegistry::registerCrsName(const std::string &name, CoordinateTransform transform) {
        names_[name] = std::move(transform);
    }

    void CrsRegistry::registerCrsLinkHrefResolver(const std::string &href, CrsLinkResolver resolver) {
        linkHrefs_[href] = std::move(resolver);
    }

    void CrsRegistry::registerCrsLinkTypeResolver(const std::string &type, CrsLinkResolver resolver) {
        linkTypes_[type] = std::move(resolver);
    }

    bool CrsRegistry::hasCrsName(const std::string &name) const { return names_.find(name) != names_.end(); }

    std::future<CoordinateTransform> CrsRegistry::resolve(const boost::json::object &geoJson) const {
        auto const *crs = geoJson.if_contains("crs");
        if (!crs) {
            spdlog::debug("geoscene: no crs member, using {}", Crs84Name);
            return makeReadyTransform(wgs84ToCartesian);
        }

        if (crs->is_null())
            throw Error(ErrorCode::InvalidCrs, "crs is null.");

        auto const *crsObj = crs->if_object();
        auto const *props = crsObj ? crsObj->if_contains("properties") : nullptr;
        if (!props)
            throw Error(ErrorCode::InvalidCrs, "crs.properties is undefined.");

        static const boost::json::object noProperties;
        auto const &properties = props->is_object() ? props->as_object() : noProperties;

        auto type = memberString(*crsObj, "type");
        if (type == "name") {
            auto name = memberString(properties, "name");
            auto it = names_.find(name);
            if (it == names_.end())
                throw Error(ErrorCode::UnknownCrsName, "Unknown crs name: " + name);

            spdlog::debug("geoscene: resolved crs name {}", name);
            return makeReadyTransform(it->second);
        }

        if (type == "link") {
            auto href = memberString(properties, "href");
            auto it = linkHrefs_.find(href);
            if (it == linkHrefs_.end()) {
                it = linkTypes_.find(memberString(properties, "type"));
                if (it == linkTypes_.end())
                    throw Error(ErrorCode::UnresolvableCrsLink,
                                "Unable to resolve crs link: " + boost::json::serialize(*props));
            }

            spdlog::debug("geoscene: resolving crs link {}", boost::json::serialize(*props));
            return it->second(properties);
        }

        throw Error(ErrorCode::UnknownCrsType, "Unknown crs type: " + type);
    }

} // namespace geoscene
