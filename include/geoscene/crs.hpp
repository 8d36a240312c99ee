#pragma once

#include "geoscene/types.hpp"

#include <boost/json.hpp>

#include <functional>
#include <future>
#include <string>
#include <unordered_map>

namespace geoscene {

    inline constexpr const char *Crs84Name = "urn:ogc:def:crs:OGC:1.3:CRS84";
    inline constexpr const char *Epsg4326Name = "EPSG:4326";

    // Receives the "properties" member of a link CRS and produces its transform, possibly later.
    using CrsLinkResolver = std::function<std::future<CoordinateTransform>(const boost::json::object &properties)>;

    // Geodetic WGS84 (degrees, metres) to Earth-centred Earth-fixed metres. Missing height is 0.
    dp::Point wgs84ToCartesian(const Coordinate &coordinate);

    // East/north/up metres relative to the given datum, for WGS84 input positions.
    CoordinateTransform localTangentPlane(const dp::Geo &datum);

    // Wraps a transform in an already satisfied future, for resolvers that need no waiting.
    std::future<CoordinateTransform> makeReadyTransform(CoordinateTransform transform);

    /**
     * Maps GeoJSON "crs" members to coordinate transforms.
     *
     * Named CRSs resolve immediately. Link CRSs are looked up by href first, then by link type, and
     * their resolver may complete asynchronously. A fresh registry knows CRS84 and EPSG:4326.
     * Registration and resolution are not synchronized against each other.
     */
    class CrsRegistry {
      public:
        CrsRegistry();

        // Process-wide instance used when a data source is not given its own registry.
        static CrsRegistry &global();

        void registerCrsName(const std::string &name, CoordinateTransform transform);
        void registerCrsLinkHrefResolver(const std::string &href, CrsLinkResolver resolver);
        void registerCrsLinkTypeResolver(const std::string &type, CrsLinkResolver resolver);

        bool hasCrsName(const std::string &name) const;

        // Throws Error for a malformed or unknown crs member; the returned future carries resolver failures.
        std::future<CoordinateTransform> resolve(const boost::json::object &geoJson) const;

      private:
        std::unordered_map<std::string, CoordinateTransform> names_;
        std::unordered_map<std::string, CrsLinkResolver> linkHrefs_;
        std::unordered_map<std::string, CrsLinkResolver> linkTypes_;
    };

} // namespace geoscene
