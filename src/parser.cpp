#include "geoscene/parser.hpp"
#include "geoscene/error.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/fmt/fmt.h>

#include <vector>

namespace geoscene {

    using json = boost::json::value;

    namespace {
        std::string typeString(const boost::json::object &obj) {
            auto const *type = obj.if_contains("type");
            if (!type)
                return "undefined";
            if (type->is_string())
                return std::string(type->as_string());
            return boost::json::serialize(*type);
        }

        const boost::json::array &requireArray(const boost::json::object &obj, const char *key) {
            auto const *v = obj.if_contains(key);
            if (!v || !v->is_array())
                throw Error(ErrorCode::MalformedDocument,
                            typeString(obj) + " requires an array member '" + std::string(key) + "'");
            return v->as_array();
        }

        const boost::json::array &asArray(const json &v, const char *what) {
            if (!v.is_array())
                throw Error(ErrorCode::MalformedDocument, std::string(what) + " must be an array");
            return v.as_array();
        }

        std::string generateId() {
            thread_local boost::uuids::random_generator generator;
            return boost::uuids::to_string(generator());
        }

        std::optional<std::string> featureId(const json &node) {
            auto const *obj = node.if_object();
            if (!obj || typeString(*obj) != "Feature")
                return std::nullopt;

            auto const *id = obj->if_contains("id");
            if (!id)
                return std::nullopt;
            switch (id->kind()) {
            case boost::json::kind::string:
                return std::string(id->as_string());
            case boost::json::kind::int64:
                return std::to_string(id->as_int64());
            case boost::json::kind::uint64:
                return std::to_string(id->as_uint64());
            case boost::json::kind::double_:
                return fmt::format("{}", id->as_double());
            default:
                return std::nullopt;
            }
        }

        Coordinate toCoordinate(const boost::json::array &arr) {
            bool valid = arr.size() >= 2 && arr[0].is_number() && arr[1].is_number();
            if (!valid || (arr.size() > 2 && !arr[2].is_number()))
                throw Error(ErrorCode::MalformedDocument, "Invalid position: " + boost::json::serialize(arr));

            Coordinate c;
            c.x = boost::json::value_to<double>(arr[0]);
            c.y = boost::json::value_to<double>(arr[1]);
            if (arr.size() > 2)
                c.z = boost::json::value_to<double>(arr[2]);
            return c;
        }

        std::vector<dp::Point> transformPositions(const boost::json::array &positions, DecodeContext &context) {
            std::vector<dp::Point> out;
            out.reserve(positions.size());
            for (auto const &c : positions)
                out.push_back(context.transform(parseCoordinate(c)));
            return out;
        }

        void processPoint(const json &owner, const boost::json::array &coords, DecodeContext &context) {
            Entity &entity = createEntity(owner, context);
            entity.merge(context.styles.point);
            if (!coords.empty())
                entity.setPosition(context.transform(toCoordinate(coords)));
        }

        void processMultiPoint(const json &owner, const boost::json::array &coords, DecodeContext &context) {
            for (auto const &c : coords) {
                Entity &entity = createEntity(owner, context);
                entity.merge(context.styles.point);
                entity.setPosition(context.transform(parseCoordinate(c)));
            }
        }

        void processLineString(const json &owner, const boost::json::array &coords, DecodeContext &context) {
            Entity &entity = createEntity(owner, context);
            entity.merge(context.styles.line);
            entity.setVertexPositions(transformPositions(coords, context));
        }

        void processMultiLineString(const json &owner, const boost::json::array &coords, DecodeContext &context) {
            for (auto const &line : coords) {
                Entity &entity = createEntity(owner, context);
                entity.merge(context.styles.line);
                entity.setVertexPositions(transformPositions(asArray(line, "LineString coordinates"), context));
            }
        }

        // Interior rings (holes) are not supported; only the outer ring is kept.
        void processPolygon(const json &owner, const boost::json::array &rings, DecodeContext &context) {
            Entity &entity = createEntity(owner, context);
            entity.merge(context.styles.polygon);
            if (rings.empty())
                entity.setVertexPositions({});
            else
                entity.setVertexPositions(transformPositions(asArray(rings.front(), "Polygon ring"), context));
        }

        void processMultiPolygon(const json &owner, const boost::json::array &coords, DecodeContext &context) {
            for (auto const &polygon : coords)
                processPolygon(owner, asArray(polygon, "Polygon coordinates"), context);
        }

        void processGeometryCollection(const json &owner, const boost::json::object &collection,
                                       DecodeContext &context) {
            for (auto const &geometry : requireArray(collection, "geometries"))
                processGeometry(owner, geometry, context);
        }

        void processFeature(const json &feature, DecodeContext &context) {
            auto const *obj = feature.if_object();
            if (!obj)
                throw Error(ErrorCode::MalformedDocument, "Feature must be an object");

            auto const *geometry = obj->if_contains("geometry");
            if (!geometry)
                throw Error(ErrorCode::MissingGeometry, "feature.geometry is required.");

            if (geometry->is_null()) {
                // Attribute-only feature: keep a placeholder entity without graphics.
                createEntity(feature, context);
                return;
            }
            processGeometry(feature, *geometry, context);
        }

        void processFeatureCollection(const boost::json::object &collection, DecodeContext &context) {
            for (auto const &feature : requireArray(collection, "features"))
                processFeature(feature, context);
        }
    } // namespace

    std::optional<GeoJsonType> parseGeoJsonType(std::string_view type) {
        if (type == "Feature")
            return GeoJsonType::Feature;
        if (type == "FeatureCollection")
            return GeoJsonType::FeatureCollection;
        if (type == "GeometryCollection")
            return GeoJsonType::GeometryCollection;
        if (type == "Point")
            return GeoJsonType::Point;
        if (type == "MultiPoint")
            return GeoJsonType::MultiPoint;
        if (type == "LineString")
            return GeoJsonType::LineString;
        if (type == "MultiLineString")
            return GeoJsonType::MultiLineString;
        if (type == "Polygon")
            return GeoJsonType::Polygon;
        if (type == "MultiPolygon")
            return GeoJsonType::MultiPolygon;
        return std::nullopt;
    }

    std::optional<GeoJsonType> parseGeoJsonType(const boost::json::object &object) {
        auto const *type = object.if_contains("type");
        if (!type || !type->is_string())
            return std::nullopt;
        auto const &str = type->as_string();
        return parseGeoJsonType(std::string_view(str.data(), str.size()));
    }

    bool isGeometryType(GeoJsonType type) {
        return type != GeoJsonType::Feature && type != GeoJsonType::FeatureCollection;
    }

    Coordinate parseCoordinate(const json &position) {
        auto const *arr = position.if_array();
        if (!arr)
            throw Error(ErrorCode::MalformedDocument, "Invalid position: " + boost::json::serialize(position));
        return toCoordinate(*arr);
    }

    std::string resolveEntityId(const json &node, const EntityStore &store) {
        auto id = featureId(node);
        if (!id)
            return generateId();

        std::string finalId = *id;
        for (int i = 2; store.exists(finalId); ++i)
            finalId = *id + "_" + std::to_string(i);
        return finalId;
    }

    Entity &createEntity(const json &node, DecodeContext &context) {
        Entity &entity = context.store.getOrCreate(resolveEntityId(node, context.store));
        // Aliases the document so the fragment lives as long as the entity references it.
        entity.setGeoJson(std::shared_ptr<const json>(context.document, &node));
        ++context.created;
        return entity;
    }

    void processGeometry(const json &owner, const json &geometry, DecodeContext &context) {
        auto const *obj = geometry.if_object();
        if (!obj)
            throw Error(ErrorCode::MalformedDocument, "Geometry must be an object");

        auto type = parseGeoJsonType(*obj);
        if (!type || !isGeometryType(*type))
            throw Error(ErrorCode::UnknownGeometryType, "Unknown geometry type: " + typeString(*obj));

        switch (*type) {
        case GeoJsonType::Point:
            processPoint(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::MultiPoint:
            processMultiPoint(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::LineString:
            processLineString(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::MultiLineString:
            processMultiLineString(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::Polygon:
            processPolygon(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::MultiPolygon:
            processMultiPolygon(owner, requireArray(*obj, "coordinates"), context);
            break;
        case GeoJsonType::GeometryCollection:
            processGeometryCollection(owner, *obj, context);
            break;
        case GeoJsonType::Feature:
        case GeoJsonType::FeatureCollection:
            break;
        }
    }

    void processDocument(const json &document, DecodeContext &context) {
        auto const *obj = document.if_object();
        auto type = obj ? parseGeoJsonType(*obj) : std::nullopt;
        if (!type)
            throw Error(ErrorCode::UnsupportedDocumentType,
                        "Unsupported GeoJSON object type: " + (obj ? typeString(*obj) : std::string("undefined")));

        switch (*type) {
        case GeoJsonType::Feature:
            processFeature(document, context);
            break;
        case GeoJsonType::FeatureCollection:
            processFeatureCollection(*obj, context);
            break;
        case GeoJsonType::GeometryCollection:
        case GeoJsonType::Point:
        case GeoJsonType::MultiPoint:
        case GeoJsonType::LineString:
        case GeoJsonType::MultiLineString:
        case GeoJsonType::Polygon:
        case GeoJsonType::MultiPolygon:
            processGeometry(document, document, context);
            break;
        }
    }

} // namespace geoscene
