#pragma once

#include "geoscene/entity.hpp"
#include "geoscene/style.hpp"
#include "geoscene/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace geoscene {

    enum class GeoJsonType {
        Feature,
        FeatureCollection,
        GeometryCollection,
        Point,
        MultiPoint,
        LineString,
        MultiLineString,
        Polygon,
        MultiPolygon
    };

    // Case-sensitive; returns nothing for strings GeoJSON does not define.
    std::optional<GeoJsonType> parseGeoJsonType(std::string_view type);

    // Reads the "type" member of a GeoJSON object, if it is a known type string.
    std::optional<GeoJsonType> parseGeoJsonType(const boost::json::object &object);

    bool isGeometryType(GeoJsonType type);

    // Everything a single load threads through the recursive dispatch.
    struct DecodeContext {
        EntityStore &store;
        const DefaultStyles &styles;
        const CoordinateTransform &transform;
        // Keeps the loaded document alive for the back-references held by entities.
        std::shared_ptr<const boost::json::value> document;
        size_t created = 0;
    };

    Coordinate parseCoordinate(const boost::json::value &position);

    // Feature ids are used as is and suffixed with _2, _3, ... on collision; anything else gets a UUID.
    std::string resolveEntityId(const boost::json::value &node, const EntityStore &store);

    Entity &createEntity(const boost::json::value &node, DecodeContext &context);

    // Dispatches on the document's own type: feature containers, or a bare geometry at the root.
    void processDocument(const boost::json::value &document, DecodeContext &context);

    // Decodes one geometry. Entity ids come from owner, which is either the geometry itself or its Feature.
    void processGeometry(const boost::json::value &owner, const boost::json::value &geometry, DecodeContext &context);

} // namespace geoscene
