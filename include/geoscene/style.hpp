#pragma once

#include "geoscene/types.hpp"

namespace geoscene {

    // Applied to Point and MultiPoint geometries.
    Style defaultPointStyle();

    // Applied to LineString and MultiLineString geometries.
    Style defaultLineStyle();

    // Applied to Polygon and MultiPolygon geometries: an outline plus a translucent fill.
    Style defaultPolygonStyle();

    struct DefaultStyles {
        Style point = defaultPointStyle();
        Style line = defaultLineStyle();
        Style polygon = defaultPolygonStyle();
    };

} // namespace geoscene
