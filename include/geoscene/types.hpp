#pragma once

#include <datapod/datapod.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace dp = ::datapod;

namespace geoscene {

    // A raw GeoJSON position. For geographic CRSs x is longitude and y latitude (degrees),
    // z the height in metres when the position carries one.
    struct Coordinate {
        double x = 0.0;
        double y = 0.0;
        std::optional<double> z;
    };

    // Maps a GeoJSON position to a Cartesian position. All built-in transforms produce metres.
    using CoordinateTransform = std::function<dp::Point(const Coordinate &)>;

    struct Color {
        float red = 1.0f;
        float green = 1.0f;
        float blue = 1.0f;
        float alpha = 1.0f;

        static Color fromBytes(std::uint8_t red, std::uint8_t green, std::uint8_t blue, std::uint8_t alpha = 255);

        bool operator==(const Color &other) const;
        bool operator!=(const Color &other) const { return !(*this == other); }
    };

    namespace colors {
        inline constexpr Color Yellow{1.0f, 1.0f, 0.0f, 1.0f};
        inline constexpr Color Black{0.0f, 0.0f, 0.0f, 1.0f};
    } // namespace colors

    struct PointGraphics {
        std::optional<Color> color;
        std::optional<double> pixelSize;
        std::optional<Color> outlineColor;
        std::optional<double> outlineWidth;

        void merge(const PointGraphics &source);
    };

    struct PolylineGraphics {
        std::optional<Color> color;
        std::optional<double> width;
        std::optional<Color> outlineColor;
        std::optional<double> outlineWidth;

        void merge(const PolylineGraphics &source);
    };

    struct Material {
        std::optional<Color> solidColor;

        void merge(const Material &source);
    };

    struct PolygonGraphics {
        std::optional<Material> material;

        void merge(const PolygonGraphics &source);
    };

    // Graphics bundle carried by an entity. Merging only fills what the target does not have yet.
    struct Style {
        std::optional<PointGraphics> point;
        std::optional<PolylineGraphics> polyline;
        std::optional<PolygonGraphics> polygon;

        void merge(const Style &source);

        bool empty() const { return !point && !polyline && !polygon; }
    };

} // namespace geoscene
