#include "geoscene/style.hpp"

namespace geoscene {

    namespace {
        template <typename T> void mergeField(std::optional<T> &target, const std::optional<T> &source) {
            if (!target && source)
                target = source;
        }

        template <typename T> void mergeGraphics(std::optional<T> &target, const std::optional<T> &source) {
            if (!source)
                return;
            if (!target)
                target = *source;
            else
                target->merge(*source);
        }
    } // namespace

    Color Color::fromBytes(std::uint8_t red, std::uint8_t green, std::uint8_t blue, std::uint8_t alpha) {
        return Color{red / 255.0f, green / 255.0f, blue / 255.0f, alpha / 255.0f};
    }

    bool Color::operator==(const Color &other) const {
        return red == other.red && green == other.green && blue == other.blue && alpha == other.alpha;
    }

    void PointGraphics::merge(const PointGraphics &source) {
        mergeField(color, source.color);
        mergeField(pixelSize, source.pixelSize);
        mergeField(outlineColor, source.outlineColor);
        mergeField(outlineWidth, source.outlineWidth);
    }

    void PolylineGraphics::merge(const PolylineGraphics &source) {
        mergeField(color, source.color);
        mergeField(width, source.width);
        mergeField(outlineColor, source.outlineColor);
        mergeField(outlineWidth, source.outlineWidth);
    }

    void Material::merge(const Material &source) { mergeField(solidColor, source.solidColor); }

    void PolygonGraphics::merge(const PolygonGraphics &source) { mergeGraphics(material, source.material); }

    void Style::merge(const Style &source) {
        mergeGraphics(point, source.point);
        mergeGraphics(polyline, source.polyline);
        mergeGraphics(polygon, source.polygon);
    }

    Style defaultPointStyle() {
        PointGraphics point;
        point.color = colors::Yellow;
        point.pixelSize = 10.0;
        point.outlineColor = colors::Black;
        point.outlineWidth = 1.0;

        Style style;
        style.point = point;
        return style;
    }

    Style defaultLineStyle() {
        PolylineGraphics polyline;
        polyline.color = colors::Yellow;
        polyline.width = 2.0;
        polyline.outlineColor = colors::Black;
        polyline.outlineWidth = 1.0;

        Style style;
        style.polyline = polyline;
        return style;
    }

    Style defaultPolygonStyle() {
        PolylineGraphics outline;
        outline.color = colors::Yellow;
        outline.width = 1.0;
        outline.outlineColor = colors::Black;
        outline.outlineWidth = 0.0;

        Material fill;
        fill.solidColor = Color::fromBytes(255, 255, 0, 25);
        PolygonGraphics polygon;
        polygon.material = fill;

        Style style;
        style.polyline = outline;
        style.polygon = polygon;
        return style;
    }

} // namespace geoscene
