#include <doctest/doctest.h>

#include "geoscene/geoscene.hpp"

namespace {
    // Passes coordinates through so positions can be checked against the input numbers.
    dp::Point identity(const geoscene::Coordinate &c) { return dp::Point{c.x, c.y, c.z.value_or(0.0)}; }

    geoscene::EntityCollection decode(const std::string &text) {
        geoscene::EntityCollection entities;
        geoscene::DefaultStyles styles;
        geoscene::CoordinateTransform transform = identity;
        auto doc = std::make_shared<const boost::json::value>(boost::json::parse(text));
        geoscene::DecodeContext context{entities, styles, transform, doc};
        geoscene::processDocument(*doc, context);
        return entities;
    }

    void checkPoint(const dp::Point &p, double x, double y, double z = 0.0) {
        CHECK(p.x == doctest::Approx(x));
        CHECK(p.y == doctest::Approx(y));
        CHECK(p.z == doctest::Approx(z));
    }
} // namespace

TEST_CASE("Parser - Type strings") {
    CHECK(geoscene::parseGeoJsonType("Feature") == geoscene::GeoJsonType::Feature);
    CHECK(geoscene::parseGeoJsonType("FeatureCollection") == geoscene::GeoJsonType::FeatureCollection);
    CHECK(geoscene::parseGeoJsonType("GeometryCollection") == geoscene::GeoJsonType::GeometryCollection);
    CHECK(geoscene::parseGeoJsonType("MultiPolygon") == geoscene::GeoJsonType::MultiPolygon);
    CHECK_FALSE(geoscene::parseGeoJsonType("point").has_value());
    CHECK_FALSE(geoscene::parseGeoJsonType("Widget").has_value());
    CHECK_FALSE(geoscene::parseGeoJsonType("").has_value());

    CHECK(geoscene::isGeometryType(geoscene::GeoJsonType::Point));
    CHECK(geoscene::isGeometryType(geoscene::GeoJsonType::GeometryCollection));
    CHECK_FALSE(geoscene::isGeometryType(geoscene::GeoJsonType::Feature));
    CHECK_FALSE(geoscene::isGeometryType(geoscene::GeoJsonType::FeatureCollection));

    auto obj = boost::json::parse(R"({"type":"LineString"})").as_object();
    CHECK(geoscene::parseGeoJsonType(obj) == geoscene::GeoJsonType::LineString);
    auto untyped = boost::json::parse(R"({"type":3})").as_object();
    CHECK_FALSE(geoscene::parseGeoJsonType(untyped).has_value());
}

TEST_CASE("Parser - Coordinates") {
    SUBCASE("Two dimensional") {
        auto c = geoscene::parseCoordinate(boost::json::parse("[-75.0, 40.0]"));
        CHECK(c.x == doctest::Approx(-75.0));
        CHECK(c.y == doctest::Approx(40.0));
        CHECK_FALSE(c.z.has_value());
    }

    SUBCASE("Height and integer members") {
        auto c = geoscene::parseCoordinate(boost::json::parse("[5, 52, 10]"));
        CHECK(c.x == doctest::Approx(5.0));
        REQUIRE(c.z.has_value());
        CHECK(*c.z == doctest::Approx(10.0));
    }

    SUBCASE("Extra members are ignored") {
        auto c = geoscene::parseCoordinate(boost::json::parse("[1, 2, 3, 4]"));
        CHECK(*c.z == doctest::Approx(3.0));
    }

    SUBCASE("Invalid positions") {
        CHECK_THROWS_AS(geoscene::parseCoordinate(boost::json::parse("[1]")), geoscene::Error);
        CHECK_THROWS_AS(geoscene::parseCoordinate(boost::json::parse(R"(["a", 2])")), geoscene::Error);
        CHECK_THROWS_AS(geoscene::parseCoordinate(boost::json::parse("3")), geoscene::Error);
        CHECK_THROWS_AS(geoscene::parseCoordinate(boost::json::parse(R"([1, 2, "high"])")), geoscene::Error);
        CHECK_THROWS_AS(geoscene::parseCoordinate(boost::json::parse("[1, 2, null]")), geoscene::Error);
    }
}

TEST_CASE("Parser - Different geometry types") {
    SUBCASE("Point") {
        auto entities = decode(R"({"type":"Point","coordinates":[-75.0,40.0]})");
        REQUIRE(entities.size() == 1);
        auto const &e = entities.at(0);
        REQUIRE(e.position().has_value());
        checkPoint(*e.position(), -75.0, 40.0);
        CHECK_FALSE(e.vertexPositions().has_value());
        CHECK(e.style().point.has_value());
        CHECK_FALSE(e.style().polyline.has_value());
    }

    SUBCASE("MultiPoint") {
        auto entities = decode(R"({"type":"MultiPoint","coordinates":[[1,2],[3,4,5],[6,7]]})");
        REQUIRE(entities.size() == 3);
        checkPoint(*entities.at(0).position(), 1, 2);
        checkPoint(*entities.at(1).position(), 3, 4, 5);
        checkPoint(*entities.at(2).position(), 6, 7);
        for (auto const &e : entities)
            CHECK(e->style().point.has_value());
    }

    SUBCASE("LineString") {
        auto entities = decode(R"({"type":"LineString","coordinates":[[1,2],[3,4],[5,6]]})");
        REQUIRE(entities.size() == 1);
        auto const &e = entities.at(0);
        REQUIRE(e.vertexPositions().has_value());
        REQUIRE(e.vertexPositions()->size() == 3);
        checkPoint((*e.vertexPositions())[2], 5, 6);
        CHECK_FALSE(e.position().has_value());
        CHECK(*e.style().polyline->width == doctest::Approx(2.0));
    }

    SUBCASE("MultiLineString") {
        auto entities = decode(R"({"type":"MultiLineString","coordinates":[[[1,2],[3,4]],[[5,6],[7,8],[9,10]]]})");
        REQUIRE(entities.size() == 2);
        CHECK(entities.at(0).vertexPositions()->size() == 2);
        CHECK(entities.at(1).vertexPositions()->size() == 3);
        checkPoint((*entities.at(1).vertexPositions())[0], 5, 6);
    }

    SUBCASE("Polygon keeps only the outer ring") {
        auto entities = decode(R"({"type":"Polygon","coordinates":[
            [[0,0],[10,0],[10,10],[0,10],[0,0]],
            [[2,2],[3,2],[3,3],[2,2]]
        ]})");
        REQUIRE(entities.size() == 1);
        auto const &e = entities.at(0);
        REQUIRE(e.vertexPositions()->size() == 5);
        checkPoint((*e.vertexPositions())[1], 10, 0);
        CHECK(e.style().polygon.has_value());
        CHECK(*e.style().polyline->width == doctest::Approx(1.0));
    }

    SUBCASE("MultiPolygon yields one entity per polygon") {
        auto entities = decode(R"({"type":"MultiPolygon","coordinates":[
            [[[0,0],[1,0],[1,1],[0,0]], [[0.2,0.2],[0.3,0.2],[0.3,0.3],[0.2,0.2]]],
            [[[5,5],[6,5],[6,6],[5,6],[5,5]]]
        ]})");
        REQUIRE(entities.size() == 2);
        CHECK(entities.at(0).vertexPositions()->size() == 4);
        CHECK(entities.at(1).vertexPositions()->size() == 5);
        checkPoint((*entities.at(1).vertexPositions())[0], 5, 5);
        CHECK(entities.getPolygons().size() == 2);
    }

    SUBCASE("GeometryCollection at the root") {
        auto entities = decode(R"({"type":"GeometryCollection","geometries":[
            {"type":"Point","coordinates":[1,2]},
            {"type":"LineString","coordinates":[[1,2],[3,4]]},
            {"type":"GeometryCollection","geometries":[{"type":"MultiPoint","coordinates":[[7,8],[9,10]]}]}
        ]})");
        REQUIRE(entities.size() == 4);
        CHECK(entities.at(0).style().point.has_value());
        CHECK(entities.at(1).style().polyline.has_value());
        checkPoint(*entities.at(3).position(), 9, 10);
    }
}

TEST_CASE("Parser - Order and duplicates are preserved") {
    auto entities = decode(R"({"type":"LineString","coordinates":[[3,3],[1,1],[1,1],[2,2]]})");
    auto const &positions = *entities.at(0).vertexPositions();
    REQUIRE(positions.size() == 4);
    checkPoint(positions[0], 3, 3);
    checkPoint(positions[1], 1, 1);
    checkPoint(positions[2], 1, 1);
    checkPoint(positions[3], 2, 2);
}

TEST_CASE("Parser - Empty coordinate arrays") {
    SUBCASE("Single geometries still produce an entity") {
        auto line = decode(R"({"type":"LineString","coordinates":[]})");
        REQUIRE(line.size() == 1);
        CHECK(line.at(0).vertexPositions()->empty());

        auto polygon = decode(R"({"type":"Polygon","coordinates":[]})");
        REQUIRE(polygon.size() == 1);
        CHECK(polygon.at(0).vertexPositions()->empty());

        auto point = decode(R"({"type":"Point","coordinates":[]})");
        REQUIRE(point.size() == 1);
        CHECK_FALSE(point.at(0).position().has_value());
        CHECK(point.at(0).style().point.has_value());
    }

    SUBCASE("Per-element geometries produce nothing") {
        CHECK(decode(R"({"type":"MultiPoint","coordinates":[]})").empty());
        CHECK(decode(R"({"type":"MultiLineString","coordinates":[]})").empty());
        CHECK(decode(R"({"type":"MultiPolygon","coordinates":[]})").empty());
        CHECK(decode(R"({"type":"GeometryCollection","geometries":[]})").empty());
    }

    SUBCASE("Empty sub-lists still produce an entity") {
        auto entities = decode(R"({"type":"MultiLineString","coordinates":[[],[[1,2]]]})");
        REQUIRE(entities.size() == 2);
        CHECK(entities.at(0).vertexPositions()->empty());
        CHECK(entities.at(1).vertexPositions()->size() == 1);
    }
}

TEST_CASE("Parser - Features") {
    SUBCASE("Feature id names the entity") {
        auto entities = decode(R"({"type":"Feature","id":"road-1","properties":{},
            "geometry":{"type":"LineString","coordinates":[[1,2],[3,4]]}})");
        REQUIRE(entities.size() == 1);
        CHECK(entities.at(0).id() == "road-1");
    }

    SUBCASE("Multi geometries of one feature get suffixed ids") {
        auto entities = decode(R"({"type":"Feature","id":"trees",
            "geometry":{"type":"MultiPoint","coordinates":[[1,2],[3,4],[5,6]]}})");
        REQUIRE(entities.size() == 3);
        CHECK(entities.at(0).id() == "trees");
        CHECK(entities.at(1).id() == "trees_2");
        CHECK(entities.at(2).id() == "trees_3");
    }

    SUBCASE("GeometryCollection inside a feature uses the feature id") {
        auto entities = decode(R"({"type":"Feature","id":"site","geometry":{"type":"GeometryCollection","geometries":[
            {"type":"Point","coordinates":[1,2]},
            {"type":"Polygon","coordinates":[[[0,0],[1,0],[1,1],[0,0]]]}
        ]}})");
        REQUIRE(entities.size() == 2);
        CHECK(entities.at(0).id() == "site");
        CHECK(entities.at(1).id() == "site_2");
    }

    SUBCASE("Entities point back at the feature") {
        auto entities = decode(R"({"type":"Feature","id":"f","properties":{"name":"n"},
            "geometry":{"type":"Point","coordinates":[1,2]}})");
        auto const *geoJson = entities.at(0).geoJson();
        REQUIRE(geoJson != nullptr);
        CHECK(geoJson->as_object().at("id").as_string() == "f");
        CHECK(entities.at(0).property("name") == std::optional<std::string>("n"));
    }

    SUBCASE("Null geometry") {
        auto entities = decode(R"({"type":"Feature","id":"attrs","properties":{"a":1},"geometry":null})");
        REQUIRE(entities.size() == 1);
        auto const &e = entities.at(0);
        CHECK(e.id() == "attrs");
        CHECK(e.style().empty());
        CHECK_FALSE(e.position().has_value());
        CHECK_FALSE(e.vertexPositions().has_value());
        CHECK(e.geoJson() != nullptr);
    }

    SUBCASE("FeatureCollection in order with id collisions") {
        auto entities = decode(R"({"type":"FeatureCollection","features":[
            {"type":"Feature","id":"abc","geometry":{"type":"Point","coordinates":[1,2]}},
            {"type":"Feature","geometry":{"type":"MultiPoint","coordinates":[[1,2],[3,4]]}},
            {"type":"Feature","id":"abc","geometry":{"type":"Point","coordinates":[5,6]}},
            {"type":"Feature","geometry":null}
        ]})");
        REQUIRE(entities.size() == 5);
        CHECK(entities.at(0).id() == "abc");
        CHECK(entities.at(3).id() == "abc_2");
        checkPoint(*entities.at(3).position(), 5, 6);
        CHECK(entities.at(4).style().empty());
    }
}
