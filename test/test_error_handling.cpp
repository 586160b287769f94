#include <doctest/doctest.h>

#include "helpers.hpp"
#include "zonekit/zonekit.hpp"
#include <filesystem>
#include <fstream>

using namespace testutil;

namespace {
    void write_file(const std::filesystem::path &path, const std::string &content) {
        std::ofstream ofs(path);
        ofs << content;
        ofs.close();
    }
} // namespace

TEST_CASE("Error Handling - Invalid JSON") {
    const auto test_file = std::filesystem::temp_directory_path() / "zonekit_invalid.geojson";

    SUBCASE("Malformed JSON") {
        write_file(test_file, "{ invalid json content }");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file),
                          "zonekit::ReadFeatureCollection(): failed to parse JSON");
    }

    SUBCASE("Missing type field") {
        write_file(test_file, R"({"features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file),
                          "zonekit::ReadFeatureCollection(): top-level object has no string 'type' field");
    }

    SUBCASE("Non-string type field") {
        write_file(test_file, R"({"type": 123, "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file),
                          "zonekit::ReadFeatureCollection(): top-level object has no string 'type' field");
    }

    std::filesystem::remove(test_file);
}

TEST_CASE("Error Handling - Missing header properties") {
    const auto test_file = std::filesystem::temp_directory_path() / "zonekit_missing_props.geojson";

    SUBCASE("Missing properties object") {
        write_file(test_file, R"({"type": "FeatureCollection", "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "missing top-level 'properties'");
    }

    SUBCASE("Missing CRS") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"datum": [5.0, 52.0, 0.0], "heading": 0.0}, "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "'properties' missing string 'crs'");
    }

    SUBCASE("Datum with too few elements") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"crs": "ENU", "datum": [5.0, 52.0], "heading": 0.0}, "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file),
                          "'properties' missing array 'datum' of ≥3 numbers");
    }

    SUBCASE("Non-numeric heading") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"crs": "ENU", "datum": [5.0, 52.0, 0.0], "heading": "north"}, "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "'properties' missing numeric 'heading'");
    }

    SUBCASE("Unknown CRS string") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"crs": "UNKNOWN:12345", "datum": [5.0, 52.0, 0.0], "heading": 0.0}, "features": []})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "Unknown CRS string: UNKNOWN:12345");
    }

    std::filesystem::remove(test_file);
}

TEST_CASE("Error Handling - Invalid geometry in files") {
    const auto test_file = std::filesystem::temp_directory_path() / "zonekit_bad_geometry.geojson";

    SUBCASE("Point with too few coordinates") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"crs": "ENU", "datum": [5.0, 52.0, 0.0], "heading": 0.0},
            "features": [{"type": "Feature", "geometry": {"type": "Point", "coordinates": [1.0]}, "properties": {}}]})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "Invalid point coordinates");
    }

    SUBCASE("Unsupported geometry type") {
        write_file(test_file, R"({"type": "FeatureCollection",
            "properties": {"crs": "ENU", "datum": [5.0, 52.0, 0.0], "heading": 0.0},
            "features": [{"type": "Feature", "geometry": {"type": "Circle", "coordinates": [1.0, 2.0]}, "properties": {}}]})");
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection(test_file), "Unsupported geometry type: Circle");
    }

    std::filesystem::remove(test_file);
}

TEST_CASE("Error Handling - File I/O errors") {
    SUBCASE("Nonexistent input") {
        CHECK_THROWS_WITH(zonekit::ReadFeatureCollection("/nonexistent/path/file.geojson"),
                          "zonekit::ReadFeatureCollection(): cannot open \"/nonexistent/path/file.geojson\"");
    }

    SUBCASE("Output in a missing directory") {
        zonekit::GeoJsonTableSink sink("/nonexistent/directory/table.geojson", dp::Geo{52.0, 5.0, 0.0},
                                       dp::Euler{0.0, 0.0, 0.0});
        sink.open({"PERCENTAGE"});
        CHECK_THROWS_WITH(sink.commit(), "Cannot open for write: /nonexistent/directory/table.geojson");
    }
}

TEST_CASE("Error Handling - Geometry compatibility") {
    using zonekit::GeometryKind;
    const GeometryKind kinds[] = {GeometryKind::Point, GeometryKind::Line, GeometryKind::Polygon};

    for (auto zone : kinds) {
        for (auto cls : kinds) {
            CAPTURE(static_cast<int>(zone));
            CAPTURE(static_cast<int>(cls));
            if (static_cast<int>(cls) > static_cast<int>(zone)) {
                CHECK_THROWS_AS(zonekit::ZonalAggregator::validateGeometryCompatibility(zone, cls),
                                zonekit::IncompatibleGeometryError);
            } else {
                CHECK_NOTHROW(zonekit::ZonalAggregator::validateGeometryCompatibility(zone, cls));
            }
        }
    }

    CHECK_THROWS_WITH(
        zonekit::ZonalAggregator::validateGeometryCompatibility(GeometryKind::Point, GeometryKind::Polygon),
        "Class features cannot be polygons or lines when zone features are points");
    CHECK_THROWS_WITH(
        zonekit::ZonalAggregator::validateGeometryCompatibility(GeometryKind::Line, GeometryKind::Polygon),
        "Class features cannot be polygons when zone features are lines");
    CHECK_THROWS_AS(
        zonekit::ZonalAggregator::validateGeometryCompatibility(GeometryKind::Polygon, GeometryKind::Unknown),
        zonekit::IncompatibleGeometryError);
}

TEST_CASE("Error Handling - Fatal errors leave the sink untouched") {
    zonekit::GeometryEngine engine;
    zonekit::ZonalAggregator aggregator(engine);
    RecordingFeedback feedback;
    zonekit::MemorySink sink;

    SUBCASE("Point zones with polygon classes") {
        auto zones = collection({feature(1, dp::Point{1.0, 1.0, 0.0}, {{"name", std::string("z")}})});
        auto classes = collection({feature(1, rect(0, 0, 10, 10))});

        zonekit::SummarizeConfig config;
        config.zones = &zones;
        config.zone_fields = {"name"};
        config.classes = &classes;

        CHECK_THROWS_AS(aggregator.summarize(config, sink, feedback), zonekit::IncompatibleGeometryError);
        CHECK_FALSE(sink.isOpen());
        CHECK(feedback.progress.empty());
    }

    SUBCASE("Mixed geometry types in one layer") {
        auto zones = collection({feature(1, rect(0, 0, 10, 10)), feature(2, dp::Point{1.0, 1.0, 0.0})});
        auto classes = collection({feature(1, rect(0, 0, 10, 10))});

        zonekit::SummarizeConfig config;
        config.zones = &zones;
        config.classes = &classes;

        CHECK_THROWS_AS(aggregator.summarize(config, sink, feedback), zonekit::IncompatibleGeometryError);
        CHECK_FALSE(sink.isOpen());
    }

    SUBCASE("Selected field missing from the layer") {
        auto zones = collection({feature(1, rect(0, 0, 10, 10), {{"name", std::string("z")}})});
        auto classes = collection({feature(1, rect(0, 0, 5, 5), {{"pop", 10.0}})});

        zonekit::SummarizeConfig config;
        config.zones = &zones;
        config.zone_fields = {"name"};
        config.classes = &classes;
        config.sum_fields = {"households"};

        CHECK_THROWS_WITH_AS(aggregator.summarize(config, sink, feedback),
                             "Class layer has no field 'households'", zonekit::MissingFieldError);
        CHECK_FALSE(sink.isOpen());
    }

    SUBCASE("Grouping field missing on one feature") {
        auto zones = collection({feature(1, rect(0, 0, 10, 10), {{"name", std::string("z")}}),
                                 feature(2, rect(10, 0, 20, 10))});
        auto classes = collection({feature(1, rect(0, 0, 5, 5))});

        zonekit::SummarizeConfig config;
        config.zones = &zones;
        config.zone_fields = {"name"};
        config.classes = &classes;

        CHECK_THROWS_WITH_AS(aggregator.summarize(config, sink, feedback), "Feature 2 has no field 'name'",
                             zonekit::MissingFieldError);
        CHECK_FALSE(sink.isOpen());
    }

    SUBCASE("Missing layers") {
        zonekit::SummarizeConfig config;
        CHECK_THROWS_AS(aggregator.summarize(config, sink, feedback), std::invalid_argument);
    }
}
