#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/request.hpp"

using namespace iotrans;

namespace {
const std::set<int> ALLOWED = {4326, 2952};
}

TEST_CASE("Request - spatial shape") {
    const auto& tables = ConversionTables::defaults();

    SUBCASE("Arrays of integers") {
        nlohmann::json params = {
            {"resource_id", "abc"},
            {"source_epsg", 4326},
            {"target_epsgs", {4326, 2952}},
            {"target_formats", {"geojson", "shp"}},
        };
        ConversionRequest request = parseConversionRequest(params, tables, ALLOWED);
        REQUIRE(isSpatialRequest(request));

        const auto& spatial = std::get<SpatialRequest>(request);
        CHECK(spatial.resource_id == "abc");
        CHECK(spatial.source_epsg == 4326);
        CHECK(spatial.target_epsgs == std::vector<int>{4326, 2952});
        CHECK(spatial.target_formats == std::vector<std::string>{"geojson", "shp"});
    }

    SUBCASE("JSON-encoded lists and string EPSG codes") {
        nlohmann::json params = {
            {"resource_id", "abc"},
            {"source_epsg", "4326"},
            {"target_epsgs", "[\"2952\", 4326]"},
            {"target_formats", "[\"GPKG\", \"csv\"]"},
        };
        ConversionRequest request = parseConversionRequest(params, tables, ALLOWED);
        REQUIRE(isSpatialRequest(request));

        const auto& spatial = std::get<SpatialRequest>(request);
        CHECK(spatial.target_epsgs == std::vector<int>{2952, 4326});
        CHECK(spatial.target_formats == std::vector<std::string>{"gpkg", "csv"});
    }

    SUBCASE("A single target EPSG becomes a list") {
        nlohmann::json params = {
            {"resource_id", "abc"},
            {"source_epsg", 2952},
            {"target_epsgs", 4326},
            {"target_formats", {"geojson"}},
        };
        ConversionRequest request = parseConversionRequest(params, tables, ALLOWED);
        REQUIRE(isSpatialRequest(request));
        CHECK(std::get<SpatialRequest>(request).target_epsgs == std::vector<int>{4326});
    }
}

TEST_CASE("Request - non-spatial fallback") {
    const auto& tables = ConversionTables::defaults();

    nlohmann::json params = {
        {"resource_id", "abc"},
        {"target_formats", {"CSV", "json", "csv", "xml"}},
    };
    ConversionRequest request = parseConversionRequest(params, tables, ALLOWED);
    REQUIRE_FALSE(isSpatialRequest(request));

    const auto& non_spatial = std::get<NonSpatialRequest>(request);
    CHECK(non_spatial.resource_id == "abc");
    CHECK(non_spatial.target_formats == std::vector<std::string>{"csv", "json", "xml"});
    CHECK(requestResourceId(request) == "abc");
}

TEST_CASE("Request - rejected with both reasons") {
    const auto& tables = ConversionTables::defaults();

    SUBCASE("Disallowed EPSG and spatial-only format") {
        nlohmann::json params = {
            {"resource_id", "abc"},
            {"source_epsg", 3857},
            {"target_epsgs", {4326}},
            {"target_formats", {"geojson"}},
        };
        try {
            parseConversionRequest(params, tables, ALLOWED);
            FAIL("expected a ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.getConstraints().size() == 2);
            CHECK(e.getConstraints()[0].find("Could not parse spatial-type params") == 0);
            CHECK(e.getConstraints()[0].find("3857") != std::string::npos);
            CHECK(e.getConstraints()[1].find("Could not parse non-spatial-type params") == 0);
            CHECK(e.getConstraints()[1].find("geojson") != std::string::npos);
        }
    }

    SUBCASE("Missing resource id") {
        nlohmann::json params = {{"target_formats", {"csv"}}};
        CHECK_THROWS_AS(parseConversionRequest(params, tables, ALLOWED), ValidationError);
    }

    SUBCASE("Unknown format") {
        nlohmann::json params = {{"resource_id", "abc"}, {"target_formats", {"kml"}}};
        CHECK_THROWS_AS(parseConversionRequest(params, tables, ALLOWED), ValidationError);
    }

    SUBCASE("Empty format list") {
        nlohmann::json params = {{"resource_id", "abc"}, {"target_formats", nlohmann::json::array()}};
        CHECK_THROWS_AS(parseConversionRequest(params, tables, ALLOWED), ValidationError);
    }

    SUBCASE("Malformed EPSG list") {
        nlohmann::json params = {
            {"resource_id", "abc"},
            {"source_epsg", 4326},
            {"target_epsgs", "not a list"},
            {"target_formats", {"shp"}},
        };
        CHECK_THROWS_AS(parseConversionRequest(params, tables, ALLOWED), ValidationError);
    }
}

TEST_CASE("Request - serialized form parses back to the same request") {
    const auto& tables = ConversionTables::defaults();
    nlohmann::json params = {
        {"resource_id", "abc"},
        {"source_epsg", 4326},
        {"target_epsgs", {2952}},
        {"target_formats", {"csv"}},
    };
    ConversionRequest request = parseConversionRequest(params, tables, ALLOWED);
    CHECK(requestToJson(request) == params);
}

TEST_CASE("Config - engine configuration") {
    SUBCASE("Defaults") {
        EngineConfig config = parseEngineConfig(nlohmann::json::object());
        CHECK(config.page_size == 20000);
        CHECK(config.xml_chunk_size == 5000);
        CHECK(config.allowed_epsgs == std::set<int>{4326, 2952});
        CHECK_FALSE(config.continue_on_handler_error);
        CHECK_FALSE(config.keep_cache);
        CHECK_FALSE(config.storage_path.empty());
    }

    SUBCASE("Overrides") {
        nlohmann::json json = {
            {"storage_path", "/data/iotrans"},
            {"page_size", 500},
            {"allowed_epsgs", {4326}},
            {"continue_on_handler_error", true},
        };
        EngineConfig config = parseEngineConfig(json);
        CHECK(config.storage_path == "/data/iotrans");
        CHECK(config.page_size == 500);
        CHECK(config.allowed_epsgs == std::set<int>{4326});
        CHECK(config.continue_on_handler_error);
    }

    SUBCASE("Invalid values") {
        CHECK_THROWS_AS(parseEngineConfig(nlohmann::json{{"page_size", 0}}), ValidationError);
        CHECK_THROWS_AS(parseEngineConfig(nlohmann::json{{"verbose", "yes"}}), ValidationError);
        CHECK_THROWS_AS(parseEngineConfig(nlohmann::json::array()), ValidationError);
    }
}

TEST_CASE("Config - conversion tables") {
    const auto& tables = ConversionTables::defaults();

    CHECK(tables.fieldTypeFor("text") == SpatialFieldType::STRING);
    CHECK(tables.fieldTypeFor("timestamp") == SpatialFieldType::STRING);
    CHECK(tables.fieldTypeFor("float4") == SpatialFieldType::REAL);
    CHECK(tables.fieldTypeFor("numeric") == SpatialFieldType::REAL);
    CHECK(tables.fieldTypeFor("int8") == SpatialFieldType::INTEGER64);
    CHECK_FALSE(tables.fieldTypeFor("bool").has_value());

    CHECK(tables.multiGeometryType("Point") == std::string("MultiPoint"));
    CHECK(tables.multiGeometryType("3D Polygon") == std::string("3D MultiPolygon"));
    CHECK(tables.multiGeometryType("MultiLineString") == std::string("MultiLineString"));
    CHECK(tables.multiGeometryType("GeometryCollection") == std::string("GeometryCollection"));
    CHECK_FALSE(tables.multiGeometryType("Circle").has_value());

    CHECK(tables.driverFor("shp") == std::string("ESRI Shapefile"));
    CHECK(tables.driverFor("gpkg") == std::string("GPKG"));
    CHECK_FALSE(tables.driverFor("csv").has_value());
}
