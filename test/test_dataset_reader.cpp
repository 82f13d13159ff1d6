#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/errors.hpp"
#include "io/dataset_reader.hpp"
#include "io/record_source.hpp"
#include "test_utils.hpp"

using namespace iotrans;

TEST_CASE("DatasetReader - table documents") {
    SUBCASE("Declared fields") {
        io::MemoryDataset dataset = io::DatasetReader::readFromString(R"({
            "name": "permits",
            "fields": [{"id": "_id", "type": "int"}, {"id": "ward", "type": "text"}],
            "records": [{"_id": 1, "ward": "A"}, {"_id": 2, "ward": "B"}]
        })", "fallback");

        CHECK(dataset.resource.name == "permits");
        CHECK(dataset.resource.datastore_active);
        REQUIRE(dataset.fields.size() == 2);
        CHECK(dataset.fields[0].id == "_id");
        CHECK(dataset.fields[1].type == "text");
        CHECK(dataset.records.size() == 2);
    }

    SUBCASE("Inferred fields keep first-seen order") {
        io::MemoryDataset dataset = io::DatasetReader::readFromString(R"({
            "datastore_active": false,
            "records": [{"b": 1, "a": 1.5}, {"b": 2, "a": 2, "c": "x"}]
        })", "fallback");

        CHECK(dataset.resource.name == "fallback");
        CHECK_FALSE(dataset.resource.datastore_active);
        REQUIRE(dataset.fields.size() == 3);
        CHECK(dataset.fields[0].id == "b");
        CHECK(dataset.fields[0].type == "int");
        CHECK(dataset.fields[1].id == "a");
        CHECK(dataset.fields[1].type == "float");
        CHECK(dataset.fields[2].id == "c");
        CHECK(dataset.fields[2].type == "text");
    }

    SUBCASE("Invalid documents") {
        CHECK_THROWS_AS(io::DatasetReader::readFromString("{ invalid json content }", "x"), ValidationError);
        CHECK_THROWS_AS(io::DatasetReader::readFromString("[1, 2]", "x"), ValidationError);
        CHECK_THROWS_AS(io::DatasetReader::readFromString(R"({"records": [1]})", "x"), ValidationError);
        CHECK_FALSE(io::DatasetReader::getLastError().empty());
    }
}

TEST_CASE("DatasetReader - GeoJSON FeatureCollection") {
    iotrans_test::TempDir dir("iotrans-reader");
    const auto file = dir.path() / "wards.geojson";
    {
        std::ofstream ofs(file.string());
        ofs << R"({
            "type": "FeatureCollection",
            "features": [
                {"type": "Feature", "properties": {"name": "A", "area": 10},
                 "geometry": {"type": "Point", "coordinates": [-79.4, 43.7]}},
                {"type": "Feature", "properties": {"name": "B"}, "geometry": null}
            ]
        })";
    }

    io::MemoryDataset dataset = io::DatasetReader::readFromFile(file.string());
    CHECK(dataset.resource.name == "wards");
    REQUIRE(dataset.fields.size() == 3);
    CHECK(dataset.fields[0].id == "name");
    CHECK(dataset.fields[1].id == "area");
    CHECK(dataset.fields[1].type == "int");
    CHECK(dataset.fields[2].id == GEOMETRY_FIELD);

    REQUIRE(dataset.records.size() == 2);
    CHECK(dataset.records[0][GEOMETRY_FIELD]["type"] == "Point");
    CHECK(dataset.records[1]["area"].is_null());
    CHECK(dataset.records[1][GEOMETRY_FIELD].is_null());

    CHECK_THROWS_AS(io::DatasetReader::readFromFile((dir.path() / "missing.json").string()), ValidationError);
}

TEST_CASE("MemoryRecordSource - paging") {
    io::MemoryDataset dataset;
    dataset.resource.name = "numbers";
    dataset.resource.datastore_active = true;
    dataset.fields.emplace_back("n", "int");
    for (int i = 0; i < 5; ++i) {
        dataset.records.push_back(Json{{"n", i}});
    }

    io::MemoryRecordSource source;
    source.addDataset("numbers", dataset);

    SUBCASE("Pages are concatenated in order") {
        io::PagedRecordStream stream(source, "numbers", 2);
        std::vector<int> seen;
        Record record;
        while (stream.next(record)) {
            seen.push_back(record["n"].get<int>());
        }
        CHECK(seen == std::vector<int>{0, 1, 2, 3, 4});
        // 2 + 2 + 1, then the empty page that ends the stream
        CHECK(stream.getPageCount() == 4);
        CHECK(source.getFetchCount() == 4);
    }

    SUBCASE("Offsets past the end give empty pages") {
        CHECK(source.fetchPage("numbers", 10, 5).empty());
        CHECK(source.fetchPage("numbers", 10, 3).size() == 2);
    }

    SUBCASE("Unknown resource") {
        CHECK_THROWS_AS(source.getResource("other"), ValidationError);
    }
}
