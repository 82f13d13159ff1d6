#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <set>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include "io/gdal_utils.hpp"
#include "io/shapefile_writer.hpp"
#include "io/zip_archive.hpp"
#include "test_utils.hpp"

using namespace iotrans;

namespace {

std::vector<std::string> listZip(const std::string& zip_path) {
    std::vector<std::string> entries;
    char** names = VSIReadDir(("/vsizip/" + zip_path).c_str());
    for (int i = 0; names != nullptr && names[i] != nullptr; ++i) {
        entries.emplace_back(names[i]);
    }
    CSLDestroy(names);
    return entries;
}

bool contains(const std::vector<std::string>& entries, const std::string& name) {
    return std::find(entries.begin(), entries.end(), name) != entries.end();
}

io::ShapefileWriterConfig pointConfig(const std::string& output_path) {
    io::ShapefileWriterConfig config;
    config.output_file_path = output_path;
    config.dataset_name = "Bike Stations";
    config.target_epsg = 4326;
    config.geometry_type = "MultiPoint";
    config.fields = {
        io::OgrFieldSpec("id", "id", SpatialFieldType::INTEGER64),
        io::OgrFieldSpec("station_name_full", "station_name_full", SpatialFieldType::STRING),
    };
    return config;
}

std::vector<Record> pointRecords() {
    return {
        Json{{"id", 1}, {"station_name_full", "Union"},
             {"geometry", Json{{"type", "MultiPoint"}, {"coordinates", Json::array({Json::array({-79.38, 43.64})})}}}},
        Json{{"id", 2}, {"station_name_full", nullptr}, {"geometry", nullptr}},
    };
}

} // namespace

TEST_CASE("ShapefileWriter - column map") {
    SUBCASE("Short names are kept") {
        CHECK(io::ShapefileWriter::buildColumnMap({"id", "name", "ten_chars_"}).empty());
    }

    SUBCASE("One long name renames every column") {
        auto column_map = io::ShapefileWriter::buildColumnMap({"id", "station_name_full", "the year"});
        REQUIRE(column_map.size() == 3);
        CHECK(column_map["id"] == "id1");
        CHECK(column_map["station_name_full"] == "station2");
        CHECK(column_map["the year"] == "the yea3");
    }

    SUBCASE("Names stay within ten characters past 999 fields") {
        std::vector<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            ids.push_back("long_field_" + std::to_string(i));
        }
        auto column_map = io::ShapefileWriter::buildColumnMap(ids);
        CHECK(column_map["long_field_0"] == "long_fi1");
        CHECK(column_map["long_field_998"] == "long_fi999");
        CHECK(column_map["long_field_999"] == "long_f1000");
        for (const auto& entry : column_map) {
            CHECK(entry.second.size() <= 10);
        }
    }
}

TEST_CASE("ShapefileWriter - column names stay unique") {
    // "ab" at position 12 would become "ab12", the name already given to "ab1" at position 2
    std::vector<std::string> ids = {"a_very_long_field_name", "ab1"};
    for (int i = 3; i <= 11; ++i) {
        ids.push_back("f" + std::to_string(i) + "x");
    }
    ids.push_back("ab");

    SUBCASE("Exact clash") {
        auto column_map = io::ShapefileWriter::buildColumnMap(ids);
        REQUIRE(column_map.size() == ids.size());
        CHECK(column_map["ab1"] == "ab12");
        CHECK(column_map["ab"] == "a12");
        CHECK(column_map["f11x"] == "f11x11");

        std::set<std::string> names;
        for (const auto& entry : column_map) {
            names.insert(entry.second);
        }
        CHECK(names.size() == ids.size());
    }

    SUBCASE("Clash ignoring case") {
        ids[1] = "AB1";
        auto column_map = io::ShapefileWriter::buildColumnMap(ids);
        CHECK(column_map["AB1"] == "AB12");
        CHECK(column_map["ab"] == "a12");
    }
}

TEST_CASE("ShapefileWriter - multi-byte field names") {
    const std::string e_acute = "\xc3\xa9";
    const std::string id = e_acute + e_acute + e_acute + e_acute + e_acute + e_acute + "_longue";

    CHECK(io::ShapefileWriter::utf8Prefix(id, 7) == e_acute + e_acute + e_acute);
    CHECK(io::ShapefileWriter::utf8Prefix(id, 6) == e_acute + e_acute + e_acute);
    CHECK(io::ShapefileWriter::utf8Prefix(id, 1).empty());
    CHECK(io::ShapefileWriter::utf8Prefix("id", 7) == "id");

    auto column_map = io::ShapefileWriter::buildColumnMap({id, "name"});
    CHECK(column_map[id] == e_acute + e_acute + e_acute + "1");
    CHECK(column_map["name"] == "name2");

    iotrans_test::TempDir dir("iotrans-shp-utf8");
    const std::string path = (dir.path() / "fields.csv").string();
    io::ShapefileWriter writer;
    REQUIRE(writer.writeFieldsFile(path, {id, "name"}, column_map));
    CHECK(iotrans_test::readFile(path) ==
          "field,name\r\n" + e_acute + e_acute + e_acute + "1," + id + "\r\nname2,name\r\n");
}

TEST_CASE("ShapefileWriter - fields file") {
    iotrans_test::TempDir dir("iotrans-shp-fields");
    const std::string path = (dir.path() / "fields.csv").string();

    std::vector<std::string> ids = {"id", "station_name_full"};
    io::ShapefileWriter writer;
    REQUIRE(writer.writeFieldsFile(path, ids, io::ShapefileWriter::buildColumnMap(ids)));
    CHECK(iotrans_test::readFile(path) == "field,name\r\nid1,id\r\nstation2,station_name_full\r\n");

    REQUIRE(writer.writeFieldsFile(path, {"id", "name"}, {}));
    CHECK(iotrans_test::readFile(path) == "field,name\r\nid,id\r\nname,name\r\n");
}

TEST_CASE("ShapefileWriter - zip bundle") {
    iotrans_test::TempDir dir("iotrans-shp");
    io::GDALUtils::registerDrivers();

    io::ShapefileWriterConfig config = pointConfig((dir.path() / "Bike Stations - 4326.shp").string());
    io::VectorRecordStream records(pointRecords());

    io::ShapefileWriter writer;
    REQUIRE_MESSAGE(writer.writeRecords(config, records), writer.getLastError());
    CHECK(writer.getWrittenCount() == 2);
    CHECK(writer.getOutputPath() == (dir.path() / "Bike Stations - 4326.zip").string());

    std::vector<std::string> entries = listZip(writer.getOutputPath());
    CHECK(contains(entries, "Bike Stations - 4326.shp"));
    CHECK(contains(entries, "Bike Stations - 4326.shx"));
    CHECK(contains(entries, "Bike Stations - 4326.dbf"));
    CHECK(contains(entries, "Bike Stations - 4326.prj"));
    CHECK(contains(entries, "Bike Stations fields.csv"));

    // Only the zip is left behind
    CHECK_FALSE(boost::filesystem::exists(dir.path() / "Bike Stations - 4326"));
    CHECK(iotrans_test::countEntries(dir.path()) == 1);

    // Attribute columns carry the truncated names
    std::string shp = "/vsizip/" + writer.getOutputPath() + "/Bike Stations - 4326.shp";
    GDALDatasetH dataset = GDALOpenEx(shp.c_str(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr);
    REQUIRE(dataset != nullptr);
    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    REQUIRE(layer != nullptr);
    CHECK(OGR_L_GetFeatureCount(layer, TRUE) == 2);
    OGRFeatureDefnH defn = OGR_L_GetLayerDefn(layer);
    CHECK(OGR_FD_GetFieldIndex(defn, "id1") >= 0);
    CHECK(OGR_FD_GetFieldIndex(defn, "station2") >= 0);
    GDALClose(dataset);
}

TEST_CASE("ShapefileWriter - dataset name with a path separator") {
    iotrans_test::TempDir dir("iotrans-shp-name");
    io::GDALUtils::registerDrivers();

    io::ShapefileWriterConfig config = pointConfig((dir.path() / "stations.shp").string());
    config.dataset_name = "2019/2020 Stations";
    io::VectorRecordStream records(pointRecords());

    io::ShapefileWriter writer;
    REQUIRE_MESSAGE(writer.writeRecords(config, records), writer.getLastError());
    CHECK(contains(listZip(writer.getOutputPath()), "2019_2020 Stations fields.csv"));
}

TEST_CASE("ShapefileWriter - scratch directory collision") {
    iotrans_test::TempDir dir("iotrans-shp-collision");
    io::GDALUtils::registerDrivers();
    boost::filesystem::create_directory(dir.path() / "Bike Stations - 4326");

    io::ShapefileWriterConfig config = pointConfig((dir.path() / "Bike Stations - 4326.shp").string());
    io::VectorRecordStream records(pointRecords());

    io::ShapefileWriter writer;
    CHECK_FALSE(writer.writeRecords(config, records));
    CHECK(writer.getLastError().find("already exists") != std::string::npos);
    CHECK(writer.getOutputPath().empty());

    // The pre-existing directory is not ours to remove
    CHECK(boost::filesystem::exists(dir.path() / "Bike Stations - 4326"));
}

TEST_CASE("ZipArchive - missing input file") {
    iotrans_test::TempDir dir("iotrans-zip");

    io::ZipArchive archive((dir.path() / "bundle.zip").string());
    REQUIRE(archive.open());
    CHECK_FALSE(archive.addFile((dir.path() / "missing.txt").string(), "missing.txt"));
    CHECK_FALSE(archive.getLastError().empty());
    CHECK(archive.close());
}
