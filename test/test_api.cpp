#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "api/to_file_api.hpp"
#include "io/dataset_reader.hpp"
#include "io/record_source.hpp"
#include "test_utils.hpp"

using namespace iotrans;

namespace {

std::string storageConfig(const iotrans_test::TempDir& storage) {
    return nlohmann::json{{"storage_path", storage.str()}}.dump();
}

} // namespace

TEST_CASE("API - processToFile") {
    iotrans_test::TempDir storage("iotrans-api");

    io::MemoryRecordSource source;
    source.addDataset("permits", io::DatasetReader::readFromString(R"({
        "name": "Permits",
        "records": [{"_id": 1, "ward": "A"}, {"_id": 2, "ward": "B"}]
    })", "permits"));

    SUBCASE("Successful conversion") {
        std::string response = api::processToFile(
            R"({"resource_id": "permits", "target_formats": ["json", "csv"]})", storageConfig(storage), source);
        REQUIRE(response.rfind("Error", 0) != 0);

        nlohmann::json result = nlohmann::json::parse(response);
        CHECK(result["record_count"] == 2);
        CHECK(result["failures"].empty());
        REQUIRE(result["outputs"].contains("json-None"));
        REQUIRE(result["outputs"].contains("csv-None"));

        std::string path = result["outputs"]["json-None"].get<std::string>();
        CHECK(nlohmann::json::parse(iotrans_test::readFile(path)).size() == 2);
        CHECK(path.find(result["working_directory"].get<std::string>()) == 0);
    }

    SUBCASE("Errors are reported as text") {
        CHECK(api::processToFile("{ not json", "{}", source).rfind("Error: ", 0) == 0);
        CHECK(api::processToFile(R"({"resource_id": "permits"})", storageConfig(storage), source)
                  .rfind("Error: ", 0) == 0);
        CHECK(api::processToFile(R"({"resource_id": "permits", "target_formats": ["csv"]})",
                                 R"({"page_size": 0})", source)
                  .rfind("Error: ", 0) == 0);
        CHECK(iotrans_test::countEntries(storage.path()) == 0);
    }
}

TEST_CASE("API - processPrune") {
    iotrans_test::TempDir storage("iotrans-api-prune");
    boost::filesystem::create_directories(storage.path() / "iotrans-abcd" / "output");

    std::string target = (storage.path() / "iotrans-abcd").string();
    std::string response = api::processPrune(nlohmann::json{{"path", target}}.dump(), storageConfig(storage));
    CHECK(response.rfind("Success: Removed ", 0) == 0);
    CHECK_FALSE(boost::filesystem::exists(target));

    CHECK(api::processPrune(nlohmann::json{{"path", target}}.dump(), storageConfig(storage)).rfind("Error: ", 0) == 0);
    CHECK(api::processPrune("{}", storageConfig(storage)).rfind("Error: ", 0) == 0);
    CHECK(api::processPrune(R"({"path": "/etc/hosts"})", storageConfig(storage)).rfind("Error: ", 0) == 0);
}
