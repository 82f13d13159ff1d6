#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <nlohmann/json.hpp>
#include "api/to_file_api.hpp"
#include "io/dataset_reader.hpp"
#include "io/record_source.hpp"

using namespace iotrans;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --input <path> --target-formats <formats> [options]\n"
              << "       " << programName << " --prune <path> [--storage-path <dir>]\n"
              << "\nRequired arguments:\n"
              << "  --input <path>               Dataset document (table JSON or GeoJSON FeatureCollection)\n"
              << "  --target-formats <formats>   Comma-separated formats: csv, json, xml (non-spatial) or\n"
              << "                               shp, geojson, gpkg, csv (spatial)\n"
              << "\nOptional arguments:\n"
              << "  --resource-id <id>           Resource identifier (defaults to the dataset name)\n"
              << "  --source-epsg <code>         EPSG code of the input geometries (spatial datasets)\n"
              << "  --target-epsgs <codes>       Comma-separated output EPSG codes (spatial datasets)\n"
              << "  --storage-path <dir>         Root directory for request directories\n"
              << "  --config <path>              Engine configuration JSON file\n"
              << "  --verbose                    Print progress\n"
              << "\nExamples:\n"
              << "  " << programName << " --input permits.json --target-formats csv,json,xml\n"
              << "  " << programName << " --input wards.geojson --source-epsg 4326 --target-epsgs 4326,2952 --target-formats geojson,shp\n"
              << "  " << programName << " --prune /tmp/iotrans-1a2b-3c4d-5e6f --storage-path /tmp\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Check if this is a flag argument (no value) or a key-value argument
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                // This is a key-value argument
                std::string value = argv[i + 1];
                args[key] = value;
                i++; // Skip the value in next iteration
            } else {
                // This is a flag argument - set it to "true"
                args[key] = "true";
            }
        }
    }

    return args;
}

nlohmann::json splitList(const std::string& value) {
    nlohmann::json list = nlohmann::json::array();
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            list.push_back(item);
        }
    }
    return list;
}

nlohmann::json buildConfig(const std::unordered_map<std::string, std::string>& args) {
    nlohmann::json config = nlohmann::json::object();

    if (args.count("config")) {
        std::ifstream file(args.at("config"));
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open configuration file: " + args.at("config"));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        config = nlohmann::json::parse(buffer.str());
    }

    if (args.count("storage-path")) config["storage_path"] = args.at("storage-path");
    if (args.count("verbose")) config["verbose"] = true;

    return config;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printUsage(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "iotrans v1.0.0\n";
            std::cout << "Record conversion engine\n";
            return 0;
        }

        nlohmann::json config = buildConfig(args);
        std::string result;

        if (args.count("prune")) {
            nlohmann::json prune_config = nlohmann::json::object();
            prune_config["path"] = args.at("prune");
            result = api::processPrune(prune_config.dump(), config.dump());
        } else {
            // Check for required arguments
            if (args.count("input") == 0) {
                std::cerr << "Error: --input is required" << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            if (args.count("target-formats") == 0) {
                std::cerr << "Error: --target-formats is required" << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            io::MemoryDataset dataset = io::DatasetReader::readFromFile(args.at("input"));
            std::string resource_id = args.count("resource-id") ? args.at("resource-id") : dataset.resource.name;

            io::MemoryRecordSource source;
            source.addDataset(resource_id, std::move(dataset));

            // Convert arguments to request parameters
            nlohmann::json request = nlohmann::json::object();
            request["resource_id"] = resource_id;
            request["target_formats"] = splitList(args.at("target-formats"));
            if (args.count("source-epsg")) request["source_epsg"] = args.at("source-epsg");
            if (args.count("target-epsgs")) request["target_epsgs"] = splitList(args.at("target-epsgs"));

            result = api::processToFile(request.dump(), config.dump(), source);
        }

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
