#include "api/to_file_api.hpp"
#include "core/config.hpp"
#include "io/prune.hpp"
#include "pipeline/to_file_processor.hpp"

namespace iotrans {
namespace api {

nlohmann::json resultToJson(const ConversionResult& result) {
    nlohmann::json output;
    output["outputs"] = result.outputs;
    output["failures"] = result.failures;
    output["record_count"] = result.record_count;
    output["working_directory"] = result.working_directory;
    return output;
}

std::string processToFile(const std::string& request_json,
                          const std::string& config_json,
                          io::RecordSource& source) {
    try {
        // Parse configurations
        nlohmann::json request = nlohmann::json::parse(request_json);
        nlohmann::json config = nlohmann::json::parse(config_json);

        EngineConfig engine_config = parseEngineConfig(config);

        pipeline::ToFileProcessor processor(source, engine_config);
        ConversionResult result = processor.process(request);

        return resultToJson(result).dump();

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

std::string processPrune(const std::string& prune_json, const std::string& config_json) {
    try {
        nlohmann::json prune_config = nlohmann::json::parse(prune_json);
        nlohmann::json config = nlohmann::json::parse(config_json);

        EngineConfig engine_config = parseEngineConfig(config);

        std::string path = prune_config.value("path", "");
        std::string removed = io::prunePath(path, engine_config.storage_path);

        return "Success: Removed " + removed;

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace api
} // namespace iotrans
