#ifndef IOTRANS_TO_FILE_API_HPP
#define IOTRANS_TO_FILE_API_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "io/record_source.hpp"

namespace iotrans {
namespace api {

/**
 * Conversion entry point for string-based callers
 * @param request_json JSON request parameters (resource_id, target_formats, source_epsg, target_epsgs)
 * @param config_json JSON engine configuration ("{}" for defaults)
 * @param source Record source holding the resource
 * @return Result object as JSON text, or "Error: ..." on failure
 */
std::string processToFile(const std::string& request_json,
                          const std::string& config_json,
                          io::RecordSource& source);

/**
 * Prune entry point for string-based callers
 * @param prune_json JSON object with the "path" to delete
 * @param config_json JSON engine configuration (storage_path bounds the deletion)
 * @return "Success: ..." or "Error: ..."
 */
std::string processPrune(const std::string& prune_json, const std::string& config_json);

/**
 * JSON form of a conversion result:
 * {"outputs": {key: path}, "failures": {key: error}, "record_count": N, "working_directory": dir}
 * @param result Conversion result
 * @return JSON object
 */
nlohmann::json resultToJson(const ConversionResult& result);

} // namespace api
} // namespace iotrans

#endif // IOTRANS_TO_FILE_API_HPP
