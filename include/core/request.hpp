#ifndef IOTRANS_REQUEST_HPP
#define IOTRANS_REQUEST_HPP

#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/types.hpp"

namespace iotrans {

/**
 * Parse caller parameters into a conversion request.
 * The spatial shape is tried first; the non-spatial shape is the fallback.
 * List parameters may be JSON arrays or JSON-encoded strings of arrays.
 * @param params Request parameters (resource_id, target_formats, source_epsg, target_epsgs)
 * @param tables Format tables
 * @param allowed_epsgs EPSG codes accepted for source_epsg and target_epsgs
 * @return Spatial or non-spatial request
 * @throws ValidationError listing why each shape was rejected
 */
ConversionRequest parseConversionRequest(const nlohmann::json& params,
                                         const ConversionTables& tables,
                                         const std::set<int>& allowed_epsgs);

/**
 * Serialize a request back to its parameter form (used for logging)
 * @param request Conversion request
 * @return JSON parameters
 */
nlohmann::json requestToJson(const ConversionRequest& request);

} // namespace iotrans

#endif // IOTRANS_REQUEST_HPP
