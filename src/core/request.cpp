#include "core/request.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace iotrans {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string setToString(const std::set<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) joined += ", ";
        joined += value;
    }
    return joined;
}

std::string requireResourceId(const nlohmann::json& params) {
    if (!params.contains("resource_id") || !params["resource_id"].is_string() ||
        params["resource_id"].get<std::string>().empty()) {
        throw std::invalid_argument("Input 'resource_id' required");
    }
    return params["resource_id"].get<std::string>();
}

// Lists may arrive JSON-encoded from command lines and query strings
nlohmann::json requireList(const nlohmann::json& params, const std::string& key) {
    if (!params.contains(key)) {
        throw std::invalid_argument("Input '" + key + "' required");
    }

    nlohmann::json value = params[key];
    if (value.is_string()) {
        try {
            value = nlohmann::json::parse(value.get<std::string>());
        } catch (const nlohmann::json::parse_error&) {
            throw std::invalid_argument("Input '" + key + "' must be a list");
        }
    }
    if (!value.is_array()) {
        throw std::invalid_argument("Input '" + key + "' must be a list");
    }
    if (value.empty()) {
        throw std::invalid_argument("Input '" + key + "' must not be empty");
    }
    return value;
}

int toEpsg(const nlohmann::json& value, const std::string& key, const std::set<int>& allowed_epsgs) {
    int epsg = 0;
    if (value.is_number_integer()) {
        epsg = value.get<int>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t consumed = 0;
        try {
            epsg = std::stoi(text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size()) {
            throw std::invalid_argument("Input '" + key + "' must contain integers");
        }
    } else {
        throw std::invalid_argument("Input '" + key + "' must contain integers");
    }

    if (allowed_epsgs.count(epsg) == 0) {
        std::string allowed;
        for (int code : allowed_epsgs) {
            if (!allowed.empty()) allowed += ", ";
            allowed += std::to_string(code);
        }
        throw std::invalid_argument("EPSG " + std::to_string(epsg) + " in '" + key +
                                    "' is not one of: " + allowed);
    }
    return epsg;
}

std::vector<std::string> parseFormats(const nlohmann::json& params, const std::set<std::string>& accepted) {
    std::vector<std::string> formats;
    for (const auto& item : requireList(params, "target_formats")) {
        if (!item.is_string()) {
            throw std::invalid_argument("Input 'target_formats' must be a list of strings");
        }
        std::string format = toLower(item.get<std::string>());
        if (accepted.count(format) == 0) {
            throw std::invalid_argument("Input target_format '" + format +
                                        "' must be in the following: " + setToString(accepted));
        }
        if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
            formats.push_back(format);
        }
    }
    return formats;
}

SpatialRequest parseSpatial(const nlohmann::json& params,
                            const ConversionTables& tables,
                            const std::set<int>& allowed_epsgs) {
    SpatialRequest request;
    request.resource_id = requireResourceId(params);

    if (!params.contains("source_epsg") || params["source_epsg"].is_null()) {
        throw std::invalid_argument("Input 'source_epsg' required");
    }
    request.source_epsg = toEpsg(params["source_epsg"], "source_epsg", allowed_epsgs);

    nlohmann::json epsgs;
    if (params.contains("target_epsgs") && params["target_epsgs"].is_number_integer()) {
        epsgs = nlohmann::json::array({params["target_epsgs"]});
    } else {
        epsgs = requireList(params, "target_epsgs");
    }
    for (const auto& item : epsgs) {
        int epsg = toEpsg(item, "target_epsgs", allowed_epsgs);
        if (std::find(request.target_epsgs.begin(), request.target_epsgs.end(), epsg) ==
            request.target_epsgs.end()) {
            request.target_epsgs.push_back(epsg);
        }
    }

    request.target_formats = parseFormats(params, tables.spatial_formats);
    return request;
}

NonSpatialRequest parseNonSpatial(const nlohmann::json& params, const ConversionTables& tables) {
    NonSpatialRequest request;
    request.resource_id = requireResourceId(params);
    request.target_formats = parseFormats(params, tables.non_spatial_formats);
    return request;
}

} // namespace

ConversionRequest parseConversionRequest(const nlohmann::json& params,
                                         const ConversionTables& tables,
                                         const std::set<int>& allowed_epsgs) {
    if (!params.is_object()) {
        throw ValidationError("Request parameters must be a JSON object");
    }

    std::string spatial_error;
    try {
        return parseSpatial(params, tables, allowed_epsgs);
    } catch (const std::invalid_argument& e) {
        spatial_error = e.what();
    }

    try {
        return parseNonSpatial(params, tables);
    } catch (const std::invalid_argument& e) {
        std::vector<std::string> constraints = {
            "Could not parse spatial-type params: " + spatial_error,
            "Could not parse non-spatial-type params: " + std::string(e.what()),
        };
        throw ValidationError(constraints[0] + "; " + constraints[1], constraints);
    }
}

nlohmann::json requestToJson(const ConversionRequest& request) {
    nlohmann::json params = nlohmann::json::object();
    if (const auto* spatial = std::get_if<SpatialRequest>(&request)) {
        params["resource_id"] = spatial->resource_id;
        params["source_epsg"] = spatial->source_epsg;
        params["target_epsgs"] = spatial->target_epsgs;
        params["target_formats"] = spatial->target_formats;
    } else {
        const auto& non_spatial = std::get<NonSpatialRequest>(request);
        params["resource_id"] = non_spatial.resource_id;
        params["target_formats"] = non_spatial.target_formats;
    }
    return params;
}

} // namespace iotrans
