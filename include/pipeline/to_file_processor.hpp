#ifndef IOTRANS_TO_FILE_PROCESSOR_HPP
#define IOTRANS_TO_FILE_PROCESSOR_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/types.hpp"
#include "io/jsonl_cache.hpp"
#include "io/record_source.hpp"

namespace iotrans {
namespace pipeline {

/**
 * Runs one conversion request end to end:
 *  1. validate the request and the dataset (active, non-empty, matching shape)
 *  2. drain the record source once into a JSON-lines cache in a request directory
 *  3. sample the geometry type (spatial datasets)
 *  4. run every format handler on a fresh stream over the cache
 *  5. collect "{format}-{epsg|None}" -> output path
 *
 * Handlers run sequentially. A failing handler aborts the request unless
 * continue_on_handler_error is set, in which case the failure is recorded
 * and the remaining handlers still run.
 */
class ToFileProcessor {
public:
    /**
     * @param source Record source to read datasets from
     * @param config Engine configuration
     * @param tables Conversion tables
     */
    ToFileProcessor(io::RecordSource& source, EngineConfig config,
                    const ConversionTables& tables = ConversionTables::defaults());

    /**
     * Parse request parameters and process them
     * @param params Request parameters
     * @return Conversion result
     * @throws ValidationError for bad requests or unusable datasets
     * @throws SchemaError / IoError from a failing handler
     */
    ConversionResult process(const nlohmann::json& params);

    /**
     * Process an already built request
     * @param request Conversion request
     * @return Conversion result
     */
    ConversionResult process(const ConversionRequest& request);

    const EngineConfig& getConfig() const { return config_; }

private:
    io::RecordSource& source_;
    EngineConfig config_;
    const ConversionTables& tables_;

    /**
     * Check the resource and build its metadata (before any disk I/O)
     */
    DatasetMetadata loadMetadata(const ConversionRequest& request);

    /**
     * Create a unique request directory under the storage root
     */
    std::string createWorkingDirectory() const;

    /**
     * Base type of the first non-null geometry in the cache
     */
    std::optional<std::string> sampleGeometryType(const io::JsonLinesCache& cache) const;

    /**
     * Run every handler of the request against the cache
     */
    void runHandlers(const ConversionRequest& request, const DatasetMetadata& metadata,
                     const io::JsonLinesCache& cache, const std::string& output_dir,
                     ConversionResult& result);
};

} // namespace pipeline
} // namespace iotrans

#endif // IOTRANS_TO_FILE_PROCESSOR_HPP
