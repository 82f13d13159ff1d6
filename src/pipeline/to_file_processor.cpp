#include "pipeline/to_file_processor.hpp"
#include "core/errors.hpp"
#include "core/request.hpp"
#include "geometry/geometry_transform.hpp"
#include "pipeline/handler_factory.hpp"
#include <boost/filesystem.hpp>
#include <iostream>
#include <memory>
#include <utility>

namespace iotrans {
namespace pipeline {

namespace fs = boost::filesystem;

namespace {
const char* const CACHE_FILE_NAME = "records.jsonl";
const char* const OUTPUT_DIR_NAME = "output";
const char* const WORKING_DIR_PATTERN = "iotrans-%%%%-%%%%-%%%%";
}

ToFileProcessor::ToFileProcessor(io::RecordSource& source, EngineConfig config, const ConversionTables& tables)
    : source_(source), config_(std::move(config)), tables_(tables) {}

ConversionResult ToFileProcessor::process(const nlohmann::json& params) {
    return process(parseConversionRequest(params, tables_, config_.allowed_epsgs));
}

DatasetMetadata ToFileProcessor::loadMetadata(const ConversionRequest& request) {
    const std::string& resource_id = requestResourceId(request);

    ResourceInfo resource = source_.getResource(resource_id);
    if (!resource.datastore_active) {
        throw ValidationError("Resource " + resource_id + " has no active datastore");
    }

    DatasetMetadata metadata;
    metadata.name = resource.name.empty() ? resource_id : resource.name;
    metadata.fields = source_.getFields(resource_id);

    // An empty dataset is rejected before anything is written to disk
    if (source_.fetchPage(resource_id, 1, 0).empty()) {
        throw ValidationError("Resource " + resource_id + " has no records");
    }

    if (isSpatialRequest(request) && !metadata.isSpatial()) {
        throw ValidationError("Spatial parameters given for resource " + resource_id +
                              ", which has no geometry field");
    }
    if (!isSpatialRequest(request) && metadata.isSpatial()) {
        throw ValidationError("Resource " + resource_id +
                              " has a geometry field; source_epsg and target_epsgs are required");
    }

    return metadata;
}

std::string ToFileProcessor::createWorkingDirectory() const {
    boost::system::error_code ec;
    fs::path root(config_.storage_path);
    fs::create_directories(root, ec);
    if (ec) {
        throw IoError("Failed to create storage directory " + root.string() + ": " + ec.message());
    }

    fs::path working_dir = root / fs::unique_path(WORKING_DIR_PATTERN);
    if (!fs::create_directory(working_dir, ec) || ec) {
        throw IoError("Failed to create request directory " + working_dir.string() +
                      (ec ? ": " + ec.message() : std::string(": already exists")));
    }
    return fs::absolute(working_dir).string();
}

std::optional<std::string> ToFileProcessor::sampleGeometryType(const io::JsonLinesCache& cache) const {
    std::unique_ptr<io::RecordStream> stream = cache.open();
    Record record;
    while (stream->next(record)) {
        auto it = record.find(GEOMETRY_FIELD);
        if (it == record.end()) {
            continue;
        }
        Json geometry = geometry::GeometryTransformer::parseGeometry(*it);
        if (geometry.is_null()) {
            continue;
        }
        if (!geometry.contains("type") || !geometry["type"].is_string()) {
            throw SchemaError("Geometry without a type: " + geometry.dump());
        }
        return geometry["type"].get<std::string>();
    }
    return std::nullopt;
}

void ToFileProcessor::runHandlers(const ConversionRequest& request, const DatasetMetadata& metadata,
                                  const io::JsonLinesCache& cache, const std::string& output_dir,
                                  ConversionResult& result) {
    auto shared_metadata = std::make_shared<const DatasetMetadata>(metadata);
    std::vector<FormatHandler> handlers =
        HandlerFactory::build(request, output_dir, shared_metadata, tables_, config_.xml_chunk_size);

    for (auto& handler : handlers) {
        const std::string key = handler.name();
        if (config_.verbose) {
            std::cout << "Starting " << key << std::endl;
        }

        try {
            std::unique_ptr<io::RecordStream> records = cache.open();
            std::string path = handler.toFile(*records);

            if (handler.getWrittenCount() != cache.getRecordCount()) {
                throw IoError("Row count mismatch for " + key + ": wrote " +
                              std::to_string(handler.getWrittenCount()) + " of " +
                              std::to_string(cache.getRecordCount()) + " records");
            }

            result.outputs[key] = fs::absolute(path).string();
            if (config_.verbose) {
                std::cout << "Successfully wrote " << handler.getWrittenCount() << " records to: "
                          << result.outputs[key] << std::endl;
            }
        } catch (const Error& e) {
            if (!config_.continue_on_handler_error) {
                throw;
            }
            std::cerr << "Warning: " << key << " failed: " << e.what() << std::endl;
            result.failures[key] = e.what();
        }
    }
}

ConversionResult ToFileProcessor::process(const ConversionRequest& request) {
    // Re-validate requests that were not built by parseConversionRequest
    ConversionRequest validated = parseConversionRequest(requestToJson(request), tables_, config_.allowed_epsgs);
    const std::string& resource_id = requestResourceId(validated);

    DatasetMetadata metadata = loadMetadata(validated);

    ConversionResult result;
    result.working_directory = createWorkingDirectory();

    io::JsonLinesCache cache((fs::path(result.working_directory) / CACHE_FILE_NAME).string());
    auto discard_cache = [this, &cache]() {
        if (!config_.keep_cache && !cache.remove()) {
            std::cerr << "Warning: Failed to remove cache file " << cache.getFilePath() << std::endl;
        }
    };

    try {
        {
            io::PagedRecordStream pages(source_, resource_id, config_.page_size);
            result.record_count = cache.materialize(pages);
        }
        if (result.record_count == 0) {
            throw ValidationError("Resource " + resource_id + " has no records");
        }
        if (config_.verbose) {
            std::cout << "Cached " << result.record_count << " records to: " << cache.getFilePath() << std::endl;
        }

        if (metadata.isSpatial()) {
            metadata.geometry_type = sampleGeometryType(cache);
        }

        fs::path output_dir = fs::path(result.working_directory) / OUTPUT_DIR_NAME;
        boost::system::error_code ec;
        if (!fs::create_directory(output_dir, ec) || ec) {
            throw IoError("Failed to create output directory " + output_dir.string() +
                          (ec ? ": " + ec.message() : std::string(": already exists")));
        }

        runHandlers(validated, metadata, cache, output_dir.string(), result);
    } catch (const Error&) {
        discard_cache();
        throw;
    }

    discard_cache();
    return result;
}

} // namespace pipeline
} // namespace iotrans
