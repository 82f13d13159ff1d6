#include "pipeline/handler_factory.hpp"
#include "core/errors.hpp"
#include <boost/filesystem.hpp>

namespace iotrans {
namespace pipeline {

namespace {

std::string outputPath(const std::string& output_dir, const std::string& file_name) {
    return (boost::filesystem::path(output_dir) / file_name).string();
}

} // namespace

std::vector<FormatHandler> HandlerFactory::build(const ConversionRequest& request,
                                                 const std::string& output_dir,
                                                 std::shared_ptr<const DatasetMetadata> metadata,
                                                 const ConversionTables& tables,
                                                 size_t xml_chunk_size) {
    std::vector<FormatHandler> handlers;
    const std::string name = fileSafeName(metadata->name);

    if (const auto* spatial = std::get_if<SpatialRequest>(&request)) {
        for (int epsg : spatial->target_epsgs) {
            for (const auto& format : spatial->target_formats) {
                if (tables.spatial_formats.find(format) == tables.spatial_formats.end()) {
                    throw ValidationError(format + " is not an accepted spatial target format");
                }

                std::string path = outputPath(output_dir, name + " - " + std::to_string(epsg) + "." + format);
                if (format == "csv") {
                    handlers.emplace_back(SpatialCsvHandler{path, spatial->source_epsg, epsg},
                                          format, metadata, tables);
                } else if (format == "shp") {
                    handlers.emplace_back(SpatialShapefileHandler{path, spatial->source_epsg, epsg},
                                          format, metadata, tables);
                } else {
                    handlers.emplace_back(SpatialGenericHandler{path, format, spatial->source_epsg, epsg},
                                          format, metadata, tables);
                }
            }
        }
        return handlers;
    }

    const auto& non_spatial = std::get<NonSpatialRequest>(request);
    for (const auto& format : non_spatial.target_formats) {
        std::string path = outputPath(output_dir, name + "." + format);
        if (format == "csv") {
            handlers.emplace_back(NonSpatialCsvHandler{path}, format, metadata, tables);
        } else if (format == "json") {
            handlers.emplace_back(NonSpatialJsonHandler{path}, format, metadata, tables);
        } else if (format == "xml") {
            handlers.emplace_back(NonSpatialXmlHandler{path, xml_chunk_size}, format, metadata, tables);
        } else {
            throw ValidationError(format + " is not an accepted non-spatial target format");
        }
    }
    return handlers;
}

} // namespace pipeline
} // namespace iotrans
