#ifndef IOTRANS_HANDLER_FACTORY_HPP
#define IOTRANS_HANDLER_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"
#include "pipeline/format_handler.hpp"

namespace iotrans {
namespace pipeline {

/**
 * Builds the format handlers a request asks for
 */
class HandlerFactory {
public:
    /**
     * Spatial requests get one handler per (target EPSG, format) pair, written to
     * "{output_dir}/{name} - {epsg}.{format}"; non-spatial requests get one per
     * format, written to "{output_dir}/{name}.{format}".
     * @param request Conversion request
     * @param output_dir Directory for the artifacts
     * @param metadata Dataset metadata
     * @param tables Conversion tables
     * @param xml_chunk_size Rows buffered per XML disk write
     * @return Handlers in request order
     * @throws ValidationError if a format has no handler for the request shape
     */
    static std::vector<FormatHandler> build(const ConversionRequest& request,
                                            const std::string& output_dir,
                                            std::shared_ptr<const DatasetMetadata> metadata,
                                            const ConversionTables& tables,
                                            size_t xml_chunk_size);

private:
    // Disable instantiation
    HandlerFactory() = delete;
};

} // namespace pipeline
} // namespace iotrans

#endif // IOTRANS_HANDLER_FACTORY_HPP
