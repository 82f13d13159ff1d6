#ifndef IOTRANS_FORMAT_HANDLER_HPP
#define IOTRANS_FORMAT_HANDLER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "core/config.hpp"
#include "core/types.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace pipeline {

struct NonSpatialCsvHandler {
    std::string output_path;
};

struct NonSpatialJsonHandler {
    std::string output_path;
};

struct NonSpatialXmlHandler {
    std::string output_path;
    size_t chunk_size;      // Rows buffered before each disk write
};

struct SpatialCsvHandler {
    std::string output_path;
    int source_epsg;
    int target_epsg;
};

/**
 * GeoJSON and GPKG outputs written through the format's GDAL driver
 */
struct SpatialGenericHandler {
    std::string output_path;
    std::string format;     // geojson or gpkg
    int source_epsg;
    int target_epsg;
};

struct SpatialShapefileHandler {
    std::string output_path;    // Nominal .shp path; the artifact is the .zip beside it
    int source_epsg;
    int target_epsg;
};

using HandlerVariant = std::variant<NonSpatialCsvHandler,
                                    NonSpatialJsonHandler,
                                    NonSpatialXmlHandler,
                                    SpatialCsvHandler,
                                    SpatialGenericHandler,
                                    SpatialShapefileHandler>;

/**
 * Produces one output artifact from a record stream.
 * Handlers share the dataset metadata read-only; each one gets its own stream.
 */
class FormatHandler {
public:
    /**
     * @param variant Format-specific parameters
     * @param format Target format (csv, json, xml, geojson, gpkg, shp)
     * @param metadata Dataset metadata
     * @param tables Conversion tables
     */
    FormatHandler(HandlerVariant variant,
                  std::string format,
                  std::shared_ptr<const DatasetMetadata> metadata,
                  const ConversionTables& tables);

    /**
     * Result key of this handler: "{format}-{epsg}" or "{format}-None"
     */
    std::string name() const;

    /**
     * Serialize every record of the stream to the output artifact
     * @param records Record stream, consumed to exhaustion
     * @return Path of the artifact written
     * @throws SchemaError if a record does not fit the dataset schema
     * @throws IoError if the artifact cannot be written
     */
    std::string toFile(io::RecordStream& records);

    /**
     * Target EPSG for spatial outputs
     */
    std::optional<int> targetEpsg() const;

    const std::string& format() const { return format_; }
    const HandlerVariant& variant() const { return variant_; }

    /**
     * Number of records written by the last toFile call
     */
    size_t getWrittenCount() const { return written_count_; }

private:
    struct Runner;

    HandlerVariant variant_;
    std::string format_;
    std::shared_ptr<const DatasetMetadata> metadata_;
    const ConversionTables& tables_;
    size_t written_count_;
};

} // namespace pipeline
} // namespace iotrans

#endif // IOTRANS_FORMAT_HANDLER_HPP
