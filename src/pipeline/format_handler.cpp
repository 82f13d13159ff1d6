#include "pipeline/format_handler.hpp"
#include "core/errors.hpp"
#include "geometry/geometry_transform.hpp"
#include "io/csv_writer.hpp"
#include "io/json_array_writer.hpp"
#include "io/ogr_layer_writer.hpp"
#include "io/shapefile_writer.hpp"
#include "io/xml_writer.hpp"
#include <set>
#include <utility>
#include <vector>

namespace iotrans {
namespace pipeline {

namespace {

std::unique_ptr<geometry::Reprojector> makeReprojector(int source_epsg, int target_epsg) {
    // Same CRS: geometries are still normalized, only the coordinate math is skipped
    if (source_epsg == target_epsg) {
        return nullptr;
    }
    return std::make_unique<geometry::OgrReprojector>(source_epsg, target_epsg);
}

std::vector<io::OgrFieldSpec> buildFieldSpecs(const DatasetMetadata& metadata, const ConversionTables& tables) {
    std::vector<io::OgrFieldSpec> specs;
    for (const auto& field : metadata.fields) {
        if (field.id == GEOMETRY_FIELD) {
            continue;
        }
        std::optional<SpatialFieldType> type = tables.fieldTypeFor(field.type);
        if (!type) {
            throw SchemaError("Unknown type '" + field.type + "' for field " + field.id);
        }
        specs.emplace_back(field.id, field.id, type.value());
    }
    return specs;
}

std::string layerGeometryType(const DatasetMetadata& metadata, const ConversionTables& tables) {
    if (!metadata.geometry_type) {
        return "";
    }
    std::optional<std::string> multi_type = tables.multiGeometryType(metadata.geometry_type.value());
    if (!multi_type) {
        throw SchemaError("Unknown geometry type: " + metadata.geometry_type.value());
    }
    return multi_type.value();
}

} // namespace

struct FormatHandler::Runner {
    FormatHandler& handler;
    io::RecordStream& records;

    std::string operator()(const NonSpatialCsvHandler& params) {
        io::CsvWriterConfig config;
        config.output_file_path = params.output_path;
        config.columns = handler.metadata_->fieldIds();

        io::CsvWriter writer;
        if (!writer.writeRecords(config, records)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return params.output_path;
    }

    std::string operator()(const NonSpatialJsonHandler& params) {
        io::JsonArrayWriter writer;
        if (!writer.writeRecords(params.output_path, records)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return params.output_path;
    }

    std::string operator()(const NonSpatialXmlHandler& params) {
        io::XmlWriterConfig config;
        config.output_file_path = params.output_path;
        config.chunk_size = params.chunk_size;

        io::XmlWriter writer;
        if (!writer.writeRecords(config, records)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return params.output_path;
    }

    std::string operator()(const SpatialCsvHandler& params) {
        geometry::GeometryTransformer transformer(handler.tables_,
                                                  makeReprojector(params.source_epsg, params.target_epsg));
        io::MappedRecordStream transformed(records, [&transformer](Record& record) {
            transformer.transformRecord(record);
            record[GEOMETRY_FIELD] = geometry::GeometryTransformer::geometryToText(record[GEOMETRY_FIELD]);
        });

        io::CsvWriterConfig config;
        config.output_file_path = params.output_path;
        config.columns = handler.metadata_->fieldIds();

        io::CsvWriter writer;
        if (!writer.writeRecords(config, transformed)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return params.output_path;
    }

    std::string operator()(const SpatialGenericHandler& params) {
        std::optional<std::string> driver = handler.tables_.driverFor(params.format);
        if (!driver) {
            throw IoError("No GDAL driver configured for format: " + params.format);
        }

        io::OgrLayerWriterConfig config;
        config.output_file_path = params.output_path;
        config.driver_name = driver.value();
        config.layer_name = handler.metadata_->name;
        config.target_epsg = params.target_epsg;
        config.geometry_type = layerGeometryType(*handler.metadata_, handler.tables_);
        config.fields = buildFieldSpecs(*handler.metadata_, handler.tables_);

        geometry::GeometryTransformer transformer(handler.tables_,
                                                  makeReprojector(params.source_epsg, params.target_epsg));
        io::MappedRecordStream transformed(records, [&transformer](Record& record) {
            transformer.transformRecord(record);
        });

        io::OgrLayerWriter writer;
        if (!writer.writeRecords(config, transformed)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return params.output_path;
    }

    std::string operator()(const SpatialShapefileHandler& params) {
        io::ShapefileWriterConfig config;
        config.output_file_path = params.output_path;
        config.dataset_name = handler.metadata_->name;
        config.target_epsg = params.target_epsg;
        config.geometry_type = layerGeometryType(*handler.metadata_, handler.tables_);
        config.fields = buildFieldSpecs(*handler.metadata_, handler.tables_);

        geometry::GeometryTransformer transformer(handler.tables_,
                                                  makeReprojector(params.source_epsg, params.target_epsg));
        io::MappedRecordStream transformed(records, [&transformer](Record& record) {
            transformer.transformRecord(record);
        });

        io::ShapefileWriter writer;
        if (!writer.writeRecords(config, transformed)) {
            throw IoError("Failed to write " + handler.name() + ": " + writer.getLastError());
        }
        handler.written_count_ = writer.getWrittenCount();
        return writer.getOutputPath();
    }
};

FormatHandler::FormatHandler(HandlerVariant variant,
                             std::string format,
                             std::shared_ptr<const DatasetMetadata> metadata,
                             const ConversionTables& tables)
    : variant_(std::move(variant)), format_(std::move(format)), metadata_(std::move(metadata)),
      tables_(tables), written_count_(0) {}

std::optional<int> FormatHandler::targetEpsg() const {
    if (const auto* params = std::get_if<SpatialCsvHandler>(&variant_)) {
        return params->target_epsg;
    }
    if (const auto* params = std::get_if<SpatialGenericHandler>(&variant_)) {
        return params->target_epsg;
    }
    if (const auto* params = std::get_if<SpatialShapefileHandler>(&variant_)) {
        return params->target_epsg;
    }
    return std::nullopt;
}

std::string FormatHandler::name() const {
    return resultKey(format_, targetEpsg());
}

std::string FormatHandler::toFile(io::RecordStream& records) {
    written_count_ = 0;

    // Records may only carry fields of the dataset
    std::set<std::string> known_fields;
    for (const auto& field : metadata_->fields) {
        known_fields.insert(field.id);
    }
    io::MappedRecordStream checked(records, [&known_fields](Record& record) {
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (known_fields.find(it.key()) == known_fields.end()) {
                throw SchemaError("Record field '" + it.key() + "' is not part of the dataset schema");
            }
        }
    });

    return std::visit(Runner{*this, checked}, variant_);
}

} // namespace pipeline
} // namespace iotrans
