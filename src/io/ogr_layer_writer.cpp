#include "io/ogr_layer_writer.hpp"
#include "io/coordinate_system_utils.hpp"
#include "io/csv_writer.hpp"
#include "io/gdal_utils.hpp"
#include <cpl_error.h>
#include <cpl_string.h>
#include <ogr_spatialref.h>
#include <memory>
#include <type_traits>

namespace iotrans {
namespace io {

namespace {

struct DatasetCloser {
    void operator()(GDALDatasetH dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

struct FeatureDestroyer {
    void operator()(OGRFeatureH feature) const {
        if (feature) {
            OGR_F_Destroy(feature);
        }
    }
};

using DatasetPtr = std::unique_ptr<std::remove_pointer_t<GDALDatasetH>, DatasetCloser>;
using FeaturePtr = std::unique_ptr<std::remove_pointer_t<OGRFeatureH>, FeatureDestroyer>;

} // namespace

OgrLayerWriter::OgrLayerWriter() : written_count_(0) {
    // Register GDAL drivers
    GDALUtils::registerDrivers();
}

GDALDatasetH OgrLayerWriter::createGDALDataset(const OgrLayerWriterConfig& config, OGRLayerH& layer) {
    layer = nullptr;

    // Get driver
    GDALDriverH driver = GDALGetDriverByName(config.driver_name.c_str());
    if (!driver) {
        last_error_ = "Failed to get GDAL driver for format: " + config.driver_name;
        return nullptr;
    }

    GDALDatasetH dataset = GDALCreate(driver, config.output_file_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        last_error_ = "Failed to create GDAL dataset: " + config.output_file_path + " (" + CPLGetLastErrorMsg() + ")";
        return nullptr;
    }

    // Create layer in the target CRS
    OGRSpatialReferenceH layer_srs = CoordinateSystemUtils::createSpatialReference(config.target_epsg);
    if (!layer_srs) {
        last_error_ = "Unknown target EPSG code: " + std::to_string(config.target_epsg);
        GDALClose(dataset);
        return nullptr;
    }

    char** layer_options = nullptr;
    for (const auto& option : config.layer_options) {
        layer_options = CSLAddString(layer_options, option.c_str());
    }

    OGRwkbGeometryType geometry_type = GDALUtils::geometryTypeFromName(config.geometry_type);
    layer = GDALDatasetCreateLayer(dataset, config.layer_name.c_str(), layer_srs, geometry_type, layer_options);

    CSLDestroy(layer_options);
    OSRDestroySpatialReference(layer_srs);

    if (!layer) {
        last_error_ = "Failed to create layer: " + config.layer_name + " (" + CPLGetLastErrorMsg() + ")";
        GDALClose(dataset);
        return nullptr;
    }

    // Create fields
    for (const auto& spec : config.fields) {
        OGRFieldDefnH field = OGR_Fld_Create(spec.output_name.c_str(), GDALUtils::toOGRFieldType(spec.type));
        OGRErr err = OGR_L_CreateField(layer, field, 1);
        OGR_Fld_Destroy(field);
        if (err != OGRERR_NONE) {
            last_error_ = "Failed to create field: " + spec.output_name;
            layer = nullptr;
            GDALClose(dataset);
            return nullptr;
        }
    }

    return dataset;
}

void OgrLayerWriter::setFieldValue(OGRFeatureH feature, int field_index, const OgrFieldSpec& spec, const Json& value) {
    if (value.is_null()) {
        OGR_F_SetFieldNull(feature, field_index);
        return;
    }

    switch (spec.type) {
        case SpatialFieldType::INTEGER64:
            if (value.is_number_unsigned()) {
                OGR_F_SetFieldInteger64(feature, field_index, static_cast<GIntBig>(value.get<unsigned long long>()));
                return;
            }
            if (value.is_number_integer()) {
                OGR_F_SetFieldInteger64(feature, field_index, static_cast<GIntBig>(value.get<long long>()));
                return;
            }
            if (value.is_number_float()) {
                OGR_F_SetFieldDouble(feature, field_index, value.get<double>());
                return;
            }
            break;
        case SpatialFieldType::REAL:
            if (value.is_number()) {
                OGR_F_SetFieldDouble(feature, field_index, value.get<double>());
                return;
            }
            break;
        case SpatialFieldType::STRING:
            break;
    }

    // Strings and anything else go through OGR's own text conversion
    OGR_F_SetFieldString(feature, field_index, formatTextValue(value).c_str());
}

bool OgrLayerWriter::writeFeature(OGRLayerH layer, const OgrLayerWriterConfig& config, const Record& record) {
    // Create feature
    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer);
    FeaturePtr feature(OGR_F_Create(layer_defn));
    if (!feature) {
        last_error_ = "Failed to create feature";
        return false;
    }

    // Set geometry
    auto geometry_it = record.find(GEOMETRY_FIELD);
    if (geometry_it != record.end() && !geometry_it->is_null()) {
        std::string geometry_json = geometry_it->dump();
        OGRGeometryH geometry = OGR_G_CreateGeometryFromJson(geometry_json.c_str());
        if (!geometry) {
            last_error_ = "Failed to build geometry from: " + geometry_json;
            return false;
        }
        OGR_F_SetGeometryDirectly(feature.get(), geometry);
    }

    // Set fields
    for (const auto& spec : config.fields) {
        int field_index = OGR_F_GetFieldIndex(feature.get(), spec.output_name.c_str());
        if (field_index < 0) {
            last_error_ = "Layer has no field named " + spec.output_name;
            return false;
        }
        auto value_it = record.find(spec.source_id);
        if (value_it == record.end()) {
            OGR_F_SetFieldNull(feature.get(), field_index);
            continue;
        }
        setFieldValue(feature.get(), field_index, spec, *value_it);
    }

    // Create feature in layer
    if (OGR_L_CreateFeature(layer, feature.get()) != OGRERR_NONE) {
        last_error_ = "Failed to create feature in layer (" + std::string(CPLGetLastErrorMsg()) + ")";
        return false;
    }

    return true;
}

bool OgrLayerWriter::writeRecords(const OgrLayerWriterConfig& config, RecordStream& records) {
    clearError();
    written_count_ = 0;

    if (!GDALUtils::isDriverAvailable(config.driver_name)) {
        last_error_ = "GDAL driver unavailable: " + config.driver_name;
        return false;
    }

    OGRLayerH layer = nullptr;
    DatasetPtr dataset(createGDALDataset(config, layer));
    if (!dataset) {
        // createGDALDataset already sets last_error_ if it fails
        return false;
    }

    // Write features
    Record record;
    while (records.next(record)) {
        if (!writeFeature(layer, config, record)) {
            return false;
        }
        written_count_++;
    }

    // Close dataset so the driver flushes everything to disk
    CPLErrorReset();
    GDALClose(dataset.release());
    if (CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal) {
        last_error_ = "Failed to finalize dataset " + config.output_file_path + ": " + CPLGetLastErrorMsg();
        return false;
    }

    return true;
}

} // namespace io
} // namespace iotrans
