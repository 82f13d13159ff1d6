#ifndef IOTRANS_GEOMETRY_TRANSFORM_HPP
#define IOTRANS_GEOMETRY_TRANSFORM_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <ogr_api.h>
#include <ogr_spatialref.h>
#include "core/config.hpp"
#include "core/types.hpp"

namespace iotrans {
namespace geometry {

/**
 * Coordinate transformation between two reference systems, one position at a time
 */
class Reprojector {
public:
    virtual ~Reprojector() = default;

    /**
     * Transform a single position in place
     * @param x Easting or longitude
     * @param y Northing or latitude
     * @param z Height (0 when the position is 2D)
     * @return true if successful, false otherwise
     */
    virtual bool transform(double& x, double& y, double& z) = 0;
};

/**
 * Reprojector backed by an OGR coordinate transformation between two EPSG codes
 */
class OgrReprojector : public Reprojector {
public:
    /**
     * @param source_epsg EPSG code of the input coordinates
     * @param target_epsg EPSG code of the output coordinates
     * @throws IoError if either reference system or the transformation cannot be created
     */
    OgrReprojector(int source_epsg, int target_epsg);
    ~OgrReprojector() override;

    // Disable copy constructor and assignment
    OgrReprojector(const OgrReprojector&) = delete;
    OgrReprojector& operator=(const OgrReprojector&) = delete;

    bool transform(double& x, double& y, double& z) override;

private:
    OGRCoordinateTransformationH coord_trans_;
};

/**
 * Per-record geometry normalization for spatial outputs:
 * parse, promote single types to their Multi form, handle degenerate points
 * and reproject every position.
 */
class GeometryTransformer {
public:
    /**
     * @param tables Conversion tables (multi-geometry table)
     * @param reprojector Transformation to apply; null when source and target CRS match
     */
    GeometryTransformer(const ConversionTables& tables, std::unique_ptr<Reprojector> reprojector);

    // Disable copy constructor and assignment
    GeometryTransformer(const GeometryTransformer&) = delete;
    GeometryTransformer& operator=(const GeometryTransformer&) = delete;

    /**
     * Normalize one geometry value
     * @param value Geometry object, JSON-encoded geometry string or null
     * @return Structured geometry, or null for a null geometry
     * @throws SchemaError if the geometry is malformed or cannot be reprojected
     */
    Json transform(const Json& value);

    /**
     * Normalize the geometry field of a record in place (a missing field becomes null)
     * @param record Record to update
     */
    void transformRecord(Record& record);

    /**
     * Number of positions passed to the reprojector so far
     */
    size_t getReprojectedCount() const { return reprojected_count_; }

    /**
     * Parse a raw geometry value
     * @param value Geometry object or JSON-encoded string
     * @return Parsed geometry, or null for null/missing/""/"null"/"None"
     * @throws SchemaError if the value is neither an object nor parsable JSON text
     */
    static Json parseGeometry(const Json& value);

    /**
     * Serialize a normalized geometry to compact text with square-bracket coordinates
     * @param geometry Normalized geometry
     * @return Text form; empty for a null geometry
     */
    static std::string geometryToText(const Json& geometry);

private:
    const ConversionTables& tables_;
    std::unique_ptr<Reprojector> reprojector_;
    size_t reprojected_count_;

    Json transformGeometry(const Json& geometry, bool promote);
    void reprojectCoordinates(Json& coordinates);
    void reprojectPosition(Json& position);
};

} // namespace geometry
} // namespace iotrans

#endif // IOTRANS_GEOMETRY_TRANSFORM_HPP
