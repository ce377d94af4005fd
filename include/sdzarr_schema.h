#pragma once

#include <string>
#include <variant>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_element_kind.h"
#include "sdzarr_error_types.h"
#include "sdzarr_result.h"
#include "sdzarr_transform.h"

namespace SDZarr
{
struct AxisInfo
{
    std::string osName;
    std::string osType;
    std::string osUnit;
};

/**
 * @brief One resolution level of a multiscale descriptor
 */
struct MultiscaleDataset
{
    std::string osPath;
    std::vector<CoordinateTransformation> aoTransformations;
};

struct Multiscale
{
    std::string osName;
    std::vector<AxisInfo> aoAxes;
    std::vector<MultiscaleDataset> aoDatasets;
    std::vector<CoordinateTransformation> aoTransformations;
};

/**
 * @brief The "spatialdata_attrs" block shared by every element kind
 */
struct SpatialDataAttrs
{
    bool bPresent = false;
    std::string osVersion;
    CPLJSONObject oCoordinateSystems;  // name -> transformation (list), empty when absent
    CPLJSONObject oRaw;
};

struct RasterAttrs
{
    std::vector<Multiscale> aoMultiscales;
    CPLJSONObject oOmero;  // empty object when absent
    std::vector<std::string> aosChannelLabels;
};

/**
 * @brief Attributes of points and shapes elements
 */
struct VectorAttrs
{
    std::string osEncodingType;
    std::vector<std::string> aosAxes;
    std::vector<CoordinateTransformation> aoTransformations;
};

struct TableAttrs
{
    std::string osInstanceKey;
    std::vector<std::string> aosRegions;
    std::string osRegionKey;
    std::string osEncodingType;
    std::string osEncodingVersion;
};

using ElementPayload = std::variant<RasterAttrs, VectorAttrs, TableAttrs>;

/**
 * @brief Schema-normalized attributes of one element
 */
struct NormalizedAttributes
{
    ElementKind eKind = ElementKind::Images;

    /** @brief false when validation failed and oAttrs are the raw attributes */
    bool bValidated = true;
    std::vector<std::string> aosIssues;

    /** @brief Validated attributes (extra fields kept, "ome" envelope promoted), or the raw attributes */
    CPLJSONObject oAttrs;

    SpatialDataAttrs oSpatialData;
    ElementPayload oPayload;
};

/**
 * @brief Validates and migrates the attributes of images, labels, shapes, points and tables
 *
 * Validation problems never fail: they are reported as a warning and the
 * raw attributes are used. Only a declared format version or encoding type
 * that cannot be decoded fails, with SchemaError::UnsupportedFormat.
 */
class ElementSchemaNormalizer
{
  public:
    static Result<NormalizedAttributes, SchemaError> Normalize(ElementKind eKind, const std::string& key,
                                                               const CPLJSONObject& oRawAttrs);

    /**
     * @brief Lift the multiscale descriptor and its siblings out of an "ome" envelope
     * @return the input itself when there is no envelope
     */
    static CPLJSONObject PromoteOmeEnvelope(const CPLJSONObject& oAttrs);

    static const std::vector<std::string>& GetSupportedRasterVersions();

  private:
    static void ValidateRaster(const CPLJSONObject& oAttrs, RasterAttrs& oRaster, std::vector<std::string>& aosIssues);
    static void ValidateVector(const CPLJSONObject& oAttrs, VectorAttrs& oVector, std::vector<std::string>& aosIssues);
    static TableAttrs ExtractTable(const CPLJSONObject& oAttrs);
    static SpatialDataAttrs ExtractSpatialDataAttrs(const CPLJSONObject& oAttrs, std::vector<std::string>& aosIssues);
    static bool CheckFormat(ElementKind eKind, const CPLJSONObject& oAttrs, const SpatialDataAttrs& oSpatialData,
                            SchemaError& oError);
};
}  // namespace SDZarr
