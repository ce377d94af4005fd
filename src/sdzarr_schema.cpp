#include "sdzarr_schema.h"

#include <algorithm>

#include "cpl_string.h"
#include "sdzarr_errors.h"

using SDZarrErrorUtils::ErrorHandler;

namespace SDZarr
{
namespace
{
bool IsObject(const CPLJSONObject& obj)
{
    return obj.IsValid() && obj.GetType() == CPLJSONObject::Type::Object;
}

bool IsArray(const CPLJSONObject& obj)
{
    return obj.IsValid() && obj.GetType() == CPLJSONObject::Type::Array;
}

bool IsString(const CPLJSONObject& obj)
{
    return obj.IsValid() && obj.GetType() == CPLJSONObject::Type::String;
}

/** Optional transformation list: absent is fine, present must parse */
std::vector<CoordinateTransformation> ReadTransformations(const CPLJSONObject& oParent, const std::string& osContext,
                                                          std::vector<std::string>& aosIssues)
{
    const CPLJSONObject oList = oParent.GetObj("coordinateTransformations");
    if (!oList.IsValid())
        return {};
    auto oParsed = CoordinateTransformation::ParseList(oList);
    if (oParsed.IsErr())
    {
        aosIssues.push_back(osContext + ".coordinateTransformations: " + oParsed.Error());
        return {};
    }
    return oParsed.Unwrap();
}

std::vector<std::string> ReadStringOrStrings(const CPLJSONObject& obj)
{
    std::vector<std::string> aosValues;
    if (IsString(obj))
    {
        aosValues.push_back(obj.ToString());
    }
    else if (IsArray(obj))
    {
        const CPLJSONArray oArray = obj.ToArray();
        for (int i = 0; i < oArray.Size(); ++i)
        {
            if (IsString(oArray[i]))
                aosValues.push_back(oArray[i].ToString());
        }
    }
    return aosValues;
}
}  // namespace

const std::vector<std::string>& ElementSchemaNormalizer::GetSupportedRasterVersions()
{
    static const std::vector<std::string> aosVersions = {"0.1", "0.2"};
    return aosVersions;
}

CPLJSONObject ElementSchemaNormalizer::PromoteOmeEnvelope(const CPLJSONObject& oAttrs)
{
    const CPLJSONObject oOme = oAttrs.GetObj("ome");
    if (!IsObject(oOme) || !oOme.GetObj("multiscales").IsValid())
        return oAttrs;

    CPLJSONObject oPromoted;
    for (const auto& oChild : oAttrs.GetChildren())
    {
        if (oChild.GetName() != "ome")
            oPromoted.AddNoSplitName(oChild.GetName(), oChild);
    }
    for (const auto& oChild : oOme.GetChildren())
    {
        oPromoted.Delete(oChild.GetName());
        oPromoted.AddNoSplitName(oChild.GetName(), oChild);
    }
    return oPromoted;
}

SpatialDataAttrs ElementSchemaNormalizer::ExtractSpatialDataAttrs(const CPLJSONObject& oAttrs,
                                                                   std::vector<std::string>& aosIssues)
{
    SpatialDataAttrs oSpatialData;
    const CPLJSONObject oBlock = oAttrs.GetObj("spatialdata_attrs");
    if (!oBlock.IsValid())
        return oSpatialData;
    if (!IsObject(oBlock))
    {
        aosIssues.push_back("spatialdata_attrs is not an object");
        return oSpatialData;
    }

    oSpatialData.bPresent = true;
    oSpatialData.oRaw = oBlock;

    const CPLJSONObject oVersion = oBlock.GetObj("version");
    if (IsString(oVersion))
        oSpatialData.osVersion = oVersion.ToString();
    else if (oVersion.IsValid())
        aosIssues.push_back("spatialdata_attrs.version is not a string");

    const CPLJSONObject oSystems = oBlock.GetObj("coordinateSystems");
    if (IsObject(oSystems))
        oSpatialData.oCoordinateSystems = oSystems;
    else if (oSystems.IsValid())
        aosIssues.push_back("spatialdata_attrs.coordinateSystems is not an object");

    return oSpatialData;
}

void ElementSchemaNormalizer::ValidateRaster(const CPLJSONObject& oAttrs, RasterAttrs& oRaster,
                                             std::vector<std::string>& aosIssues)
{
    const CPLJSONObject oMultiscales = oAttrs.GetObj("multiscales");
    if (!IsArray(oMultiscales) || oMultiscales.ToArray().Size() == 0)
    {
        aosIssues.push_back("multiscales must be a non-empty array");
    }
    else
    {
        const CPLJSONArray oArray = oMultiscales.ToArray();
        for (int i = 0; i < oArray.Size(); ++i)
        {
            const CPLJSONObject oMs = oArray[i];
            const std::string osCtx = CPLSPrintf("multiscales[%d]", i);
            if (!IsObject(oMs))
            {
                aosIssues.push_back(osCtx + " is not an object");
                continue;
            }

            Multiscale oMultiscale;
            const CPLJSONObject oName = oMs.GetObj("name");
            if (IsString(oName))
                oMultiscale.osName = oName.ToString();
            else if (oName.IsValid())
                aosIssues.push_back(osCtx + ".name is not a string");

            const CPLJSONObject oAxes = oMs.GetObj("axes");
            if (!IsArray(oAxes))
            {
                aosIssues.push_back(osCtx + ".axes is missing");
            }
            else
            {
                const CPLJSONArray oAxisArray = oAxes.ToArray();
                if (oAxisArray.Size() < 2 || oAxisArray.Size() > 5)
                    aosIssues.push_back(osCtx + CPLSPrintf(".axes has %d entries, expected 2 to 5", oAxisArray.Size()));
                for (int j = 0; j < oAxisArray.Size(); ++j)
                {
                    const CPLJSONObject oAxis = oAxisArray[j];
                    AxisInfo oInfo;
                    if (IsString(oAxis))
                    {
                        oInfo.osName = oAxis.ToString();
                    }
                    else if (IsObject(oAxis) && IsString(oAxis.GetObj("name")))
                    {
                        oInfo.osName = oAxis.GetString("name");
                        oInfo.osType = oAxis.GetString("type");
                        oInfo.osUnit = oAxis.GetString("unit");
                    }
                    else
                    {
                        aosIssues.push_back(osCtx + CPLSPrintf(".axes[%d] has no name", j));
                        continue;
                    }
                    oMultiscale.aoAxes.push_back(oInfo);
                }
            }

            const CPLJSONObject oDatasets = oMs.GetObj("datasets");
            if (!IsArray(oDatasets) || oDatasets.ToArray().Size() == 0)
            {
                aosIssues.push_back(osCtx + ".datasets must be a non-empty array");
            }
            else
            {
                const CPLJSONArray oDatasetArray = oDatasets.ToArray();
                for (int j = 0; j < oDatasetArray.Size(); ++j)
                {
                    const CPLJSONObject oDataset = oDatasetArray[j];
                    const std::string osDsCtx = osCtx + CPLSPrintf(".datasets[%d]", j);
                    if (!IsObject(oDataset) || !IsString(oDataset.GetObj("path")))
                    {
                        aosIssues.push_back(osDsCtx + " has no path");
                        continue;
                    }
                    MultiscaleDataset oLevel;
                    oLevel.osPath = oDataset.GetString("path");
                    oLevel.aoTransformations = ReadTransformations(oDataset, osDsCtx, aosIssues);
                    oMultiscale.aoDatasets.push_back(std::move(oLevel));
                }
            }

            oMultiscale.aoTransformations = ReadTransformations(oMs, osCtx, aosIssues);
            oRaster.aoMultiscales.push_back(std::move(oMultiscale));
        }
    }

    const CPLJSONObject oOmero = oAttrs.GetObj("omero");
    if (IsObject(oOmero))
    {
        oRaster.oOmero = oOmero;
        const CPLJSONObject oChannels = oOmero.GetObj("channels");
        if (IsArray(oChannels))
        {
            const CPLJSONArray oChannelArray = oChannels.ToArray();
            for (int i = 0; i < oChannelArray.Size(); ++i)
            {
                if (!IsObject(oChannelArray[i]))
                {
                    aosIssues.push_back(CPLSPrintf("omero.channels[%d] is not an object", i));
                    continue;
                }
                oRaster.aosChannelLabels.push_back(oChannelArray[i].GetString("label"));
            }
        }
        else if (oChannels.IsValid())
        {
            aosIssues.push_back("omero.channels is not an array");
        }
    }
    else if (oOmero.IsValid())
    {
        aosIssues.push_back("omero is not an object");
    }
}

void ElementSchemaNormalizer::ValidateVector(const CPLJSONObject& oAttrs, VectorAttrs& oVector,
                                             std::vector<std::string>& aosIssues)
{
    const CPLJSONObject oEncoding = oAttrs.GetObj("encoding-type");
    if (IsString(oEncoding))
        oVector.osEncodingType = oEncoding.ToString();
    else
        aosIssues.push_back("encoding-type must be a string");

    const CPLJSONObject oAxes = oAttrs.GetObj("axes");
    if (!IsArray(oAxes))
    {
        aosIssues.push_back("axes must be an array of strings");
    }
    else
    {
        const CPLJSONArray oAxisArray = oAxes.ToArray();
        for (int i = 0; i < oAxisArray.Size(); ++i)
        {
            if (IsString(oAxisArray[i]))
                oVector.aosAxes.push_back(oAxisArray[i].ToString());
            else
                aosIssues.push_back(CPLSPrintf("axes[%d] is not a string", i));
        }
    }

    oVector.aoTransformations = ReadTransformations(oAttrs, "attributes", aosIssues);
}

TableAttrs ElementSchemaNormalizer::ExtractTable(const CPLJSONObject& oAttrs)
{
    TableAttrs oTable;
    // Region annotation lives in spatialdata_attrs in current stores, at top level in older ones
    const CPLJSONObject oBlock = oAttrs.GetObj("spatialdata_attrs");
    const CPLJSONObject& oSource = IsObject(oBlock) ? oBlock : oAttrs;

    oTable.osInstanceKey = oSource.GetString("instance_key");
    oTable.osRegionKey = oSource.GetString("region_key");
    oTable.aosRegions = ReadStringOrStrings(oSource.GetObj("region"));
    oTable.osEncodingType = oAttrs.GetString("spatialdata-encoding-type", oAttrs.GetString("encoding-type"));
    oTable.osEncodingVersion = oAttrs.GetString("encoding-version");
    return oTable;
}

bool ElementSchemaNormalizer::CheckFormat(ElementKind eKind, const CPLJSONObject& oAttrs,
                                          const SpatialDataAttrs& oSpatialData, SchemaError& oError)
{
    oError.eKind = SchemaError::Kind::UnsupportedFormat;
    oError.osElementKind = ElementKindToString(eKind);
    oError.osVersion = oSpatialData.osVersion;

    const std::string& osVersion = oSpatialData.osVersion;
    switch (eKind)
    {
        case ElementKind::Images:
        case ElementKind::Labels:
        {
            const auto& aosSupported = GetSupportedRasterVersions();
            return osVersion.empty() ||
                   std::find(aosSupported.begin(), aosSupported.end(), osVersion) != aosSupported.end();
        }

        case ElementKind::Shapes:
        {
            const CPLJSONObject oEncoding = oAttrs.GetObj("encoding-type");
            if (IsString(oEncoding) && oEncoding.ToString() != "ngff:shapes")
            {
                oError.osEncodingType = oEncoding.ToString();
                return false;
            }
            if (osVersion.empty() || osVersion == "0.2")
                return true;
            if (osVersion == "0.1")
            {
                // Version 0.1 only encodes circles as points
                const CPLJSONObject oGeos = oSpatialData.oRaw.GetObj("geos");
                if (IsObject(oGeos) && oGeos.GetString("name") == "POINT" && oGeos.GetInteger("type", -1) == 0)
                    return true;
                oError.osEncodingType = "ngff:shapes (geos other than POINT)";
            }
            return false;
        }

        case ElementKind::Points:
        {
            const CPLJSONObject oEncoding = oAttrs.GetObj("encoding-type");
            if (IsString(oEncoding) && oEncoding.ToString() != "ngff:points")
            {
                oError.osEncodingType = oEncoding.ToString();
                return false;
            }
            return osVersion.empty() || osVersion == "0.1";
        }

        case ElementKind::Tables:
            return true;
    }
    return true;
}

Result<NormalizedAttributes, SchemaError> ElementSchemaNormalizer::Normalize(ElementKind eKind,
                                                                             const std::string& key,
                                                                             const CPLJSONObject& oRawAttrs)
{
    NormalizedAttributes oResult;
    oResult.eKind = eKind;

    const CPLJSONObject oRaw = IsObject(oRawAttrs) ? oRawAttrs : CPLJSONObject();

    if (eKind == ElementKind::Tables)
    {
        oResult.oAttrs = oRaw;
        oResult.oSpatialData = ExtractSpatialDataAttrs(oRaw, oResult.aosIssues);
        oResult.aosIssues.clear();
        oResult.oPayload = ExtractTable(oRaw);
        return oResult;
    }

    CPLJSONObject oCandidate = IsRasterKind(eKind) ? PromoteOmeEnvelope(oRaw) : oRaw;

    std::vector<std::string> aosIssues;
    SpatialDataAttrs oSpatialData = ExtractSpatialDataAttrs(oCandidate, aosIssues);
    if (IsRasterKind(eKind))
    {
        RasterAttrs oRaster;
        ValidateRaster(oCandidate, oRaster, aosIssues);
        oResult.oPayload = std::move(oRaster);
    }
    else
    {
        VectorAttrs oVector;
        ValidateVector(oCandidate, oVector, aosIssues);
        oResult.oPayload = std::move(oVector);
    }

    SchemaError oError;
    oError.osElementKey = key;
    if (!CheckFormat(eKind, oCandidate, oSpatialData, oError))
    {
        ErrorHandler::Debug(oError.ToString());
        return Err(oError);
    }

    oResult.oSpatialData = oSpatialData;
    if (aosIssues.empty())
    {
        oResult.bValidated = true;
        oResult.oAttrs = oCandidate;
    }
    else
    {
        ErrorHandler::ReportSchemaFallback(ElementKindToString(eKind), key, aosIssues);
        oResult.bValidated = false;
        oResult.aosIssues = std::move(aosIssues);
        oResult.oAttrs = oRaw;
    }
    return oResult;
}
}  // namespace SDZarr
