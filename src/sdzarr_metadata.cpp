#include "sdzarr_metadata.h"

#include "cpl_string.h"

#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"

using SDZarrErrorUtils::ErrorHandler;
using SDZarrPathUtils::PathParser;

namespace SDZarr
{
namespace
{
CPLJSONObject MissingObject()
{
    CPLJSONObject oEmpty;
    return oEmpty.GetObj("missing");
}

bool IsObject(const CPLJSONObject& obj)
{
    return obj.IsValid() && obj.GetType() == CPLJSONObject::Type::Object;
}

bool IsMetadataSuffix(const std::string& name)
{
    return name == MetadataNormalizer::ATTRS_KEY || name == MetadataNormalizer::ARRAY_KEY ||
           name == MetadataNormalizer::GROUP_KEY;
}
}  // namespace

const char* MetadataShapeToString(MetadataShape eShape)
{
    switch (eShape)
    {
        case MetadataShape::Auto:
            return "auto";
        case MetadataShape::Nested:
            return "nested";
        case MetadataShape::Flat:
            return "flat";
        case MetadataShape::V3Envelope:
            return "v3-envelope";
        case MetadataShape::Unknown:
            break;
    }
    return "unknown";
}

/* ------------------------------------------------------------------ */
/*      ConsolidatedMetadata                                           */
/* ------------------------------------------------------------------ */

ConsolidatedMetadata::ConsolidatedMetadata(const CPLJSONObject& oRoot) : mRoot(oRoot)
{
    const CPLJSONObject oMetadata = mRoot.GetObj("metadata");
    if (!IsObject(oMetadata))
        return;

    // GetObj() splits on '/', so node records are indexed from the children list
    for (const auto& oChild : oMetadata.GetChildren())
    {
        if (oChild.GetType() != CPLJSONObject::Type::Object)
            continue;
        mNodes[PathParser::NormalizeNodePath(oChild.GetName())] = oChild;
    }
}

std::vector<std::string> ConsolidatedMetadata::GetPaths() const
{
    std::vector<std::string> paths;
    paths.reserve(mNodes.size());
    for (const auto& entry : mNodes)
        paths.push_back(entry.first);
    return paths;
}

bool ConsolidatedMetadata::HasNode(const std::string& path) const
{
    return mNodes.find(PathParser::NormalizeNodePath(path)) != mNodes.end();
}

CPLJSONObject ConsolidatedMetadata::GetNode(const std::string& path) const
{
    auto it = mNodes.find(PathParser::NormalizeNodePath(path));
    if (it == mNodes.end())
        return MissingObject();
    return it->second;
}

CPLJSONObject ConsolidatedMetadata::GetAttributes(const std::string& path) const
{
    return GetNode(path).GetObj(MetadataNormalizer::ATTRS_KEY);
}

CPLJSONObject ConsolidatedMetadata::GetArrayDescriptor(const std::string& path) const
{
    return GetNode(path).GetObj(MetadataNormalizer::ARRAY_KEY);
}

bool ConsolidatedMetadata::IsArray(const std::string& path) const
{
    return GetArrayDescriptor(path).IsValid();
}

/* ------------------------------------------------------------------ */
/*      MetadataNormalizer                                             */
/* ------------------------------------------------------------------ */

bool MetadataNormalizer::SplitFlatKey(const std::string& key, std::string& path, std::string& suffix)
{
    const size_t nSlash = key.rfind('/');
    const std::string osLast = nSlash == std::string::npos ? key : key.substr(nSlash + 1);
    if (!IsMetadataSuffix(osLast))
        return false;

    suffix = osLast;
    path = nSlash == std::string::npos ? std::string() : PathParser::NormalizeNodePath(key.substr(0, nSlash));
    return true;
}

bool MetadataNormalizer::HasConsolidatedEnvelope(const CPLJSONObject& oDoc)
{
    if (!IsObject(oDoc))
        return false;
    const CPLJSONObject oConsolidated = oDoc.GetObj("consolidated_metadata");
    return IsObject(oConsolidated) && IsObject(oConsolidated.GetObj("metadata"));
}

bool MetadataNormalizer::MatchesShape(const CPLJSONObject& oDoc, MetadataShape eShape)
{
    if (eShape == MetadataShape::V3Envelope)
        return HasConsolidatedEnvelope(oDoc);

    const CPLJSONObject oMetadata = oDoc.GetObj("metadata");
    if (!IsObject(oMetadata))
        return false;

    bool bAnySuffixed = false;
    bool bAllRecords = true;
    for (const auto& oChild : oMetadata.GetChildren())
    {
        std::string osPath;
        std::string osSuffix;
        if (SplitFlatKey(oChild.GetName(), osPath, osSuffix))
            bAnySuffixed = true;
        if (oChild.GetType() != CPLJSONObject::Type::Object)
            bAllRecords = false;
    }

    if (eShape == MetadataShape::Flat)
        return bAnySuffixed;
    if (eShape == MetadataShape::Nested)
        return !bAnySuffixed && bAllRecords;
    return false;
}

MetadataShape MetadataNormalizer::DetectShape(const CPLJSONObject& oDoc)
{
    if (!IsObject(oDoc))
        return MetadataShape::Unknown;
    for (MetadataShape eShape : {MetadataShape::V3Envelope, MetadataShape::Nested, MetadataShape::Flat})
    {
        if (MatchesShape(oDoc, eShape))
            return eShape;
    }
    return MetadataShape::Unknown;
}

CPLJSONObject MetadataNormalizer::NormalizeFlat(const CPLJSONObject& oDoc)
{
    std::map<std::string, CPLJSONObject> oRecords;
    size_t nDropped = 0;

    for (const auto& oChild : oDoc.GetObj("metadata").GetChildren())
    {
        std::string osPath;
        std::string osSuffix;
        if (!SplitFlatKey(oChild.GetName(), osPath, osSuffix))
        {
            ++nDropped;
            continue;
        }
        // Suffix keys contain no '/', so Add() is safe here
        oRecords[osPath].Add(osSuffix, oChild);
    }

    CPLJSONObject oMetadata;
    for (const auto& entry : oRecords)
        oMetadata.AddNoSplitName(entry.first, entry.second);

    CPLJSONObject oResult;
    oResult.Add("metadata", oMetadata);
    const CPLJSONObject oFormat = oDoc.GetObj("zarr_consolidated_format");
    if (oFormat.IsValid())
        oResult.Add("zarr_consolidated_format", oFormat);

    ErrorHandler::Debug(CPLSPrintf("Normalized flat metadata: %d nodes, %d unrecognized keys dropped",
                                   static_cast<int>(oRecords.size()), static_cast<int>(nDropped)));
    return oResult;
}

CPLJSONObject MetadataNormalizer::NormalizeV3(const CPLJSONObject& oDoc)
{
    CPLJSONObject oMetadata;

    CPLJSONObject oRootRecord;
    CPLJSONObject oRootGroup;
    oRootGroup.Add("zarr_format", oDoc.GetInteger("zarr_format", 3));
    oRootRecord.Add(GROUP_KEY, oRootGroup);
    const CPLJSONObject oRootAttrs = oDoc.GetObj("attributes");
    if (IsObject(oRootAttrs))
        oRootRecord.Add(ATTRS_KEY, oRootAttrs);
    oMetadata.AddNoSplitName("", oRootRecord);

    int nNodes = 0;
    for (const auto& oNode : oDoc.GetObj("consolidated_metadata").GetObj("metadata").GetChildren())
    {
        if (oNode.GetType() != CPLJSONObject::Type::Object)
            continue;

        CPLJSONObject oRecord;
        const CPLJSONObject oAttrs = oNode.GetObj("attributes");
        if (IsObject(oAttrs))
            oRecord.Add(ATTRS_KEY, oAttrs);

        if (oNode.GetString("node_type") == "array")
        {
            oRecord.Add(ARRAY_KEY, oNode);
        }
        else
        {
            CPLJSONObject oGroup;
            oGroup.Add("zarr_format", oNode.GetInteger("zarr_format", 3));
            oRecord.Add(GROUP_KEY, oGroup);
        }
        oMetadata.AddNoSplitName(PathParser::NormalizeNodePath(oNode.GetName()), oRecord);
        ++nNodes;
    }

    CPLJSONObject oResult;
    oResult.Add("metadata", oMetadata);
    oResult.Add("zarr_consolidated_format", 1);

    ErrorHandler::Debug(CPLSPrintf("Normalized zarr v3 consolidated metadata: %d nodes", nNodes));
    return oResult;
}

Result<ConsolidatedMetadata, NormalizationError> MetadataNormalizer::Normalize(const CPLJSONObject& oDoc,
                                                                               MetadataShape eHint)
{
    if (!IsObject(oDoc))
        return Err(NormalizationError{NormalizationError::Kind::InvalidDocument, "top-level value is not an object"});

    MetadataShape eShape = eHint;
    if (eShape == MetadataShape::Auto || eShape == MetadataShape::Unknown || !MatchesShape(oDoc, eShape))
    {
        eShape = DetectShape(oDoc);
    }

    switch (eShape)
    {
        case MetadataShape::Nested:
            return ConsolidatedMetadata(oDoc);
        case MetadataShape::Flat:
            return ConsolidatedMetadata(NormalizeFlat(oDoc));
        case MetadataShape::V3Envelope:
            return ConsolidatedMetadata(NormalizeV3(oDoc));
        case MetadataShape::Auto:
        case MetadataShape::Unknown:
            break;
    }

    if (!IsObject(oDoc.GetObj("metadata")))
        return Err(NormalizationError{NormalizationError::Kind::InvalidDocument, "no 'metadata' object present"});
    return Err(NormalizationError{NormalizationError::Kind::InvalidDocument,
                                  "'metadata' entries are neither per-node records nor suffixed metadata keys"});
}
}  // namespace SDZarr
