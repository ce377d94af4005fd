#include "sdzarr_store.h"

#include "cpl_json.h"
#include "cpl_string.h"
#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"
#include "sdzarr_performance.h"

using SDZarrErrorUtils::ErrorHandler;
using SDZarrErrorUtils::QuietErrorScope;
using SDZarrPathUtils::PathParser;

namespace SDZarr
{
StoreLocation::StoreLocation(const std::string& location) : mOriginal(location)
{
    mPath = PathParser::Parse(location).vsiPath;
}

bool StoreLocation::IsRemote() const
{
    return SDZarrPerformanceUtils::IsNetworkPath(mPath);
}

std::string StoreLocation::Resolve(const std::string& relativePath) const
{
    return PathParser::Join(mPath, relativePath);
}

const std::vector<StoreOpener::ProbeVariant>& StoreOpener::GetProbeVariants()
{
    static const std::vector<ProbeVariant> aoVariants = {
        {"zarr.json", MetadataShape::V3Envelope},
        {".zmetadata", MetadataShape::Flat},
        {"zmetadata", MetadataShape::Flat},
    };
    return aoVariants;
}

Result<OpenedStore, OpenError> StoreOpener::Open(const StoreLocation& oLocation, std::shared_ptr<StoreReader> poReader)
{
    SDZARR_PERF_TIMER("StoreOpener::Open");

    OpenError oError;
    oError.eKind = OpenError::Kind::NoConsolidatedMetadata;
    oError.osLocation = oLocation.GetOriginal();

    if (!poReader)
    {
        oError.osDetail = "no store reader";
        return Err(oError);
    }

    for (const auto& oVariant : GetProbeVariants())
    {
        ErrorHandler::Debug(std::string("Probing ") + oVariant.pszFileName + " in " + oLocation.GetPath());

        CPLJSONDocument oDoc;
        std::string osReason;
        {
            QuietErrorScope oQuiet;
            auto oBytes = poReader->Fetch(oVariant.pszFileName);
            if (oBytes.IsErr())
                osReason = oBytes.Error();
            else if (!oDoc.LoadMemory(oBytes.Value()))
                osReason = "not a JSON document";
        }

        // A zarr.json that is neither an envelope nor a metadata map is a
        // plain group document, probing goes on
        if (osReason.empty() && oVariant.eShape == MetadataShape::V3Envelope &&
            MetadataNormalizer::DetectShape(oDoc.GetRoot()) == MetadataShape::Unknown)
        {
            osReason = "no consolidated_metadata";
        }

        if (!osReason.empty())
        {
            ErrorHandler::Debug(std::string(oVariant.pszFileName) + " absent: " + osReason);
            oError.aoAttempts.push_back({oVariant.pszFileName, osReason});
            continue;
        }

        auto oNormalized = MetadataNormalizer::Normalize(oDoc.GetRoot(), oVariant.eShape);
        if (oNormalized.IsErr())
        {
            oError.eKind = OpenError::Kind::InvalidMetadata;
            oError.aoAttempts.push_back({oVariant.pszFileName, oNormalized.Error().osReason});
            oError.osDetail = std::string(oVariant.pszFileName) + ": " + oNormalized.Error().ToString();
            return Err(oError);
        }

        ErrorHandler::Debug(CPLSPrintf("Opened %s with %s (%d nodes)", oLocation.GetPath().c_str(),
                                       oVariant.pszFileName,
                                       static_cast<int>(oNormalized.Value().GetNodeCount())));

        OpenedStore oStore;
        oStore.oLocation = oLocation;
        oStore.poReader = std::move(poReader);
        oStore.oMetadata = oNormalized.Unwrap();
        oStore.osVariant = oVariant.pszFileName;
        return oStore;
    }

    return Err(oError);
}
}  // namespace SDZarr
