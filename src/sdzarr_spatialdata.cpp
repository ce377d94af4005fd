#include "sdzarr_spatialdata.h"

#include "sdzarr_errors.h"
#include "sdzarr_gdal_store.h"
#include "sdzarr_performance.h"

using SDZarrErrorUtils::ErrorHandler;

namespace SDZarr
{
/************************************************************************/
/*                                Open()                                */
/************************************************************************/

Result<std::unique_ptr<SpatialData>, OpenError> SpatialData::Open(const std::string& location,
                                                                  const OpenOptions& oOptions)
{
    StoreLocation oLocation(location);
    return Open(std::make_shared<VSIStoreReader>(oLocation, oOptions.nMaxMetadataSize), oOptions);
}

Result<std::unique_ptr<SpatialData>, OpenError> SpatialData::Open(std::shared_ptr<StoreReader> poReader,
                                                                  const OpenOptions& oOptions)
{
    SDZARR_PERF_TIMER("SpatialData::Open");

    if (!poReader)
    {
        OpenError oError;
        oError.eKind = OpenError::Kind::NoConsolidatedMetadata;
        oError.osDetail = "no store reader";
        ErrorHandler::ReportOpenFailure(oError.osLocation, oError.ToString());
        return Err(oError);
    }

    const StoreLocation oLocation = poReader->GetLocation();
    auto oStore = StoreOpener::Open(oLocation, std::move(poReader));
    if (oStore.IsErr())
    {
        ErrorHandler::ReportOpenFailure(oLocation.GetOriginal(), oStore.Error().ToString());
        return Err(oStore.Error());
    }

    OpenedStore oOpened = oStore.Unwrap();
    auto oTree = TreeBuilder::Build(oOpened);
    if (oTree.IsErr())
    {
        ErrorHandler::ReportStructuralError(oTree.Error().ToString());
        OpenError oError;
        oError.eKind = OpenError::Kind::InvalidStructure;
        oError.osLocation = oLocation.GetOriginal();
        oError.osDetail = oTree.Error().ToString();
        return Err(oError);
    }

    std::unique_ptr<SpatialData> poData(new SpatialData(std::move(oOpened), oTree.Unwrap(), oOptions));
    for (ElementKind eKind : AllElementKinds())
    {
        if (oOptions.IsSelected(eKind))
            poData->LoadElements(eKind);
    }

    ErrorHandler::Debug("opened " + oLocation.GetOriginal() + " from " + poData->GetMetadataVariant() + " (" +
                        std::to_string(poData->mTree->CountNodes()) + " nodes)");
    return Ok(std::move(poData));
}

SpatialData::SpatialData(OpenedStore oStore, std::shared_ptr<ZarrGroupNode> poTree, const OpenOptions& oOptions)
    : mStore(std::move(oStore)),
      mTree(std::move(poTree)),
      mOptions(oOptions),
      mResolver(oOptions.osDefaultCoordinateSystem, oOptions.nMultiscaleLevel)
{
}

/************************************************************************/
/*                            LoadElements()                            */
/************************************************************************/

void SpatialData::LoadElements(ElementKind eKind)
{
    auto poCategory = mTree->GetGroup(ElementKindToString(eKind));
    if (!poCategory)
        return;

    ElementMap& oElements = mElements[eKind];
    for (const auto& entry : poCategory->GetChildren())
    {
        if (!entry.second->IsGroup())
        {
            ErrorHandler::Debug("skipping array '" + entry.second->GetPath() + "' in element category");
            continue;
        }
        auto poGroup = std::static_pointer_cast<const ZarrGroupNode>(entry.second);
        auto oElement = Element::Create(eKind, entry.first, poGroup, mStore.poReader);
        if (oElement.IsErr())
        {
            RecordFailure(eKind, entry.first, oElement.Error().ToString());
            continue;
        }
        oElements[entry.first] = oElement.Unwrap();
    }
}

void SpatialData::RecordFailure(ElementKind eKind, const std::string& key, const std::string& message)
{
    ErrorHandler::ReportElementFailure(ElementKindToString(eKind), key, message);
    mFailures.push_back({eKind, key, message});
    if (mOptions.fnOnBadElement)
        mOptions.fnOnBadElement(eKind, key, message);
}

bool SpatialData::HasKind(ElementKind eKind) const
{
    return mElements.count(eKind) != 0;
}

const SpatialData::ElementMap& SpatialData::GetElements(ElementKind eKind) const
{
    static const ElementMap oEmpty;
    auto it = mElements.find(eKind);
    return it == mElements.end() ? oEmpty : it->second;
}

std::shared_ptr<Element> SpatialData::GetElement(ElementKind eKind, const std::string& key) const
{
    const ElementMap& oElements = GetElements(eKind);
    auto it = oElements.find(key);
    return it == oElements.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const Element>> SpatialData::GetSpatialElements() const
{
    std::vector<std::shared_ptr<const Element>> apoElements;
    for (const auto& entry : mElements)
    {
        if (!IsSpatialKind(entry.first))
            continue;
        for (const auto& element : entry.second)
            apoElements.push_back(element.second);
    }
    return apoElements;
}

std::set<std::string> SpatialData::GetCoordinateSystems() const
{
    return mResolver.ResolveAllSystems(GetSpatialElements());
}

/************************************************************************/
/*                              ToString()                              */
/************************************************************************/

std::string SpatialData::ToString() const
{
    std::string osText = "SpatialData object, with associated Zarr store: " + mStore.oLocation.GetOriginal() + "\n";
    if (mElements.empty())
        return osText + "(No elements loaded)";

    osText += "Elements:\n";
    size_t iKind = 0;
    for (const auto& entry : mElements)
    {
        const bool bLastKind = ++iKind == mElements.size();
        osText += std::string(bLastKind ? "└── " : "├── ") + ElementKindToString(entry.first) + ":";
        if (entry.second.empty())
            osText += " (empty)";
        osText += "\n";

        const char* pszChildPrefix = bLastKind ? "    " : "│   ";
        size_t iElement = 0;
        for (const auto& element : entry.second)
        {
            const bool bLastElement = ++iElement == entry.second.size();
            osText += std::string(pszChildPrefix) + (bLastElement ? "└── " : "├── ") + element.first + "\n";
        }
    }

    osText += "with coordinate systems: ";
    bool bFirst = true;
    for (const auto& osSystem : GetCoordinateSystems())
    {
        if (!bFirst)
            osText += ", ";
        osText += osSystem;
        bFirst = false;
    }
    return osText;
}

CPLJSONObject SpatialData::ToJSON() const
{
    return SerializeTree(*mTree);
}
}  // namespace SDZarr
