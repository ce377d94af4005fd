#include "sdzarr_resolver.h"

#include <algorithm>

#include "sdzarr_errors.h"

using SDZarrErrorUtils::ErrorHandler;

namespace SDZarr
{
namespace
{
/**
 * @brief Transformations gathered from an element, before chain assembly
 */
struct TransformationSources
{
    std::map<std::string, CoordinateTransformation> oExplicit;
    std::map<std::string, std::vector<CoordinateTransformation>> oTargeted;
    std::vector<CoordinateTransformation> aoUntargeted;
    std::vector<CoordinateTransformation> aoLevel;
    std::map<std::string, std::string> oInvalid;  // system name -> parse error
};

CoordinateTransformation Collapse(std::vector<CoordinateTransformation> aoChain)
{
    if (aoChain.empty())
        return CoordinateTransformation::Identity();
    if (aoChain.size() == 1)
        return aoChain.front();
    return CoordinateTransformation::Sequence(std::move(aoChain));
}

void SplitByOutput(const std::vector<CoordinateTransformation>& aoTransforms, TransformationSources& oSources)
{
    for (const auto& oTransform : aoTransforms)
    {
        if (oTransform.GetOutput().IsSet())
            oSources.oTargeted[oTransform.GetOutput().osName].push_back(oTransform);
        else
            oSources.aoUntargeted.push_back(oTransform);
    }
}

TransformationSources CollectSources(const Element& oElement, int nLevel)
{
    TransformationSources oSources;
    const NormalizedAttributes& oAttrs = oElement.GetAttributes();

    const CPLJSONObject& oSystems = oAttrs.oSpatialData.oCoordinateSystems;
    if (oSystems.IsValid() && oSystems.GetType() == CPLJSONObject::Type::Object)
    {
        for (const auto& oEntry : oSystems.GetChildren())
        {
            auto oParsed = CoordinateTransformation::ParseList(oEntry);
            if (oParsed.IsErr())
            {
                oSources.oInvalid[oEntry.GetName()] = oParsed.Error();
                continue;
            }
            oSources.oExplicit[oEntry.GetName()] = Collapse(oParsed.Unwrap());
        }
    }

    if (const RasterAttrs* poRaster = oElement.GetRasterAttrs())
    {
        if (!poRaster->aoMultiscales.empty())
        {
            const Multiscale& oMs = poRaster->aoMultiscales.front();
            SplitByOutput(oMs.aoTransformations, oSources);
            if (!oMs.aoDatasets.empty())
            {
                const size_t nIndex = std::min(static_cast<size_t>(std::max(nLevel, 0)), oMs.aoDatasets.size() - 1);
                oSources.aoLevel = oMs.aoDatasets[nIndex].aoTransformations;
            }
        }
    }
    else if (const VectorAttrs* poVector = oElement.GetVectorAttrs())
    {
        SplitByOutput(poVector->aoTransformations, oSources);
    }
    return oSources;
}

std::map<std::string, CoordinateTransformation> AssembleChains(const TransformationSources& oSources,
                                                               const std::string& osDefaultSystem)
{
    std::set<std::string> oDeclared;
    for (const auto& entry : oSources.oExplicit)
        oDeclared.insert(entry.first);
    for (const auto& entry : oSources.oTargeted)
        oDeclared.insert(entry.first);
    if (oDeclared.empty())
        oDeclared.insert(osDefaultSystem);

    std::map<std::string, CoordinateTransformation> oResolved;
    for (const auto& osSystem : oDeclared)
    {
        std::vector<CoordinateTransformation> aoChain = oSources.aoLevel;

        auto itExplicit = oSources.oExplicit.find(osSystem);
        auto itTargeted = oSources.oTargeted.find(osSystem);
        if (itExplicit != oSources.oExplicit.end())
            aoChain.push_back(itExplicit->second);
        else if (itTargeted != oSources.oTargeted.end())
            aoChain.insert(aoChain.end(), itTargeted->second.begin(), itTargeted->second.end());
        else
            aoChain.insert(aoChain.end(), oSources.aoUntargeted.begin(), oSources.aoUntargeted.end());

        oResolved[osSystem] = Collapse(std::move(aoChain));
    }
    return oResolved;
}

void WarnInvalid(const Element& oElement, const TransformationSources& oSources)
{
    for (const auto& entry : oSources.oInvalid)
    {
        ErrorHandler::ReportWarning("ignoring coordinate system '" + entry.first + "' of " + oElement.GetPath() +
                                    ": " + entry.second);
    }
}
}  // namespace

TransformationResolver::TransformationResolver(std::string osDefaultCoordinateSystem, int nMultiscaleLevel)
    : mDefaultCoordinateSystem(std::move(osDefaultCoordinateSystem)), mMultiscaleLevel(nMultiscaleLevel)
{
}

std::map<std::string, CoordinateTransformation> TransformationResolver::ResolveAll(const Element& oElement) const
{
    if (!IsSpatialKind(oElement.GetKind()))
        return {};

    const TransformationSources oSources = CollectSources(oElement, mMultiscaleLevel);
    WarnInvalid(oElement, oSources);
    return AssembleChains(oSources, mDefaultCoordinateSystem);
}

Result<CoordinateTransformation, ResolutionError> TransformationResolver::Resolve(
    const Element& oElement, const std::optional<std::string>& target) const
{
    TransformationSources oSources;
    std::map<std::string, CoordinateTransformation> oAll;
    if (IsSpatialKind(oElement.GetKind()))
    {
        oSources = CollectSources(oElement, mMultiscaleLevel);
        WarnInvalid(oElement, oSources);
        oAll = AssembleChains(oSources, mDefaultCoordinateSystem);
    }

    std::string osTarget;
    if (target && !target->empty())
        osTarget = *target;
    else if (oAll.count(mDefaultCoordinateSystem) != 0 || oAll.empty())
        osTarget = mDefaultCoordinateSystem;
    else
        osTarget = oAll.begin()->first;

    auto it = oAll.find(osTarget);
    if (it != oAll.end())
        return it->second;

    ResolutionError oError;
    oError.osElementKey = oElement.GetPath();
    oError.osRequested = osTarget;
    for (const auto& entry : oAll)
        oError.aosAvailable.push_back(entry.first);

    // The system is declared but its transformation list does not parse
    auto itInvalid = oSources.oInvalid.find(osTarget);
    if (itInvalid != oSources.oInvalid.end())
    {
        oError.eKind = ResolutionError::Kind::InvalidTransformation;
        oError.osDetail = "coordinate system '" + osTarget + "': " + itInvalid->second;
    }
    else
    {
        oError.eKind = ResolutionError::Kind::CoordinateSystemNotFound;
    }
    ErrorHandler::Debug(oError.ToString());
    return Err(oError);
}

std::set<std::string> TransformationResolver::ResolveAllSystems(
    const std::vector<std::shared_ptr<const Element>>& apoElements) const
{
    std::set<std::string> oSystems;
    for (const auto& poElement : apoElements)
    {
        if (!poElement || !IsSpatialKind(poElement->GetKind()))
            continue;
        for (const auto& entry : ResolveAll(*poElement))
            oSystems.insert(entry.first);
    }
    return oSystems;
}
}  // namespace SDZarr
