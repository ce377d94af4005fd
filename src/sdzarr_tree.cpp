#include "sdzarr_tree.h"

#include <algorithm>

#include "cpl_string.h"
#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"
#include "sdzarr_performance.h"

using SDZarrErrorUtils::ErrorHandler;
using SDZarrPathUtils::PathParser;

namespace SDZarr
{
namespace
{
CPLJSONObject AttributesOrEmpty(const CPLJSONObject& oAttributes)
{
    if (oAttributes.IsValid() && oAttributes.GetType() == CPLJSONObject::Type::Object)
        return oAttributes;
    return CPLJSONObject();
}
}  // namespace

ZarrTreeNode::ZarrTreeNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes)
    : mName(std::move(osName)), mPath(std::move(osPath)), mAttributes(AttributesOrEmpty(oAttributes))
{
}

/* ------------------------------------------------------------------ */
/*      ZarrGroupNode                                                  */
/* ------------------------------------------------------------------ */

ZarrGroupNode::ZarrGroupNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes)
    : ZarrTreeNode(std::move(osName), std::move(osPath), oAttributes)
{
}

std::shared_ptr<ZarrTreeNode> ZarrGroupNode::GetChild(const std::string& name) const
{
    auto it = mChildren.find(name);
    return it == mChildren.end() ? nullptr : it->second;
}

std::shared_ptr<ZarrGroupNode> ZarrGroupNode::GetGroup(const std::string& name) const
{
    return std::dynamic_pointer_cast<ZarrGroupNode>(GetChild(name));
}

std::shared_ptr<ZarrLeafNode> ZarrGroupNode::GetLeaf(const std::string& name) const
{
    return std::dynamic_pointer_cast<ZarrLeafNode>(GetChild(name));
}

std::shared_ptr<ZarrTreeNode> ZarrGroupNode::Resolve(const std::string& relativePath) const
{
    const auto aosSegments = PathParser::SplitSegments(relativePath);
    if (aosSegments.empty())
        return nullptr;

    const ZarrGroupNode* poGroup = this;
    std::shared_ptr<ZarrTreeNode> poNode;
    for (size_t i = 0; i < aosSegments.size(); ++i)
    {
        if (poGroup == nullptr)
            return nullptr;
        poNode = poGroup->GetChild(aosSegments[i]);
        if (!poNode)
            return nullptr;
        poGroup = poNode->IsGroup() ? static_cast<const ZarrGroupNode*>(poNode.get()) : nullptr;
    }
    return poNode;
}

size_t ZarrGroupNode::CountNodes() const
{
    size_t nCount = 0;
    for (const auto& entry : mChildren)
    {
        ++nCount;
        if (entry.second->IsGroup())
            nCount += static_cast<const ZarrGroupNode&>(*entry.second).CountNodes();
    }
    return nCount;
}

/* ------------------------------------------------------------------ */
/*      ZarrLeafNode                                                   */
/* ------------------------------------------------------------------ */

ZarrLeafNode::ZarrLeafNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes,
                           const CPLJSONObject& oDescriptor, std::shared_ptr<StoreReader> poReader)
    : ZarrTreeNode(std::move(osName), std::move(osPath), oAttributes),
      mDescriptor(oDescriptor),
      mAccessor(
          [poReader, osArrayPath = mPath]() -> ArrayResult
          {
              if (!poReader)
                  return Err("no store reader for " + osArrayPath);
              ErrorHandler::Debug("Materializing array " + osArrayPath);
              return poReader->OpenArray(osArrayPath);
          })
{
}

std::vector<uint64_t> ZarrLeafNode::GetDeclaredShape() const
{
    std::vector<uint64_t> anShape;
    const CPLJSONArray oShape = mDescriptor.GetArray("shape");
    if (!oShape.IsValid())
        return anShape;
    for (int i = 0; i < oShape.Size(); ++i)
        anShape.push_back(static_cast<uint64_t>(oShape[i].ToLong()));
    return anShape;
}

std::shared_future<ZarrLeafNode::ArrayResult> ZarrLeafNode::Get() const
{
    return mAccessor.Get();
}

/* ------------------------------------------------------------------ */
/*      TreeBuilder                                                    */
/* ------------------------------------------------------------------ */

Result<std::shared_ptr<ZarrGroupNode>, TreeBuildError> TreeBuilder::Build(const OpenedStore& oStore)
{
    return Build(oStore.oMetadata, oStore.poReader);
}

Result<std::shared_ptr<ZarrGroupNode>, TreeBuildError> TreeBuilder::Build(const ConsolidatedMetadata& oMetadata,
                                                                         std::shared_ptr<StoreReader> poReader)
{
    SDZARR_PERF_TIMER("TreeBuilder::Build");

    auto poRoot = std::make_shared<ZarrGroupNode>("", "", oMetadata.GetAttributes(""));

    std::vector<std::string> aosPaths;
    for (const auto& osPath : oMetadata.GetPaths())
    {
        if (!osPath.empty())
            aosPaths.push_back(osPath);
    }

    // Parents before children
    std::stable_sort(aosPaths.begin(), aosPaths.end(),
                     [](const std::string& a, const std::string& b)
                     { return PathParser::SegmentDepth(a) < PathParser::SegmentDepth(b); });

    for (const auto& osPath : aosPaths)
    {
        const auto aosSegments = PathParser::SplitSegments(osPath);
        const bool bIsArray = oMetadata.IsArray(osPath);

        ZarrGroupNode* poParent = poRoot.get();
        std::string osCurrent;
        for (size_t i = 0; i + 1 < aosSegments.size(); ++i)
        {
            osCurrent = osCurrent.empty() ? aosSegments[i] : osCurrent + "/" + aosSegments[i];
            auto poChild = poParent->GetChild(aosSegments[i]);
            if (!poChild)
            {
                // Implicit group, absent from the metadata
                auto poGroup = std::make_shared<ZarrGroupNode>(aosSegments[i], osCurrent, CPLJSONObject());
                poParent->mChildren[aosSegments[i]] = poGroup;
                poParent = poGroup.get();
                continue;
            }
            if (poChild->IsLeaf())
            {
                TreeBuildError oError{TreeBuildError::Kind::LeafUsedAsParent, osPath, osCurrent};
                ErrorHandler::ReportStructuralError(oError.ToString());
                return Err(oError);
            }
            poParent = static_cast<ZarrGroupNode*>(poChild.get());
        }

        const std::string& osName = aosSegments.back();
        auto poExisting = poParent->GetChild(osName);
        if (poExisting)
        {
            if (poExisting->IsLeaf() != bIsArray)
            {
                TreeBuildError oError{TreeBuildError::Kind::KindConflict, osPath, poExisting->GetPath()};
                ErrorHandler::ReportStructuralError(oError.ToString());
                return Err(oError);
            }
            ErrorHandler::Debug("Duplicate metadata record for " + osPath + ", keeping the first");
            continue;
        }

        if (bIsArray)
        {
            poParent->mChildren[osName] = std::make_shared<ZarrLeafNode>(
                osName, osPath, oMetadata.GetAttributes(osPath), oMetadata.GetArrayDescriptor(osPath), poReader);
        }
        else
        {
            poParent->mChildren[osName] =
                std::make_shared<ZarrGroupNode>(osName, osPath, oMetadata.GetAttributes(osPath));
        }
    }

    ErrorHandler::Debug(CPLSPrintf("Built tree with %d nodes", static_cast<int>(poRoot->CountNodes())));
    return poRoot;
}

/* ------------------------------------------------------------------ */
/*      SerializeTree                                                  */
/* ------------------------------------------------------------------ */

CPLJSONObject SerializeTree(const ZarrTreeNode& oNode)
{
    CPLJSONObject oResult;
    if (!oNode.GetAttributes().GetChildren().empty())
        oResult.Add("_attrs", oNode.GetAttributes());

    if (oNode.IsLeaf())
    {
        const auto& oLeaf = static_cast<const ZarrLeafNode&>(oNode);
        oResult.Add("_zarray", oLeaf.GetArrayDescriptor());
        oResult.Add("get", "<lazy>");
        return oResult;
    }

    for (const auto& entry : static_cast<const ZarrGroupNode&>(oNode).GetChildren())
        oResult.Add(entry.first, SerializeTree(*entry.second));
    return oResult;
}
}  // namespace SDZarr
