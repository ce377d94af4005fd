#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_cache.h"
#include "sdzarr_error_types.h"
#include "sdzarr_result.h"
#include "sdzarr_store.h"

namespace SDZarr
{
class ZarrGroupNode;
class ZarrLeafNode;

/**
 * @brief A node of the store hierarchy built from consolidated metadata
 *
 * Attributes are shared with the consolidated metadata document.
 */
class ZarrTreeNode
{
  public:
    virtual ~ZarrTreeNode() = default;

    const std::string& GetName() const { return mName; }
    const std::string& GetPath() const { return mPath; }

    /** @brief ".zattrs" of the node, an empty object when the node has none */
    const CPLJSONObject& GetAttributes() const { return mAttributes; }

    virtual bool IsGroup() const = 0;
    bool IsLeaf() const { return !IsGroup(); }

  protected:
    ZarrTreeNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes);

    std::string mName;
    std::string mPath;
    CPLJSONObject mAttributes;
};

class ZarrGroupNode : public ZarrTreeNode
{
  public:
    using ChildMap = std::map<std::string, std::shared_ptr<ZarrTreeNode>>;

    ZarrGroupNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes);

    bool IsGroup() const override { return true; }

    const ChildMap& GetChildren() const { return mChildren; }
    std::shared_ptr<ZarrTreeNode> GetChild(const std::string& name) const;
    std::shared_ptr<ZarrGroupNode> GetGroup(const std::string& name) const;
    std::shared_ptr<ZarrLeafNode> GetLeaf(const std::string& name) const;

    /**
     * @brief Find a descendant by its path relative to this group
     * @return nullptr when no such node exists
     */
    std::shared_ptr<ZarrTreeNode> Resolve(const std::string& relativePath) const;

    /** @brief Number of descendants, this group excluded */
    size_t CountNodes() const;

  private:
    friend class TreeBuilder;

    ChildMap mChildren;
};

/**
 * @brief An array node; array data is opened on demand and memoized
 */
class ZarrLeafNode : public ZarrTreeNode
{
  public:
    using ArrayResult = Result<std::shared_ptr<ArrayHandle>, std::string>;
    using LoadState = LazyValue<std::shared_ptr<ArrayHandle>>::State;

    ZarrLeafNode(std::string osName, std::string osPath, const CPLJSONObject& oAttributes,
                 const CPLJSONObject& oDescriptor, std::shared_ptr<StoreReader> poReader);

    bool IsGroup() const override { return false; }

    /** @brief ".zarray" record (zarr v3: the array node document) */
    const CPLJSONObject& GetArrayDescriptor() const { return mDescriptor; }

    /** @brief Shape declared by the array descriptor */
    std::vector<uint64_t> GetDeclaredShape() const;

    /**
     * @brief Open the array; every call on the same node shares one load
     */
    std::shared_future<ArrayResult> Get() const;

    ArrayResult Load() const { return Get().get(); }

    LoadState GetLoadState() const { return mAccessor.GetState(); }
    int GetLoadCount() const { return mAccessor.GetLoadCount(); }

  private:
    CPLJSONObject mDescriptor;
    LazyValue<std::shared_ptr<ArrayHandle>> mAccessor;
};

/**
 * @brief Builds the node hierarchy of a store without reading array data
 */
class TreeBuilder
{
  public:
    static Result<std::shared_ptr<ZarrGroupNode>, TreeBuildError> Build(const OpenedStore& oStore);

    static Result<std::shared_ptr<ZarrGroupNode>, TreeBuildError> Build(const ConsolidatedMetadata& oMetadata,
                                                                       std::shared_ptr<StoreReader> poReader);
};

/**
 * @brief JSON view of a (sub)tree: "_attrs" and "_zarray" per node, lazy leaves marked
 */
CPLJSONObject SerializeTree(const ZarrTreeNode& oNode);
}  // namespace SDZarr
