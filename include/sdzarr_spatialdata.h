#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_element.h"
#include "sdzarr_element_kind.h"
#include "sdzarr_error_types.h"
#include "sdzarr_options.h"
#include "sdzarr_resolver.h"
#include "sdzarr_result.h"
#include "sdzarr_store.h"
#include "sdzarr_tree.h"

namespace SDZarr
{
/**
 * @brief An element that was present in the store but could not be loaded
 */
struct ElementFailure
{
    ElementKind eKind;
    std::string osKey;
    std::string osMessage;
};

/**
 * @brief A SpatialData store opened from its consolidated metadata
 *
 * Opening reads metadata only. Element data (arrays, Parquet tables,
 * AnnData columns) is read on first access.
 */
class SpatialData
{
  public:
    using ElementMap = std::map<std::string, std::shared_ptr<Element>>;

    /**
     * @brief Open a store through the GDAL backed reader
     */
    static Result<std::unique_ptr<SpatialData>, OpenError> Open(const std::string& location,
                                                                const OpenOptions& oOptions = OpenOptions());

    /**
     * @brief Open a store through a caller supplied reader
     */
    static Result<std::unique_ptr<SpatialData>, OpenError> Open(std::shared_ptr<StoreReader> poReader,
                                                                const OpenOptions& oOptions = OpenOptions());

    const StoreLocation& GetLocation() const { return mStore.oLocation; }
    const OpenOptions& GetOptions() const { return mOptions; }
    const ConsolidatedMetadata& GetMetadata() const { return mStore.oMetadata; }

    /** @brief Metadata file the store was opened from ("zarr.json", ".zmetadata" or "zmetadata") */
    const std::string& GetMetadataVariant() const { return mStore.osVariant; }

    const std::shared_ptr<ZarrGroupNode>& GetTree() const { return mTree; }

    /** @brief True when the kind was selected and the store has a group for it */
    bool HasKind(ElementKind eKind) const;

    /** @brief Elements of one kind, empty when the kind was not loaded */
    const ElementMap& GetElements(ElementKind eKind) const;

    std::shared_ptr<Element> GetElement(ElementKind eKind, const std::string& key) const;

    /** @brief Every loaded element of the spatial kinds */
    std::vector<std::shared_ptr<const Element>> GetSpatialElements() const;

    const std::vector<ElementFailure>& GetElementErrors() const { return mFailures; }

    /** @brief Union of the coordinate systems of every spatial element */
    std::set<std::string> GetCoordinateSystems() const;

    const TransformationResolver& GetResolver() const { return mResolver; }

    std::string ToString() const;

    /** @brief Serialized hierarchy of the store */
    CPLJSONObject ToJSON() const;

  private:
    SpatialData(OpenedStore oStore, std::shared_ptr<ZarrGroupNode> poTree, const OpenOptions& oOptions);

    void LoadElements(ElementKind eKind);
    void RecordFailure(ElementKind eKind, const std::string& key, const std::string& message);

    OpenedStore mStore;
    std::shared_ptr<ZarrGroupNode> mTree;
    OpenOptions mOptions;
    TransformationResolver mResolver;
    std::map<ElementKind, ElementMap> mElements;
    std::vector<ElementFailure> mFailures;
};
}  // namespace SDZarr
