#pragma once

#include <future>
#include <memory>
#include <string>
#include <variant>

#include "cpl_json.h"
#include "sdzarr_cache.h"
#include "sdzarr_element_kind.h"
#include "sdzarr_result.h"
#include "sdzarr_schema.h"
#include "sdzarr_store.h"
#include "sdzarr_table.h"
#include "sdzarr_tree.h"

namespace SDZarr
{
/**
 * @brief Data access behind an element, one alternative per kind family
 *
 * images/labels and version 0.1 shapes: the element group;
 * points and later shapes: the Parquet table; tables: the AnnData reader.
 */
using ElementDataSource =
    std::variant<std::shared_ptr<GroupHandle>, std::shared_ptr<ColumnarSource>, std::shared_ptr<TableSource>>;

/**
 * @brief One named entry of the images, labels, shapes, points or tables category
 */
class Element
{
  public:
    using DataSourceResult = Result<ElementDataSource, std::string>;

    Element(ElementKind eKind, std::string osKey, std::shared_ptr<const ZarrGroupNode> poNode,
            NormalizedAttributes oAttributes, std::shared_ptr<StoreReader> poReader);

    /**
     * @brief Normalize the attributes of an element node and wrap it
     * @return SchemaError when the element declares an undecodable format
     */
    static Result<std::shared_ptr<Element>, SchemaError> Create(ElementKind eKind, const std::string& key,
                                                                std::shared_ptr<const ZarrGroupNode> poNode,
                                                                std::shared_ptr<StoreReader> poReader);

    ElementKind GetKind() const { return meKind; }
    const std::string& GetKey() const { return mKey; }

    /** @brief Store-relative path, e.g. "images/blobs" */
    const std::string& GetPath() const { return mPath; }

    const CPLJSONObject& GetRawAttributes() const { return mNode->GetAttributes(); }
    const NormalizedAttributes& GetAttributes() const { return mAttributes; }
    const std::shared_ptr<const ZarrGroupNode>& GetNode() const { return mNode; }

    /** @brief Kind payloads, nullptr when the element is of another kind family */
    const RasterAttrs* GetRasterAttrs() const { return std::get_if<RasterAttrs>(&mAttributes.oPayload); }
    const VectorAttrs* GetVectorAttrs() const { return std::get_if<VectorAttrs>(&mAttributes.oPayload); }
    const TableAttrs* GetTableAttrs() const { return std::get_if<TableAttrs>(&mAttributes.oPayload); }

    /**
     * @brief Open the data source; constructed once, shared by every caller
     */
    std::shared_future<DataSourceResult> GetDataSource() const { return mDataSource.Get(); }

    Result<std::shared_ptr<GroupHandle>, std::string> OpenGroup() const;
    Result<std::shared_ptr<ColumnarSource>, std::string> OpenColumnar() const;
    Result<std::shared_ptr<TableSource>, std::string> OpenTable() const;

    /** @brief Store-relative path of the Parquet table of points and shapes */
    std::string GetColumnarPath() const;

    /** @brief One line summary used by SpatialData::ToString() */
    std::string Describe() const;

  private:
    static std::string ColumnarPath(ElementKind eKind, const std::string& osElementPath);

    // Bound at construction, takes copies of what it reads
    static DataSourceResult CreateDataSource(ElementKind eKind, const std::string& osPath,
                                             const std::string& osVersion,
                                             const std::shared_ptr<const ZarrGroupNode>& poNode,
                                             const std::shared_ptr<StoreReader>& poReader);

    ElementKind meKind;
    std::string mKey;
    std::string mPath;
    std::shared_ptr<const ZarrGroupNode> mNode;
    NormalizedAttributes mAttributes;
    std::shared_ptr<StoreReader> mReader;
    LazyValue<ElementDataSource> mDataSource;
};
}  // namespace SDZarr
