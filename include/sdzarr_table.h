#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_cache.h"
#include "sdzarr_result.h"
#include "sdzarr_store.h"
#include "sdzarr_tree.h"

namespace SDZarr
{
/**
 * @brief Reader for the AnnData table behind a tables element
 *
 * Column paths are relative to the table root ("obs/cell_type"). Column
 * encodings are read from the attributes already present in the tree;
 * only array data is fetched. Each column is loaded at most once per
 * instance, and a failed load is evicted so it can be retried.
 */
class TableSource
{
  public:
    using Column = std::vector<std::string>;

    TableSource(std::string osElementPath, std::shared_ptr<const ZarrGroupNode> poTableNode,
                std::shared_ptr<StoreReader> poReader);

    const std::string& GetPath() const { return mElementPath; }

    /**
     * @brief Load a column as strings; the future rethrows a load failure
     */
    std::shared_future<Column> LoadColumn(const std::string& columnPath);
    std::vector<std::shared_future<Column>> LoadColumns(const std::vector<std::string>& columnPaths);

    /** @brief Blocking LoadColumn() with the failure as a value */
    Result<Column, std::string> GetColumn(const std::string& columnPath);

    Result<Column, std::string> LoadObsIndex();
    Result<Column, std::string> LoadVarIndex();

    /** @brief Whole numeric array, flattened (e.g. "obsm/spatial") */
    Result<std::vector<double>, std::string> LoadNumeric(const std::string& arrayPath) const;

    /** @brief Names of the members of a dataframe group ("obs", "var") */
    std::vector<std::string> GetDataFrameColumns(const std::string& dataFramePath) const;

    bool IsColumnCached(const std::string& columnPath) const;
    size_t GetCachedColumnCount() const { return mColumnCache.Size(); }

  private:
    Column ReadColumn(const std::string& columnPath) const;
    Column ReadStrings(const std::string& arrayPath) const;
    Result<Column, std::string> LoadDataFrameIndex(const std::string& dataFramePath);
    CPLJSONObject GetNodeAttributes(const std::string& relativePath) const;
    std::shared_ptr<ArrayHandle> OpenArray(const std::string& relativePath) const;

    std::string mElementPath;
    std::shared_ptr<const ZarrGroupNode> mTableNode;
    std::shared_ptr<StoreReader> mReader;
    LoadCache<std::string, Column> mColumnCache;
};
}  // namespace SDZarr
