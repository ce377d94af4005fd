#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "sdzarr_options.h"
#include "sdzarr_store.h"

namespace SDZarr
{
struct GDALStoreContext;

/**
 * @brief StoreReader backed by GDAL
 *
 * Metadata files are read through the VSI layer. Groups and arrays are
 * opened through the multidimensional API of the GDAL Zarr driver, whose
 * root group is opened once on first use. Points and shapes tables are
 * opened through OGR (Parquet driver). GDAL objects are not thread-safe,
 * so every call into GDAL made on behalf of this reader and the handles it
 * returns is serialized by one mutex.
 */
class VSIStoreReader : public StoreReader
{
  public:
    explicit VSIStoreReader(const StoreLocation& oLocation, size_t nMaxMetadataSize = DEFAULT_MAX_METADATA_SIZE);
    ~VSIStoreReader() override;

    const StoreLocation& GetLocation() const override { return mLocation; }

    Result<std::string, std::string> Fetch(const std::string& relativePath) const override;
    Result<std::shared_ptr<ArrayHandle>, std::string> OpenArray(const std::string& relativePath) const override;
    Result<std::shared_ptr<GroupHandle>, std::string> OpenGroup(const std::string& relativePath) const override;
    Result<std::shared_ptr<ColumnarSource>, std::string> OpenColumnar(const std::string& relativePath) const override;

  private:
    /** @brief Open the multidimensional root group, caller holds the context mutex */
    bool EnsureRootGroup(std::string& osReason) const;

    StoreLocation mLocation;
    size_t mMaxMetadataSize;
    std::shared_ptr<GDALStoreContext> mContext;
};
}  // namespace SDZarr
