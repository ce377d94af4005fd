#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sdzarr_error_types.h"
#include "sdzarr_metadata.h"
#include "sdzarr_result.h"

namespace SDZarr
{
/**
 * @brief Immutable reference to the root of a chunked-array store
 *
 * Accepts local paths, GDAL virtual paths and http(s):// or s3:// URLs.
 */
class StoreLocation
{
  public:
    StoreLocation() = default;
    explicit StoreLocation(const std::string& location);

    /** @brief The location as supplied by the caller */
    const std::string& GetOriginal() const { return mOriginal; }

    /** @brief The location as a path usable with the GDAL VSI API */
    const std::string& GetPath() const { return mPath; }

    bool IsRemote() const;

    /** @brief Absolute path of a store-relative path */
    std::string Resolve(const std::string& relativePath) const;

  private:
    std::string mOriginal;
    std::string mPath;
};

/**
 * @brief Hyperslab of an array; empty vectors select the whole array
 */
struct ArraySlice
{
    std::vector<uint64_t> anStart;
    std::vector<size_t> anCount;

    bool IsFull() const { return anStart.empty() && anCount.empty(); }
};

/**
 * @brief An opened array of the store
 */
class ArrayHandle
{
  public:
    virtual ~ArrayHandle() = default;

    virtual std::string GetPath() const = 0;
    virtual std::vector<uint64_t> GetShape() const = 0;
    virtual std::string GetDataTypeName() const = 0;
    virtual bool IsStringArray() const = 0;

    virtual Result<std::vector<double>, std::string> ReadAsDouble(const ArraySlice& slice = ArraySlice()) const = 0;
    virtual Result<std::vector<std::string>, std::string> ReadAsString(
        const ArraySlice& slice = ArraySlice()) const = 0;
};

/**
 * @brief An opened group of the store (images and labels elements)
 */
class GroupHandle
{
  public:
    virtual ~GroupHandle() = default;

    virtual std::string GetPath() const = 0;
    virtual std::vector<std::string> GetArrayNames() const = 0;
    virtual std::vector<std::string> GetGroupNames() const = 0;
    virtual Result<std::shared_ptr<ArrayHandle>, std::string> OpenArray(const std::string& name) const = 0;
};

/**
 * @brief Columnar reader over the table backing a points or shapes element
 */
class ColumnarSource
{
  public:
    virtual ~ColumnarSource() = default;

    virtual std::string GetPath() const = 0;
    virtual int64_t GetFeatureCount() const = 0;
    virtual std::vector<std::string> GetColumnNames() const = 0;
    virtual Result<std::vector<double>, std::string> ReadNumericColumn(const std::string& name) const = 0;
    virtual Result<std::vector<std::string>, std::string> ReadGeometriesAsWKT() const = 0;
};

/**
 * @brief Access to the bytes, arrays and groups of one store
 *
 * Implementations are the boundary with the chunked-array client. All
 * paths are store-relative.
 */
class StoreReader
{
  public:
    virtual ~StoreReader() = default;

    virtual const StoreLocation& GetLocation() const = 0;

    /**
     * @brief Fetch the raw bytes of a store-relative file
     * @return File content, or a reason when the file is absent or unreadable
     */
    virtual Result<std::string, std::string> Fetch(const std::string& relativePath) const = 0;

    virtual Result<std::shared_ptr<ArrayHandle>, std::string> OpenArray(const std::string& relativePath) const = 0;
    virtual Result<std::shared_ptr<GroupHandle>, std::string> OpenGroup(const std::string& relativePath) const = 0;
    virtual Result<std::shared_ptr<ColumnarSource>, std::string> OpenColumnar(
        const std::string& relativePath) const = 0;
};

/**
 * @brief A store together with its canonical consolidated metadata
 */
struct OpenedStore
{
    StoreLocation oLocation;
    std::shared_ptr<StoreReader> poReader;
    ConsolidatedMetadata oMetadata;
    std::string osVariant;  // metadata file that was used
};

/**
 * @brief Locates and normalizes the consolidated metadata of a store
 */
class StoreOpener
{
  public:
    struct ProbeVariant
    {
        const char* pszFileName;
        MetadataShape eShape;
    };

    /**
     * @brief Metadata files probed, in order: zarr.json, .zmetadata, zmetadata
     */
    static const std::vector<ProbeVariant>& GetProbeVariants();

    /**
     * @brief Probe the metadata variants one after another and normalize the first found
     *
     * A variant that cannot be fetched, is not JSON, or is a zarr.json holding
     * neither consolidated metadata nor a metadata map counts as absent. A document that is found but
     * cannot be normalized fails with InvalidMetadata. When every variant is
     * absent the error is NoConsolidatedMetadata listing all attempts.
     */
    static Result<OpenedStore, OpenError> Open(const StoreLocation& oLocation, std::shared_ptr<StoreReader> poReader);
};
}  // namespace SDZarr
