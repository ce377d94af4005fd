#pragma once

#include <string>
#include <vector>

namespace SDZarr
{
/**
 * @brief Consolidated metadata document had an unusable shape
 */
struct NormalizationError
{
    enum class Kind
    {
        InvalidDocument
    };

    Kind eKind = Kind::InvalidDocument;
    std::string osReason;

    std::string ToString() const;
};

/**
 * @brief One probe of the store opener that did not yield metadata
 */
struct ProbeAttempt
{
    std::string osVariant;  // "zarr.json", ".zmetadata", "zmetadata"
    std::string osReason;
};

/**
 * @brief Failure to open a store or its consolidated metadata
 */
struct OpenError
{
    enum class Kind
    {
        NoConsolidatedMetadata,
        InvalidMetadata,
        InvalidStructure
    };

    Kind eKind = Kind::NoConsolidatedMetadata;
    std::string osLocation;
    std::vector<ProbeAttempt> aoAttempts;
    std::string osDetail;

    std::vector<std::string> GetAttemptedVariants() const;
    std::string ToString() const;
};

/**
 * @brief Corrupt hierarchy found while building the tree index
 */
struct TreeBuildError
{
    enum class Kind
    {
        LeafUsedAsParent,
        KindConflict
    };

    Kind eKind = Kind::LeafUsedAsParent;
    std::string osPath;
    std::string osConflictingPath;

    std::string ToString() const;
};

/**
 * @brief Element metadata declares an on-disk layout this library cannot decode
 */
struct SchemaError
{
    enum class Kind
    {
        UnsupportedFormat
    };

    Kind eKind = Kind::UnsupportedFormat;
    std::string osElementKind;
    std::string osElementKey;
    std::string osVersion;
    std::string osEncodingType;

    std::string ToString() const;
};

struct ResolutionError
{
    enum class Kind
    {
        CoordinateSystemNotFound,
        InvalidTransformation
    };

    Kind eKind = Kind::CoordinateSystemNotFound;
    std::string osElementKey;
    std::string osRequested;
    std::vector<std::string> aosAvailable;
    std::string osDetail;

    std::string ToString() const;
};
}  // namespace SDZarr
