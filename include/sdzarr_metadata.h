#pragma once

#include <map>
#include <string>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_error_types.h"
#include "sdzarr_result.h"

namespace SDZarr
{
/**
 * @brief Wire shapes of a consolidated metadata document
 */
enum class MetadataShape
{
    Auto,        // detect from the document
    Nested,      // {"metadata": {"a/b": {".zattrs": ..., ".zarray": ...}}}
    Flat,        // {"metadata": {"a/b/.zattrs": ..., "a/b/.zarray": ...}}
    V3Envelope,  // zarr.json with consolidated_metadata.metadata
    Unknown
};

const char* MetadataShapeToString(MetadataShape eShape);

/**
 * @brief Canonical (nested) consolidated metadata
 *
 * Wraps a document of the form {"metadata": {path: {".zattrs", ".zarray", ".zgroup"}}}.
 * Node records are shared with the wrapped document, never copied.
 * Paths are normalized (no leading or trailing '/'); the root path is "".
 */
class ConsolidatedMetadata
{
  public:
    ConsolidatedMetadata() = default;
    explicit ConsolidatedMetadata(const CPLJSONObject& oRoot);

    const CPLJSONObject& GetRoot() const { return mRoot; }

    std::vector<std::string> GetPaths() const;
    size_t GetNodeCount() const { return mNodes.size(); }
    bool HasNode(const std::string& path) const;

    /**
     * @brief Per-node record, invalid object if the path is unknown
     */
    CPLJSONObject GetNode(const std::string& path) const;

    /**
     * @brief ".zattrs" of a node, invalid object if absent
     */
    CPLJSONObject GetAttributes(const std::string& path) const;

    /**
     * @brief ".zarray" of a node, invalid object if the node is not an array
     */
    CPLJSONObject GetArrayDescriptor(const std::string& path) const;

    bool IsArray(const std::string& path) const;

  private:
    CPLJSONObject mRoot;
    std::map<std::string, CPLJSONObject> mNodes;
};

/**
 * @brief Converts any supported consolidated metadata document into the nested shape
 */
class MetadataNormalizer
{
  public:
    static constexpr const char* ATTRS_KEY = ".zattrs";
    static constexpr const char* ARRAY_KEY = ".zarray";
    static constexpr const char* GROUP_KEY = ".zgroup";

    /**
     * @brief Normalize a parsed document
     * @param oDoc Parsed JSON document
     * @param eHint Shape the caller expects; a hint that does not match falls back to detection
     * @return Canonical metadata, or InvalidDocument when the input is not an object
     *         or carries no metadata map
     */
    static Result<ConsolidatedMetadata, NormalizationError> Normalize(const CPLJSONObject& oDoc,
                                                                      MetadataShape eHint = MetadataShape::Auto);

    /**
     * @brief Detect the shape of a document, Unknown when none matches
     */
    static MetadataShape DetectShape(const CPLJSONObject& oDoc);

    /**
     * @brief True for a zarr v3 root document carrying consolidated metadata
     */
    static bool HasConsolidatedEnvelope(const CPLJSONObject& oDoc);

    /**
     * @brief Split a flat key into node path and metadata suffix
     * @return false when the key does not end in .zattrs, .zarray or .zgroup
     */
    static bool SplitFlatKey(const std::string& key, std::string& path, std::string& suffix);

  private:
    static bool MatchesShape(const CPLJSONObject& oDoc, MetadataShape eShape);
    static CPLJSONObject NormalizeFlat(const CPLJSONObject& oDoc);
    static CPLJSONObject NormalizeV3(const CPLJSONObject& oDoc);
};
}  // namespace SDZarr
