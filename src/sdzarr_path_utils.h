#pragma once
#include <string>
#include <vector>

namespace SDZarrPathUtils
{
/**
 * @brief Utility class for store locations and node paths
 */
class PathParser
{
  public:
    struct ParsedLocation
    {
        std::string originalPath;
        std::string vsiPath;  // path usable with the VSI API
        bool isUrl;
        bool isVirtualPath;
    };

    /**
     * @brief Parse a user supplied store location
     *
     * Accepts an optional SDZARR: prefix and optional double quotes.
     * http(s):// locations are mapped onto /vsicurl/, s3:// onto /vsis3/.
     * Trailing slashes are removed.
     * @param fullPath The input location
     * @return ParsedLocation structure with all components
     */
    static ParsedLocation Parse(const std::string& fullPath);

    /**
     * @brief Check if a path is a URL or virtual file system path
     * @param path The path to check
     * @return true if URL or virtual path
     */
    static bool IsUrlOrVirtualPath(const std::string& path);

    /**
     * @brief Join a store root and a store-relative path with a single '/'
     */
    static std::string Join(const std::string& root, const std::string& relativePath);

    /**
     * @brief Strip leading, trailing and repeated slashes from a node path
     */
    static std::string NormalizeNodePath(const std::string& path);

    static std::vector<std::string> SplitSegments(const std::string& path);

    static size_t SegmentDepth(const std::string& path);

  private:
    static std::string StripSDZarrPrefix(const std::string& path);
    static std::string StripQuotes(const std::string& path);
};
}  // namespace SDZarrPathUtils
