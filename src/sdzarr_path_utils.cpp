#include "sdzarr_path_utils.h"
#include "cpl_string.h"
#include <cstring>

namespace SDZarrPathUtils
{
    PathParser::ParsedLocation PathParser::Parse(const std::string& fullPath)
    {
        ParsedLocation result;
        result.originalPath = fullPath;
        result.isUrl = false;
        result.isVirtualPath = false;

        std::string path = StripQuotes(StripSDZarrPrefix(fullPath));

        while (path.size() > 1 && path.back() == '/')
        {
            path.pop_back();
        }

        if (STARTS_WITH_CI(path.c_str(), "http://") || STARTS_WITH_CI(path.c_str(), "https://"))
        {
            result.isUrl = true;
            result.isVirtualPath = true;
            result.vsiPath = "/vsicurl/" + path;
        }
        else if (STARTS_WITH_CI(path.c_str(), "s3://"))
        {
            result.isUrl = true;
            result.isVirtualPath = true;
            result.vsiPath = "/vsis3/" + path.substr(strlen("s3://"));
        }
        else
        {
            result.isUrl = path.find("://") != std::string::npos;
            result.isVirtualPath = IsUrlOrVirtualPath(path);
            result.vsiPath = path;
        }

        return result;
    }

    bool PathParser::IsUrlOrVirtualPath(const std::string& path)
    {
        // Check for URL schemes
        if (path.find("://") != std::string::npos)
        {
            return true;
        }

        // Check for GDAL virtual file systems
        if (STARTS_WITH_CI(path.c_str(), "/vsi"))
        {
            return true;
        }

        return false;
    }

    std::string PathParser::Join(const std::string& root, const std::string& relativePath)
    {
        std::string relative = relativePath;
        while (!relative.empty() && relative.front() == '/')
        {
            relative.erase(0, 1);
        }
        if (relative.empty())
        {
            return root;
        }
        if (root.empty())
        {
            return relative;
        }
        if (root.back() == '/')
        {
            return root + relative;
        }
        return root + "/" + relative;
    }

    std::string PathParser::NormalizeNodePath(const std::string& path)
    {
        std::string normalized;
        for (const auto& segment : SplitSegments(path))
        {
            if (!normalized.empty())
                normalized += '/';
            normalized += segment;
        }
        return normalized;
    }

    std::vector<std::string> PathParser::SplitSegments(const std::string& path)
    {
        std::vector<std::string> segments;
        std::string current;
        for (char c : path)
        {
            if (c == '/')
            {
                if (!current.empty())
                    segments.push_back(current);
                current.clear();
            }
            else
            {
                current += c;
            }
        }
        if (!current.empty())
            segments.push_back(current);
        return segments;
    }

    size_t PathParser::SegmentDepth(const std::string& path)
    {
        return SplitSegments(path).size();
    }

    std::string PathParser::StripSDZarrPrefix(const std::string& path)
    {
        const char* pszPrefix = "SDZARR:";
        if (STARTS_WITH_CI(path.c_str(), pszPrefix))
        {
            return path.substr(strlen(pszPrefix));
        }
        return path;
    }

    std::string PathParser::StripQuotes(const std::string& path)
    {
        if (path.size() >= 2 && path.front() == '"' && path.back() == '"')
        {
            return path.substr(1, path.size() - 2);
        }
        return path;
    }
}
