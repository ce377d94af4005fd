#include "sdzarr_performance.h"

#include <sstream>

#include "cpl_error.h"

namespace SDZarrPerformanceUtils
{

std::vector<std::string> FastTokenize(const std::string& input, char delimiter)
{
    std::vector<std::string> tokens;
    tokens.reserve(8);  // Reserve space for common case

    std::stringstream ss(input);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        size_t first = token.find_first_not_of(" \t");
        size_t last = token.find_last_not_of(" \t");
        if (first == std::string::npos)
            continue;
        tokens.emplace_back(token.substr(first, last - first + 1));
    }

    return tokens;
}

PathType DetectPathType(const std::string& path)
{
    if (path.empty())
        return PathType::UNKNOWN;

    if (path.compare(0, 9, "/vsicurl/") == 0)
        return PathType::VSI_CURL;

    if (path.compare(0, 7, "/vsis3/") == 0)
        return PathType::VSI_S3;

    if (path.compare(0, 7, "/vsiaz/") == 0 || path.compare(0, 10, "/vsiazure/") == 0)
        return PathType::VSI_AZURE;

    if (path.compare(0, 8, "/vsimem/") == 0)
        return PathType::VSI_MEM;

    if (path.compare(0, 7, "http://") == 0 || path.compare(0, 8, "https://") == 0)
        return PathType::NETWORK_HTTP;

    // Other VSI handlers are treated as remote
    if (path.compare(0, 4, "/vsi") == 0)
        return PathType::VSI_CURL;

    return PathType::LOCAL_FILE;
}

bool IsNetworkPath(const std::string& path)
{
    PathType type = DetectPathType(path);
    return type == PathType::NETWORK_HTTP || type == PathType::VSI_CURL ||
           type == PathType::VSI_S3 || type == PathType::VSI_AZURE;
}

ScopedTimer::ScopedTimer(const char* op)
    : start(std::chrono::steady_clock::now()), operation(op)
{
}

ScopedTimer::~ScopedTimer()
{
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    // Only log if operation takes more than 1ms to avoid spam
    if (duration.count() > 1000)
    {
        CPLDebug("SDZARR_PERF",
                 "%s took %lld microseconds",
                 operation,
                 static_cast<long long>(duration.count()));
    }
}

}  // namespace SDZarrPerformanceUtils
