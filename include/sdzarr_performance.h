#pragma once

#include <chrono>
#include <string>
#include <vector>

// Performance helper functions
namespace SDZarrPerformanceUtils
{
    /**
     * @brief Fast path detection for different store location types
     */
    enum class PathType {
        LOCAL_FILE,
        NETWORK_HTTP,
        VSI_CURL,
        VSI_S3,
        VSI_AZURE,
        VSI_MEM,
        UNKNOWN
    };

    PathType DetectPathType(const std::string& path);
    bool IsNetworkPath(const std::string& path);

    /**
     * @brief Split a comma or slash separated option value, dropping empty tokens
     */
    std::vector<std::string> FastTokenize(const std::string& input, char delimiter);

    /**
     * @brief Logs the lifetime of a scope under the SDZARR_PERF debug category
     */
    class ScopedTimer {
        std::chrono::time_point<std::chrono::steady_clock> start;
        const char* operation;
    public:
        explicit ScopedTimer(const char* op);
        ~ScopedTimer();
    };
}

#define SDZARR_PERF_TIMER(op) SDZarrPerformanceUtils::ScopedTimer timer(op)
