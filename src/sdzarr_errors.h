#pragma once
#include <string>
#include <vector>

#include "cpl_error.h"

namespace SDZarrErrorUtils
{
/**
 * @brief Centralized diagnostic reporting for SpatialData Zarr operations
 */
class ErrorHandler
{
  public:
    /**
     * @brief Report that a store could not be opened
     * @param location The store location
     * @param reason Optional reason for failure
     */
    static void ReportOpenFailure(const std::string& location, const std::string& reason = "");

    /**
     * @brief Report a corrupt store hierarchy
     * @param reason Description naming the offending path
     */
    static void ReportStructuralError(const std::string& reason);

    /**
     * @brief Report element attributes that failed validation and fell back to raw attributes
     * @param kind Element kind name
     * @param key Element key
     * @param issues Validation issues found
     */
    static void ReportSchemaFallback(const std::string& kind,
                                     const std::string& key,
                                     const std::vector<std::string>& issues);

    /**
     * @brief Report an element that could not be loaded
     * @param kind Element kind name
     * @param key Element key
     * @param reason The reason for failure
     */
    static void ReportElementFailure(const std::string& kind, const std::string& key, const std::string& reason);

    static void ReportWarning(const std::string& message);

    /**
     * @brief Debug log with SDZARR prefix
     * @param message The debug message
     */
    static void Debug(const std::string& message);

  private:
    static const char* LIBRARY_NAME;
};

/**
 * @brief Silences GDAL diagnostics for the lifetime of the object
 *
 * Used around probes whose failure is an expected outcome.
 */
class QuietErrorScope
{
  public:
    QuietErrorScope();
    ~QuietErrorScope();

    QuietErrorScope(const QuietErrorScope&) = delete;
    QuietErrorScope& operator=(const QuietErrorScope&) = delete;
};
}  // namespace SDZarrErrorUtils
