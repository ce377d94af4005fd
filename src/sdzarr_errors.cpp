#include "sdzarr_errors.h"

#include "cpl_error.h"
#include "cpl_string.h"
#include "sdzarr_error_types.h"

namespace
{
std::string JoinNames(const std::vector<std::string>& names, const char* separator)
{
    std::string result;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            result += separator;
        result += names[i];
    }
    return result;
}
}  // namespace

namespace SDZarrErrorUtils
{
    const char* ErrorHandler::LIBRARY_NAME = "SDZARR";

    void ErrorHandler::ReportOpenFailure(const std::string& location, const std::string& reason)
    {
        if (reason.empty())
        {
            CPLError(CE_Failure, CPLE_OpenFailed,
                     "%s: could not open %s",
                     LIBRARY_NAME, location.c_str());
        }
        else
        {
            CPLError(CE_Failure, CPLE_OpenFailed,
                     "%s: could not open %s: %s",
                     LIBRARY_NAME, location.c_str(), reason.c_str());
        }
    }

    void ErrorHandler::ReportStructuralError(const std::string& reason)
    {
        CPLError(CE_Failure, CPLE_AppDefined,
                 "%s: corrupt store hierarchy: %s",
                 LIBRARY_NAME, reason.c_str());
    }

    void ErrorHandler::ReportSchemaFallback(const std::string& kind,
                                            const std::string& key,
                                            const std::vector<std::string>& issues)
    {
        CPLError(CE_Warning, CPLE_AppDefined,
                 "%s: attributes of %s element '%s' did not validate, using raw attributes (%s)",
                 LIBRARY_NAME, kind.c_str(), key.c_str(), JoinNames(issues, "; ").c_str());
    }

    void ErrorHandler::ReportElementFailure(const std::string& kind, const std::string& key, const std::string& reason)
    {
        CPLError(CE_Failure, CPLE_NotSupported,
                 "%s: failed to load %s element '%s': %s",
                 LIBRARY_NAME, kind.c_str(), key.c_str(), reason.c_str());
    }

    void ErrorHandler::ReportWarning(const std::string& message)
    {
        CPLError(CE_Warning, CPLE_AppDefined, "%s: %s", LIBRARY_NAME, message.c_str());
    }

    void ErrorHandler::Debug(const std::string& message)
    {
        CPLDebug(LIBRARY_NAME, "%s", message.c_str());
    }

    QuietErrorScope::QuietErrorScope()
    {
        CPLPushErrorHandler(CPLQuietErrorHandler);
    }

    QuietErrorScope::~QuietErrorScope()
    {
        CPLPopErrorHandler();
    }
}

namespace SDZarr
{
std::string NormalizationError::ToString() const
{
    return "Invalid consolidated metadata document: " + osReason;
}

std::vector<std::string> OpenError::GetAttemptedVariants() const
{
    std::vector<std::string> variants;
    for (const auto& attempt : aoAttempts)
        variants.push_back(attempt.osVariant);
    return variants;
}

std::string OpenError::ToString() const
{
    switch (eKind)
    {
        case Kind::NoConsolidatedMetadata:
        {
            if (aoAttempts.empty())
                return "Couldn't open consolidated metadata for '" + osLocation + "': " + osDetail;
            std::string message = "Couldn't open consolidated metadata for '" + osLocation + "'. Tried: ";
            for (size_t i = 0; i < aoAttempts.size(); ++i)
            {
                if (i > 0)
                    message += i + 1 == aoAttempts.size() ? ", and " : ", ";
                message += aoAttempts[i].osVariant;
                if (!aoAttempts[i].osReason.empty())
                    message += " (" + aoAttempts[i].osReason + ")";
            }
            return message;
        }
        case Kind::InvalidMetadata:
            return "Invalid consolidated metadata in '" + osLocation + "': " + osDetail;
        case Kind::InvalidStructure:
            return "Invalid store hierarchy in '" + osLocation + "': " + osDetail;
    }
    return osDetail;
}

std::string TreeBuildError::ToString() const
{
    switch (eKind)
    {
        case Kind::LeafUsedAsParent:
            return "path '" + osPath + "' descends from array '" + osConflictingPath +
                   "'; an array cannot have children";
        case Kind::KindConflict:
            return "path '" + osPath + "' is both a group and an array";
    }
    return osPath;
}

std::string SchemaError::ToString() const
{
    std::string message = "Unsupported " + osElementKind + " format for element '" + osElementKey + "'";
    if (!osEncodingType.empty())
        message += ": encoding-type '" + osEncodingType + "'";
    if (!osVersion.empty())
        message += (osEncodingType.empty() ? ": " : ", ") + std::string("version '") + osVersion + "'";
    return message;
}

std::string ResolutionError::ToString() const
{
    if (eKind == Kind::InvalidTransformation)
        return "Invalid transformation on element '" + osElementKey + "': " + osDetail;
    return "Coordinate system '" + osRequested + "' not found for element '" + osElementKey +
           "'. Available: [" + JoinNames(aosAvailable, ", ") + "]";
}
}  // namespace SDZarr
