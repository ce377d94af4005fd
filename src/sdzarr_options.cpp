#include "sdzarr_options.h"

#include <cstdlib>

#include "cpl_conv.h"
#include "cpl_string.h"
#include "sdzarr_errors.h"
#include "sdzarr_performance.h"

using SDZarrErrorUtils::ErrorHandler;

namespace SDZarr
{
namespace
{
const char* FetchOption(CSLConstList papszOptions, const char* pszName, const char* pszConfigName)
{
    const char* pszValue = CSLFetchNameValue(papszOptions, pszName);
    if (pszValue == nullptr)
        pszValue = CPLGetConfigOption(pszConfigName, nullptr);
    return pszValue;
}
}  // namespace

OpenOptions::OpenOptions() : oSelection(AllElementKinds().begin(), AllElementKinds().end())
{
}

OpenOptions OpenOptions::FromStringList(CSLConstList papszOptions)
{
    OpenOptions oOptions;

    const char* pszSelection = FetchOption(papszOptions, "SELECTION", "SDZARR_SELECTION");
    if (pszSelection != nullptr)
    {
        oOptions.oSelection.clear();
        for (const auto& osToken : SDZarrPerformanceUtils::FastTokenize(pszSelection, ','))
        {
            ElementKind eKind;
            if (ElementKindFromString(osToken, eKind))
                oOptions.oSelection.insert(eKind);
            else
                ErrorHandler::ReportWarning("ignoring unknown element kind '" + osToken + "' in SELECTION");
        }
    }

    const char* pszDefaultCS =
        FetchOption(papszOptions, "DEFAULT_COORDINATE_SYSTEM", "SDZARR_DEFAULT_COORDINATE_SYSTEM");
    if (pszDefaultCS != nullptr && pszDefaultCS[0] != '\0')
        oOptions.osDefaultCoordinateSystem = pszDefaultCS;

    const char* pszLevel = FetchOption(papszOptions, "MULTISCALE_LEVEL", "SDZARR_MULTISCALE_LEVEL");
    if (pszLevel != nullptr)
    {
        const int nLevel = atoi(pszLevel);
        if (nLevel < 0)
            ErrorHandler::ReportWarning(std::string("ignoring negative MULTISCALE_LEVEL=") + pszLevel);
        else
            oOptions.nMultiscaleLevel = nLevel;
    }

    const char* pszMaxSize = FetchOption(papszOptions, "MAX_METADATA_SIZE", "SDZARR_MAX_METADATA_SIZE");
    if (pszMaxSize != nullptr)
    {
        const GIntBig nMaxSize = CPLAtoGIntBig(pszMaxSize);
        if (nMaxSize > 0)
            oOptions.nMaxMetadataSize = static_cast<size_t>(nMaxSize);
    }

    return oOptions;
}

bool OpenOptions::IsSelected(ElementKind eKind) const
{
    return oSelection.count(eKind) != 0;
}
}  // namespace SDZarr
