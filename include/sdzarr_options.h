#pragma once

#include <cstddef>
#include <functional>
#include <set>
#include <string>

#include "cpl_port.h"
#include "sdzarr_element_kind.h"

namespace SDZarr
{
constexpr const char* DEFAULT_COORDINATE_SYSTEM = "global";
constexpr size_t DEFAULT_MAX_METADATA_SIZE = 100 * 1024 * 1024;

/**
 * @brief Options controlling how a SpatialData store is opened
 *
 * Built from GDAL style NAME=VALUE open options. Unset options fall back to
 * the GDAL configuration options of the same name prefixed with SDZARR_.
 *
 *   SELECTION                  comma separated element kinds to load (default: all)
 *   DEFAULT_COORDINATE_SYSTEM  name used when an element declares none (default: global)
 *   MULTISCALE_LEVEL           raster level whose dataset transformations are applied (default: 0)
 *   MAX_METADATA_SIZE          byte cap for one metadata document (default: 100 MB)
 */
struct OpenOptions
{
    using BadElementCallback =
        std::function<void(ElementKind eKind, const std::string& key, const std::string& message)>;

    std::set<ElementKind> oSelection;
    std::string osDefaultCoordinateSystem = DEFAULT_COORDINATE_SYSTEM;
    int nMultiscaleLevel = 0;
    size_t nMaxMetadataSize = DEFAULT_MAX_METADATA_SIZE;
    BadElementCallback fnOnBadElement;

    OpenOptions();

    static OpenOptions FromStringList(CSLConstList papszOptions);

    bool IsSelected(ElementKind eKind) const;
};
}  // namespace SDZarr
