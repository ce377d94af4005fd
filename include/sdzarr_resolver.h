#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sdzarr_element.h"
#include "sdzarr_error_types.h"
#include "sdzarr_options.h"
#include "sdzarr_result.h"
#include "sdzarr_transform.h"

namespace SDZarr
{
/**
 * @brief Finds the transformation mapping an element into a coordinate system
 *
 * Sources, highest priority first:
 *   1. spatialdata_attrs.coordinateSystems of the element (name -> transformation)
 *   2. element or multiscale transformations: those with an output name
 *      target that coordinate system, those without apply to every
 *      coordinate system the element declares
 *   3. transformations of the selected multiscale level (raster only)
 *
 * The chain for a coordinate system is [level transformations..., element
 * transformation(s)...]; it is returned as identity when empty, as the single
 * transformation when it has one entry, and as a sequence otherwise. An
 * element that declares no coordinate system is placed in the default one.
 */
class TransformationResolver
{
  public:
    explicit TransformationResolver(std::string osDefaultCoordinateSystem = DEFAULT_COORDINATE_SYSTEM,
                                     int nMultiscaleLevel = 0);

    std::map<std::string, CoordinateTransformation> ResolveAll(const Element& oElement) const;

    /**
     * @brief Transformation into one coordinate system
     * @param target Coordinate system name; when empty the default system, or
     *               failing that the first declared one, is used
     * @return CoordinateSystemNotFound carrying the systems the element supports,
     *         or InvalidTransformation when the system is declared with a malformed list
     */
    Result<CoordinateTransformation, ResolutionError> Resolve(
        const Element& oElement, const std::optional<std::string>& target = std::nullopt) const;

    /**
     * @brief Union of the coordinate systems of all spatial elements (tables are skipped)
     */
    std::set<std::string> ResolveAllSystems(const std::vector<std::shared_ptr<const Element>>& apoElements) const;

    const std::string& GetDefaultCoordinateSystem() const { return mDefaultCoordinateSystem; }

  private:
    std::string mDefaultCoordinateSystem;
    int mMultiscaleLevel;
};
}  // namespace SDZarr
