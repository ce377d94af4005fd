#pragma once

#include <string>
#include <vector>

namespace SDZarr
{
/**
 * @brief The five fixed top-level element categories of a SpatialData store
 */
enum class ElementKind
{
    Images,
    Labels,
    Shapes,
    Points,
    Tables
};

const char* ElementKindToString(ElementKind eKind);

/**
 * @brief Parse a category name ("images", "labels", ...), case-insensitive
 * @return false for an unknown name
 */
bool ElementKindFromString(const std::string& name, ElementKind& eKind);

const std::vector<ElementKind>& AllElementKinds();

/**
 * @brief Every kind except tables carries geometry in a coordinate system
 */
bool IsSpatialKind(ElementKind eKind);

bool IsRasterKind(ElementKind eKind);
}  // namespace SDZarr
