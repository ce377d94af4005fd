#include "sdzarr_element_kind.h"

#include "cpl_port.h"

namespace SDZarr
{
const char* ElementKindToString(ElementKind eKind)
{
    switch (eKind)
    {
        case ElementKind::Images:
            return "images";
        case ElementKind::Labels:
            return "labels";
        case ElementKind::Shapes:
            return "shapes";
        case ElementKind::Points:
            return "points";
        case ElementKind::Tables:
            return "tables";
    }
    return "unknown";
}

bool ElementKindFromString(const std::string& name, ElementKind& eKind)
{
    for (ElementKind eCandidate : AllElementKinds())
    {
        if (EQUAL(name.c_str(), ElementKindToString(eCandidate)))
        {
            eKind = eCandidate;
            return true;
        }
    }
    return false;
}

const std::vector<ElementKind>& AllElementKinds()
{
    static const std::vector<ElementKind> aeKinds = {ElementKind::Images, ElementKind::Labels, ElementKind::Shapes,
                                                     ElementKind::Points, ElementKind::Tables};
    return aeKinds;
}

bool IsSpatialKind(ElementKind eKind)
{
    return eKind != ElementKind::Tables;
}

bool IsRasterKind(ElementKind eKind)
{
    return eKind == ElementKind::Images || eKind == ElementKind::Labels;
}
}  // namespace SDZarr
