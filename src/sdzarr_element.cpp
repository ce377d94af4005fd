#include "sdzarr_element.h"

#include "cpl_string.h"
#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"

using SDZarrErrorUtils::ErrorHandler;
using SDZarrPathUtils::PathParser;

namespace SDZarr
{
namespace
{
template <typename T>
Result<std::shared_ptr<T>, std::string> ExtractSource(const Element::DataSourceResult& oSource,
                                                      const Element& oElement)
{
    if (oSource.IsErr())
        return Err(oSource.Error());
    if (const auto* ppoSource = std::get_if<std::shared_ptr<T>>(&oSource.Value()))
        return *ppoSource;
    return Err(std::string("element '") + oElement.GetPath() + "' has a different kind of data source");
}

std::string FormatShape(const std::vector<uint64_t>& anShape, const std::vector<AxisInfo>& aoAxes)
{
    std::string osText = "(";
    for (size_t i = 0; i < anShape.size(); ++i)
    {
        if (i > 0)
            osText += ", ";
        if (i < aoAxes.size() && anShape.size() == aoAxes.size())
            osText += aoAxes[i].osName + ": ";
        osText += CPLSPrintf(CPL_FRMT_GUIB, static_cast<GUIntBig>(anShape[i]));
    }
    return osText + ")";
}

std::string JoinStrings(const std::vector<std::string>& aosValues)
{
    std::string osText;
    for (size_t i = 0; i < aosValues.size(); ++i)
    {
        if (i > 0)
            osText += ", ";
        osText += aosValues[i];
    }
    return osText;
}
}  // namespace

Element::Element(ElementKind eKind, std::string osKey, std::shared_ptr<const ZarrGroupNode> poNode,
                 NormalizedAttributes oAttributes, std::shared_ptr<StoreReader> poReader)
    : meKind(eKind),
      mKey(std::move(osKey)),
      mPath(PathParser::Join(ElementKindToString(eKind), mKey)),
      mNode(std::move(poNode)),
      mAttributes(std::move(oAttributes)),
      mReader(std::move(poReader)),
      mDataSource(
          [eKind = meKind, osPath = mPath, osVersion = mAttributes.oSpatialData.osVersion, poNodeRef = mNode,
           poReaderRef = mReader]() { return CreateDataSource(eKind, osPath, osVersion, poNodeRef, poReaderRef); })
{
}

Result<std::shared_ptr<Element>, SchemaError> Element::Create(ElementKind eKind, const std::string& key,
                                                              std::shared_ptr<const ZarrGroupNode> poNode,
                                                              std::shared_ptr<StoreReader> poReader)
{
    auto oAttributes = ElementSchemaNormalizer::Normalize(eKind, key, poNode->GetAttributes());
    if (oAttributes.IsErr())
        return Err(oAttributes.Error());
    return std::make_shared<Element>(eKind, key, std::move(poNode), oAttributes.Unwrap(), std::move(poReader));
}

std::string Element::GetColumnarPath() const
{
    return ColumnarPath(meKind, mPath);
}

std::string Element::ColumnarPath(ElementKind eKind, const std::string& osElementPath)
{
    return PathParser::Join(osElementPath, std::string(ElementKindToString(eKind)) + ".parquet");
}

Element::DataSourceResult Element::CreateDataSource(ElementKind eKind, const std::string& osPath,
                                                    const std::string& osVersion,
                                                    const std::shared_ptr<const ZarrGroupNode>& poNode,
                                                    const std::shared_ptr<StoreReader>& poReader)
{
    ErrorHandler::Debug("Creating data source for " + osPath);
    switch (eKind)
    {
        case ElementKind::Images:
        case ElementKind::Labels:
        {
            auto oGroup = poReader->OpenGroup(osPath);
            if (oGroup.IsErr())
                return Err(oGroup.Error());
            return ElementDataSource(oGroup.Unwrap());
        }

        case ElementKind::Shapes:
        {
            // Version 0.1 shapes are stored as arrays (coords, radius) in the element group
            if (osVersion == "0.1")
            {
                auto oGroup = poReader->OpenGroup(osPath);
                if (oGroup.IsErr())
                    return Err(oGroup.Error());
                return ElementDataSource(oGroup.Unwrap());
            }
            auto oColumnar = poReader->OpenColumnar(ColumnarPath(eKind, osPath));
            if (oColumnar.IsErr())
                return Err(oColumnar.Error());
            return ElementDataSource(oColumnar.Unwrap());
        }

        case ElementKind::Points:
        {
            auto oColumnar = poReader->OpenColumnar(ColumnarPath(eKind, osPath));
            if (oColumnar.IsErr())
                return Err(oColumnar.Error());
            return ElementDataSource(oColumnar.Unwrap());
        }

        case ElementKind::Tables:
            return ElementDataSource(std::make_shared<TableSource>(osPath, poNode, poReader));
    }
    return Err(std::string("unknown element kind"));
}

Result<std::shared_ptr<GroupHandle>, std::string> Element::OpenGroup() const
{
    return ExtractSource<GroupHandle>(GetDataSource().get(), *this);
}

Result<std::shared_ptr<ColumnarSource>, std::string> Element::OpenColumnar() const
{
    return ExtractSource<ColumnarSource>(GetDataSource().get(), *this);
}

Result<std::shared_ptr<TableSource>, std::string> Element::OpenTable() const
{
    return ExtractSource<TableSource>(GetDataSource().get(), *this);
}

std::string Element::Describe() const
{
    struct Describer
    {
        const Element& oElement;

        std::string operator()(const RasterAttrs& oRaster) const
        {
            if (oRaster.aoMultiscales.empty() || oRaster.aoMultiscales.front().aoDatasets.empty())
                return "Multiscale raster";
            const Multiscale& oMs = oRaster.aoMultiscales.front();
            std::string osText = CPLSPrintf("Multiscale raster, %d levels", static_cast<int>(oMs.aoDatasets.size()));
            auto poLevel = oElement.GetNode()->Resolve(oMs.aoDatasets.front().osPath);
            if (poLevel && poLevel->IsLeaf())
            {
                const auto& oLeaf = static_cast<const ZarrLeafNode&>(*poLevel);
                osText += ", shape " + FormatShape(oLeaf.GetDeclaredShape(), oMs.aoAxes);
            }
            return osText;
        }

        std::string operator()(const VectorAttrs& oVector) const
        {
            const char* pszWhat = oElement.GetKind() == ElementKind::Points ? "Points" : "Shapes";
            std::string osText = pszWhat;
            if (!oVector.aosAxes.empty())
                osText += " with axes (" + JoinStrings(oVector.aosAxes) + ")";
            return osText;
        }

        std::string operator()(const TableAttrs& oTable) const
        {
            std::string osText = "AnnData table";
            if (!oTable.aosRegions.empty())
                osText += " annotating " + JoinStrings(oTable.aosRegions);
            return osText;
        }
    };

    std::string osText = mKey + ": " + std::visit(Describer{*this}, mAttributes.oPayload);
    if (!mAttributes.bValidated)
        osText += " [unvalidated]";
    return osText;
}
}  // namespace SDZarr
