#include "sdzarr_table.h"

#include <cmath>
#include <stdexcept>

#include "cpl_string.h"
#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"

using SDZarrErrorUtils::ErrorHandler;
using SDZarrPathUtils::PathParser;

namespace SDZarr
{
namespace
{
std::string FormatNumber(double dfValue)
{
    return CPLSPrintf("%.15g", dfValue);
}

std::string ParentPath(const std::string& path)
{
    const size_t nSlash = path.rfind('/');
    return nSlash == std::string::npos ? std::string() : path.substr(0, nSlash);
}
}  // namespace

TableSource::TableSource(std::string osElementPath, std::shared_ptr<const ZarrGroupNode> poTableNode,
                         std::shared_ptr<StoreReader> poReader)
    : mElementPath(std::move(osElementPath)), mTableNode(std::move(poTableNode)), mReader(std::move(poReader))
{
}

CPLJSONObject TableSource::GetNodeAttributes(const std::string& relativePath) const
{
    auto poNode = mTableNode ? mTableNode->Resolve(relativePath) : nullptr;
    if (!poNode)
        throw std::runtime_error("no node '" + relativePath + "' in table " + mElementPath);
    return poNode->GetAttributes();
}

std::shared_ptr<ArrayHandle> TableSource::OpenArray(const std::string& relativePath) const
{
    auto oArray = mReader->OpenArray(PathParser::Join(mElementPath, relativePath));
    if (oArray.IsErr())
        throw std::runtime_error(oArray.Error());
    return oArray.Unwrap();
}

TableSource::Column TableSource::ReadStrings(const std::string& arrayPath) const
{
    auto poArray = OpenArray(arrayPath);
    if (poArray->IsStringArray())
        return poArray->ReadAsString().Unwrap();

    Column aosValues;
    for (double dfValue : poArray->ReadAsDouble().Unwrap())
        aosValues.push_back(FormatNumber(dfValue));
    return aosValues;
}

TableSource::Column TableSource::ReadColumn(const std::string& columnPath) const
{
    const CPLJSONObject oAttrs = GetNodeAttributes(columnPath);
    const std::string osEncoding = oAttrs.GetString("encoding-type");
    const std::string osLegacyCategories = oAttrs.GetString("categories");

    Column aosCategories;
    std::string osCodesPath;
    if (!osLegacyCategories.empty())
    {
        // Older AnnData: codes at the column path, categories in a sibling array
        aosCategories = ReadStrings(PathParser::Join(ParentPath(columnPath), osLegacyCategories));
        osCodesPath = columnPath;
    }
    else if (osEncoding == "categorical")
    {
        aosCategories = ReadStrings(columnPath + "/categories");
        osCodesPath = columnPath + "/codes";
    }
    else if (osEncoding == "string-array")
    {
        const std::string osVersion = oAttrs.GetString("encoding-version");
        if (!osVersion.empty() && osVersion != "0.2.0")
            throw std::runtime_error("unsupported string-array encoding version " + osVersion + " for " +
                                     columnPath);
        return ReadStrings(columnPath);
    }
    else
    {
        return ReadStrings(columnPath);
    }

    auto poCodes = OpenArray(osCodesPath);
    Column aosValues;
    for (double dfCode : poCodes->ReadAsDouble().Unwrap())
    {
        // NaN, negative and out of range codes are missing values
        if (!std::isfinite(dfCode) || dfCode < 0 || dfCode >= static_cast<double>(aosCategories.size()))
            aosValues.emplace_back();
        else
            aosValues.push_back(aosCategories[static_cast<size_t>(dfCode)]);
    }
    return aosValues;
}

std::shared_future<TableSource::Column> TableSource::LoadColumn(const std::string& columnPath)
{
    const std::string osKey = PathParser::NormalizeNodePath(columnPath);
    return mColumnCache.GetOrLoad(osKey,
                                  [this, osKey]()
                                  {
                                      ErrorHandler::Debug("Loading column " + osKey + " of " + mElementPath);
                                      return ReadColumn(osKey);
                                  });
}

std::vector<std::shared_future<TableSource::Column>> TableSource::LoadColumns(
    const std::vector<std::string>& columnPaths)
{
    std::vector<std::shared_future<Column>> aoFutures;
    aoFutures.reserve(columnPaths.size());
    for (const auto& osPath : columnPaths)
        aoFutures.push_back(LoadColumn(osPath));
    return aoFutures;
}

Result<TableSource::Column, std::string> TableSource::GetColumn(const std::string& columnPath)
{
    try
    {
        return LoadColumn(columnPath).get();
    }
    catch (const std::exception& e)
    {
        return Err(std::string(e.what()));
    }
}

Result<TableSource::Column, std::string> TableSource::LoadDataFrameIndex(const std::string& dataFramePath)
{
    CPLJSONObject oAttrs;
    try
    {
        oAttrs = GetNodeAttributes(dataFramePath);
    }
    catch (const std::exception& e)
    {
        return Err(std::string(e.what()));
    }
    const std::string osIndex = oAttrs.GetString("_index");
    if (osIndex.empty())
        return Err("dataframe " + dataFramePath + " of " + mElementPath + " declares no _index");
    return GetColumn(dataFramePath + "/" + osIndex);
}

Result<TableSource::Column, std::string> TableSource::LoadObsIndex()
{
    return LoadDataFrameIndex("obs");
}

Result<TableSource::Column, std::string> TableSource::LoadVarIndex()
{
    return LoadDataFrameIndex("var");
}

Result<std::vector<double>, std::string> TableSource::LoadNumeric(const std::string& arrayPath) const
{
    auto oArray = mReader->OpenArray(PathParser::Join(mElementPath, arrayPath));
    if (oArray.IsErr())
        return Err(oArray.Error());
    return oArray.Value()->ReadAsDouble();
}

std::vector<std::string> TableSource::GetDataFrameColumns(const std::string& dataFramePath) const
{
    std::vector<std::string> aosNames;
    auto poNode = mTableNode ? mTableNode->Resolve(dataFramePath) : nullptr;
    if (!poNode || !poNode->IsGroup())
        return aosNames;

    const auto& oGroup = static_cast<const ZarrGroupNode&>(*poNode);
    const std::string osIndex = oGroup.GetAttributes().GetString("_index");
    for (const auto& entry : oGroup.GetChildren())
    {
        if (entry.first != osIndex)
            aosNames.push_back(entry.first);
    }
    return aosNames;
}

bool TableSource::IsColumnCached(const std::string& columnPath) const
{
    return mColumnCache.Contains(PathParser::NormalizeNodePath(columnPath));
}
}  // namespace SDZarr
