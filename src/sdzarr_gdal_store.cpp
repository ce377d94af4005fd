#include "sdzarr_gdal_store.h"

#include <limits>

#include "cpl_conv.h"
#include "cpl_string.h"
#include "cpl_vsi.h"
#include "gdal_priv.h"
#include "ogrsf_frmts.h"
#include "sdzarr_errors.h"
#include "sdzarr_path_utils.h"
#include "sdzarr_performance.h"

using SDZarrErrorUtils::ErrorHandler;

namespace SDZarr
{
/**
 * @brief GDAL state shared by a reader and the handles it produced
 */
struct GDALStoreContext
{
    std::mutex oMutex;
    GDALDatasetUniquePtr poMultiDimDS;
    std::shared_ptr<GDALGroup> poRootGroup;
    bool bRootOpenAttempted = false;
    std::string osRootOpenError;
};

namespace
{
std::string ToFullName(const std::string& relativePath)
{
    return "/" + SDZarrPathUtils::PathParser::NormalizeNodePath(relativePath);
}

std::string LastErrorOr(const std::string& fallback)
{
    const char* pszMsg = CPLGetLastErrorMsg();
    if (pszMsg != nullptr && pszMsg[0] != '\0')
        return pszMsg;
    return fallback;
}

class GDALArrayHandle : public ArrayHandle
{
  public:
    GDALArrayHandle(std::shared_ptr<GDALStoreContext> poContext, std::shared_ptr<GDALMDArray> poArray,
                    std::string osPath)
        : mContext(std::move(poContext)), mArray(std::move(poArray)), mPath(std::move(osPath))
    {
    }

    std::string GetPath() const override { return mPath; }

    std::vector<uint64_t> GetShape() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        std::vector<uint64_t> anShape;
        for (const auto& poDim : mArray->GetDimensions())
            anShape.push_back(static_cast<uint64_t>(poDim->GetSize()));
        return anShape;
    }

    std::string GetDataTypeName() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        const GDALExtendedDataType& oType = mArray->GetDataType();
        if (oType.GetClass() == GEDTC_STRING)
            return "string";
        if (oType.GetClass() == GEDTC_COMPOUND)
            return "compound";
        return GDALGetDataTypeName(oType.GetNumericDataType());
    }

    bool IsStringArray() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        return mArray->GetDataType().GetClass() == GEDTC_STRING;
    }

    Result<std::vector<double>, std::string> ReadAsDouble(const ArraySlice& slice) const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        std::vector<GUInt64> anStart;
        std::vector<size_t> anCount;
        std::string osReason;
        if (!BuildWindow(slice, anStart, anCount, osReason))
            return Err(osReason);

        size_t nElements = 1;
        for (size_t nCount : anCount)
            nElements *= nCount;

        std::vector<double> adfValues(nElements);
        if (nElements == 0)
            return adfValues;
        if (!mArray->Read(anStart.data(), anCount.data(), nullptr, nullptr,
                          GDALExtendedDataType::Create(GDT_Float64), adfValues.data()))
        {
            return Err(LastErrorOr("cannot read array " + mPath));
        }
        return adfValues;
    }

    Result<std::vector<std::string>, std::string> ReadAsString(const ArraySlice& slice) const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        std::vector<GUInt64> anStart;
        std::vector<size_t> anCount;
        std::string osReason;
        if (!BuildWindow(slice, anStart, anCount, osReason))
            return Err(osReason);

        size_t nElements = 1;
        for (size_t nCount : anCount)
            nElements *= nCount;

        std::vector<char*> apszValues(nElements, nullptr);
        std::vector<std::string> aosValues;
        if (nElements == 0)
            return aosValues;
        const bool bOK = mArray->Read(anStart.data(), anCount.data(), nullptr, nullptr,
                                      GDALExtendedDataType::CreateString(), apszValues.data());
        aosValues.reserve(nElements);
        for (char* pszValue : apszValues)
        {
            aosValues.emplace_back(pszValue ? pszValue : "");
            CPLFree(pszValue);
        }
        if (!bOK)
            return Err(LastErrorOr("cannot read array " + mPath));
        return aosValues;
    }

  private:
    bool BuildWindow(const ArraySlice& slice, std::vector<GUInt64>& anStart, std::vector<size_t>& anCount,
                     std::string& osReason) const
    {
        const auto& apoDims = mArray->GetDimensions();
        if (slice.IsFull())
        {
            for (const auto& poDim : apoDims)
            {
                anStart.push_back(0);
                anCount.push_back(static_cast<size_t>(poDim->GetSize()));
            }
            return true;
        }
        if (slice.anStart.size() != apoDims.size() || slice.anCount.size() != apoDims.size())
        {
            osReason = CPLSPrintf("slice has %d dimensions, array %s has %d", static_cast<int>(slice.anStart.size()),
                                  mPath.c_str(), static_cast<int>(apoDims.size()));
            return false;
        }
        for (size_t i = 0; i < apoDims.size(); ++i)
        {
            const GUInt64 nSize = apoDims[i]->GetSize();
            if (slice.anStart[i] > nSize || slice.anCount[i] > nSize - slice.anStart[i])
            {
                osReason = CPLSPrintf("slice exceeds dimension %d of %s", static_cast<int>(i), mPath.c_str());
                return false;
            }
            anStart.push_back(slice.anStart[i]);
            anCount.push_back(slice.anCount[i]);
        }
        return true;
    }

    std::shared_ptr<GDALStoreContext> mContext;
    std::shared_ptr<GDALMDArray> mArray;
    std::string mPath;
};

class GDALGroupHandle : public GroupHandle
{
  public:
    GDALGroupHandle(std::shared_ptr<GDALStoreContext> poContext, std::shared_ptr<GDALGroup> poGroup,
                    std::string osPath)
        : mContext(std::move(poContext)), mGroup(std::move(poGroup)), mPath(std::move(osPath))
    {
    }

    std::string GetPath() const override { return mPath; }

    std::vector<std::string> GetArrayNames() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        return mGroup->GetMDArrayNames();
    }

    std::vector<std::string> GetGroupNames() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        return mGroup->GetGroupNames();
    }

    Result<std::shared_ptr<ArrayHandle>, std::string> OpenArray(const std::string& name) const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        auto poArray = mGroup->OpenMDArray(name);
        if (!poArray)
            return Err(LastErrorOr("no array '" + name + "' in " + mPath));
        return std::shared_ptr<ArrayHandle>(
            std::make_shared<GDALArrayHandle>(mContext, poArray, SDZarrPathUtils::PathParser::Join(mPath, name)));
    }

  private:
    std::shared_ptr<GDALStoreContext> mContext;
    std::shared_ptr<GDALGroup> mGroup;
    std::string mPath;
};

class OGRColumnarSource : public ColumnarSource
{
  public:
    OGRColumnarSource(std::shared_ptr<GDALStoreContext> poContext, GDALDatasetUniquePtr poDS, std::string osPath)
        : mContext(std::move(poContext)), mDS(std::move(poDS)), mPath(std::move(osPath))
    {
    }

    ~OGRColumnarSource() override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        mDS.reset();
    }

    std::string GetPath() const override { return mPath; }

    int64_t GetFeatureCount() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        OGRLayer* poLayer = mDS->GetLayer(0);
        return poLayer ? static_cast<int64_t>(poLayer->GetFeatureCount()) : 0;
    }

    std::vector<std::string> GetColumnNames() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        std::vector<std::string> aosNames;
        OGRLayer* poLayer = mDS->GetLayer(0);
        if (poLayer == nullptr)
            return aosNames;
        OGRFeatureDefn* poDefn = poLayer->GetLayerDefn();
        for (int i = 0; i < poDefn->GetFieldCount(); ++i)
            aosNames.emplace_back(poDefn->GetFieldDefn(i)->GetNameRef());
        return aosNames;
    }

    Result<std::vector<double>, std::string> ReadNumericColumn(const std::string& name) const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        OGRLayer* poLayer = mDS->GetLayer(0);
        if (poLayer == nullptr)
            return Err(std::string("no layer in ") + mPath);
        const int iField = poLayer->GetLayerDefn()->GetFieldIndex(name.c_str());
        if (iField < 0)
            return Err("no column '" + name + "' in " + mPath);

        std::vector<double> adfValues;
        poLayer->ResetReading();
        for (auto&& poFeature : *poLayer)
            adfValues.push_back(poFeature->GetFieldAsDouble(iField));
        return adfValues;
    }

    Result<std::vector<std::string>, std::string> ReadGeometriesAsWKT() const override
    {
        std::lock_guard<std::mutex> oLock(mContext->oMutex);
        OGRLayer* poLayer = mDS->GetLayer(0);
        if (poLayer == nullptr)
            return Err(std::string("no layer in ") + mPath);

        std::vector<std::string> aosWKT;
        poLayer->ResetReading();
        for (auto&& poFeature : *poLayer)
        {
            const OGRGeometry* poGeom = poFeature->GetGeometryRef();
            if (poGeom == nullptr)
            {
                aosWKT.emplace_back();
                continue;
            }
            char* pszWKT = nullptr;
            if (poGeom->exportToWkt(&pszWKT) != OGRERR_NONE)
            {
                CPLFree(pszWKT);
                return Err("cannot export geometry of " + mPath);
            }
            aosWKT.emplace_back(pszWKT);
            CPLFree(pszWKT);
        }
        return aosWKT;
    }

  private:
    std::shared_ptr<GDALStoreContext> mContext;
    GDALDatasetUniquePtr mDS;
    std::string mPath;
};
}  // namespace

VSIStoreReader::VSIStoreReader(const StoreLocation& oLocation, size_t nMaxMetadataSize)
    : mLocation(oLocation), mMaxMetadataSize(nMaxMetadataSize), mContext(std::make_shared<GDALStoreContext>())
{
}

VSIStoreReader::~VSIStoreReader() = default;

Result<std::string, std::string> VSIStoreReader::Fetch(const std::string& relativePath) const
{
    const std::string osFullPath = mLocation.Resolve(relativePath);
    CPLErrorReset();
    GByte* pabyData = nullptr;
    vsi_l_offset nSize = 0;
    const GIntBig nMaxSize = mMaxMetadataSize > static_cast<size_t>(std::numeric_limits<GIntBig>::max())
                                 ? -1
                                 : static_cast<GIntBig>(mMaxMetadataSize);
    if (!VSIIngestFile(nullptr, osFullPath.c_str(), &pabyData, &nSize, nMaxSize))
    {
        VSIFree(pabyData);
        return Err(LastErrorOr("cannot read " + osFullPath));
    }
    std::string osContent(reinterpret_cast<const char*>(pabyData), static_cast<size_t>(nSize));
    VSIFree(pabyData);
    return osContent;
}

bool VSIStoreReader::EnsureRootGroup(std::string& osReason) const
{
    if (mContext->poRootGroup)
        return true;
    if (mContext->bRootOpenAttempted)
    {
        osReason = mContext->osRootOpenError;
        return false;
    }
    mContext->bRootOpenAttempted = true;

    SDZARR_PERF_TIMER("VSIStoreReader::EnsureRootGroup");
    const char* const apszDrivers[] = {"Zarr", nullptr};
    const std::string& osPath = mLocation.GetPath();

    // The Zarr driver needs the ZARR:"..." syntax to identify network stores
    if (mLocation.IsRemote())
    {
        const std::string osZarrPath = "ZARR:\"" + osPath + "\"";
        ErrorHandler::Debug("Opening multidimensional root " + osZarrPath);
        mContext->poMultiDimDS.reset(
            GDALDataset::Open(osZarrPath.c_str(), GDAL_OF_MULTIDIM_RASTER | GDAL_OF_READONLY, apszDrivers));
    }
    if (!mContext->poMultiDimDS)
    {
        ErrorHandler::Debug("Opening multidimensional root " + osPath);
        mContext->poMultiDimDS.reset(
            GDALDataset::Open(osPath.c_str(), GDAL_OF_MULTIDIM_RASTER | GDAL_OF_READONLY, apszDrivers));
    }
    if (mContext->poMultiDimDS)
        mContext->poRootGroup = mContext->poMultiDimDS->GetRootGroup();

    if (!mContext->poRootGroup)
    {
        mContext->osRootOpenError = LastErrorOr("cannot open " + osPath + " with the GDAL Zarr driver");
        osReason = mContext->osRootOpenError;
        return false;
    }
    return true;
}

Result<std::shared_ptr<ArrayHandle>, std::string> VSIStoreReader::OpenArray(const std::string& relativePath) const
{
    std::lock_guard<std::mutex> oLock(mContext->oMutex);
    std::string osReason;
    CPLErrorReset();
    if (!EnsureRootGroup(osReason))
        return Err(osReason);

    auto poArray = mContext->poRootGroup->OpenMDArrayFromFullname(ToFullName(relativePath));
    if (!poArray)
        return Err(LastErrorOr("no array at " + relativePath));
    ErrorHandler::Debug("Opened array " + relativePath);
    return std::shared_ptr<ArrayHandle>(std::make_shared<GDALArrayHandle>(mContext, poArray, relativePath));
}

Result<std::shared_ptr<GroupHandle>, std::string> VSIStoreReader::OpenGroup(const std::string& relativePath) const
{
    std::lock_guard<std::mutex> oLock(mContext->oMutex);
    std::string osReason;
    CPLErrorReset();
    if (!EnsureRootGroup(osReason))
        return Err(osReason);

    auto poGroup = mContext->poRootGroup->OpenGroupFromFullname(ToFullName(relativePath));
    if (!poGroup)
        return Err(LastErrorOr("no group at " + relativePath));
    return std::shared_ptr<GroupHandle>(std::make_shared<GDALGroupHandle>(mContext, poGroup, relativePath));
}

Result<std::shared_ptr<ColumnarSource>, std::string> VSIStoreReader::OpenColumnar(
    const std::string& relativePath) const
{
    std::lock_guard<std::mutex> oLock(mContext->oMutex);
    const std::string osFullPath = mLocation.Resolve(relativePath);
    ErrorHandler::Debug("Opening columnar source " + osFullPath);
    CPLErrorReset();

    GDALDatasetUniquePtr poDS(GDALDataset::Open(osFullPath.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!poDS)
        return Err(LastErrorOr("cannot open " + osFullPath));
    if (poDS->GetLayerCount() == 0)
        return Err("no layer in " + osFullPath);
    return std::shared_ptr<ColumnarSource>(
        std::make_shared<OGRColumnarSource>(mContext, std::move(poDS), relativePath));
}
}  // namespace SDZarr
