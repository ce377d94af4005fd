#include "sdzarr_transform.h"

#include "cpl_string.h"

namespace SDZarr
{
namespace
{
bool IsNumber(const CPLJSONObject& obj)
{
    const auto eType = obj.GetType();
    return eType == CPLJSONObject::Type::Integer || eType == CPLJSONObject::Type::Long ||
           eType == CPLJSONObject::Type::Double;
}

bool ReadNumbers(const CPLJSONObject& obj, std::vector<double>& adfValues)
{
    if (!obj.IsValid() || obj.GetType() != CPLJSONObject::Type::Array)
        return false;
    const CPLJSONArray oArray = obj.ToArray();
    for (int i = 0; i < oArray.Size(); ++i)
    {
        const CPLJSONObject oItem = oArray[i];
        if (!IsNumber(oItem))
            return false;
        adfValues.push_back(oItem.ToDouble());
    }
    return true;
}

CoordinateSystemRef ReadSystemRef(const CPLJSONObject& obj)
{
    CoordinateSystemRef oRef;
    if (!obj.IsValid())
        return oRef;
    if (obj.GetType() == CPLJSONObject::Type::String)
    {
        oRef.osName = obj.ToString();
        return oRef;
    }
    if (obj.GetType() != CPLJSONObject::Type::Object)
        return oRef;

    oRef.osName = obj.GetString("name");
    const CPLJSONArray oAxes = obj.GetArray("axes");
    if (oAxes.IsValid())
    {
        for (int i = 0; i < oAxes.Size(); ++i)
        {
            const CPLJSONObject oAxis = oAxes[i];
            if (oAxis.GetType() == CPLJSONObject::Type::String)
                oRef.aosAxes.push_back(oAxis.ToString());
            else if (oAxis.GetType() == CPLJSONObject::Type::Object)
                oRef.aosAxes.push_back(oAxis.GetString("name"));
        }
    }
    return oRef;
}

CPLJSONObject WriteSystemRef(const CoordinateSystemRef& oRef)
{
    CPLJSONObject obj;
    obj.Add("name", oRef.osName);
    if (!oRef.aosAxes.empty())
    {
        CPLJSONArray oAxes;
        for (const auto& osAxis : oRef.aosAxes)
        {
            CPLJSONObject oAxis;
            oAxis.Add("name", osAxis);
            oAxes.Add(oAxis);
        }
        obj.Add("axes", oAxes);
    }
    return obj;
}

CPLJSONArray WriteNumbers(const std::vector<double>& adfValues)
{
    CPLJSONArray oArray;
    for (double dfValue : adfValues)
        oArray.Add(dfValue);
    return oArray;
}

std::string FormatNumbers(const std::vector<double>& adfValues)
{
    std::string osText = "[";
    for (size_t i = 0; i < adfValues.size(); ++i)
    {
        if (i > 0)
            osText += ", ";
        osText += CPLSPrintf("%.15g", adfValues[i]);
    }
    return osText + "]";
}

using Matrix3 = std::array<double, 9>;

Matrix3 IdentityMatrix()
{
    return {1, 0, 0, 0, 1, 0, 0, 0, 1};
}

Matrix3 Multiply(const Matrix3& a, const Matrix3& b)
{
    Matrix3 c{};
    for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
            for (int k = 0; k < 3; ++k)
                c[i * 3 + j] += a[i * 3 + k] * b[k * 3 + j];
    return c;
}
}  // namespace

const char* TransformationTypeToString(CoordinateTransformation::Type eType)
{
    switch (eType)
    {
        case CoordinateTransformation::Type::Identity:
            return "identity";
        case CoordinateTransformation::Type::Scale:
            return "scale";
        case CoordinateTransformation::Type::Translation:
            return "translation";
        case CoordinateTransformation::Type::Affine:
            return "affine";
        case CoordinateTransformation::Type::Sequence:
            return "sequence";
    }
    return "unknown";
}

CoordinateTransformation CoordinateTransformation::Identity()
{
    return CoordinateTransformation();
}

CoordinateTransformation CoordinateTransformation::Scale(std::vector<double> adfFactors)
{
    CoordinateTransformation oTransform;
    oTransform.meType = Type::Scale;
    oTransform.mValues = std::move(adfFactors);
    return oTransform;
}

CoordinateTransformation CoordinateTransformation::Translation(std::vector<double> adfOffsets)
{
    CoordinateTransformation oTransform;
    oTransform.meType = Type::Translation;
    oTransform.mValues = std::move(adfOffsets);
    return oTransform;
}

CoordinateTransformation CoordinateTransformation::Affine(std::vector<std::vector<double>> aadfMatrix)
{
    CoordinateTransformation oTransform;
    oTransform.meType = Type::Affine;
    oTransform.mMatrix = std::move(aadfMatrix);
    return oTransform;
}

CoordinateTransformation CoordinateTransformation::Sequence(std::vector<CoordinateTransformation> aoSteps)
{
    CoordinateTransformation oTransform;
    oTransform.meType = Type::Sequence;
    oTransform.mSteps = std::move(aoSteps);
    return oTransform;
}

Result<CoordinateTransformation, std::string> CoordinateTransformation::FromJSON(const CPLJSONObject& oObj)
{
    if (!oObj.IsValid() || oObj.GetType() != CPLJSONObject::Type::Object)
        return Err(std::string("transformation is not an object"));

    const std::string osType = oObj.GetString("type");
    CoordinateTransformation oTransform;

    if (osType == "identity")
    {
        oTransform = Identity();
    }
    else if (osType == "scale" || osType == "translation")
    {
        std::vector<double> adfValues;
        if (!ReadNumbers(oObj.GetObj(osType), adfValues))
            return Err("'" + osType + "' must be an array of numbers");
        if (adfValues.size() < 2)
            return Err("'" + osType + "' needs at least 2 components");
        oTransform = osType == "scale" ? Scale(std::move(adfValues)) : Translation(std::move(adfValues));
    }
    else if (osType == "affine")
    {
        const CPLJSONObject oMatrix = oObj.GetObj("affine");
        if (!oMatrix.IsValid() || oMatrix.GetType() != CPLJSONObject::Type::Array)
            return Err(std::string("'affine' must be an array of rows"));
        const CPLJSONArray oRows = oMatrix.ToArray();
        if (oRows.Size() < 2)
            return Err(std::string("'affine' needs at least 2 rows"));

        std::vector<std::vector<double>> aadfMatrix;
        for (int i = 0; i < oRows.Size(); ++i)
        {
            std::vector<double> adfRow;
            if (!ReadNumbers(oRows[i], adfRow))
                return Err(CPLSPrintf("'affine' row %d is not an array of numbers", i));
            if (adfRow.size() < 2)
                return Err(CPLSPrintf("'affine' row %d needs at least 2 components", i));
            if (!aadfMatrix.empty() && adfRow.size() != aadfMatrix.front().size())
                return Err(std::string("'affine' rows differ in length"));
            aadfMatrix.push_back(std::move(adfRow));
        }
        oTransform = Affine(std::move(aadfMatrix));
    }
    else if (osType == "sequence")
    {
        auto oSteps = ParseList(oObj.GetObj("transformations"));
        if (oSteps.IsErr())
            return Err("sequence: " + oSteps.Error());
        oTransform = Sequence(oSteps.Unwrap());
    }
    else
    {
        return Err("unsupported transformation type '" + osType + "'");
    }

    oTransform.mInput = ReadSystemRef(oObj.GetObj("input"));
    oTransform.mOutput = ReadSystemRef(oObj.GetObj("output"));
    return oTransform;
}

Result<std::vector<CoordinateTransformation>, std::string> CoordinateTransformation::ParseList(
    const CPLJSONObject& oList)
{
    std::vector<CoordinateTransformation> aoTransforms;
    if (oList.IsValid() && oList.GetType() == CPLJSONObject::Type::Object)
    {
        auto oSingle = FromJSON(oList);
        if (oSingle.IsErr())
            return Err(oSingle.Error());
        aoTransforms.push_back(oSingle.Unwrap());
        return aoTransforms;
    }
    if (!oList.IsValid() || oList.GetType() != CPLJSONObject::Type::Array)
        return Err(std::string("transformations must be an array"));

    const CPLJSONArray oArray = oList.ToArray();
    if (oArray.Size() == 0)
        return Err(std::string("transformation list is empty"));
    for (int i = 0; i < oArray.Size(); ++i)
    {
        auto oItem = FromJSON(oArray[i]);
        if (oItem.IsErr())
            return Err(CPLSPrintf("transformation %d: %s", i, oItem.Error().c_str()));
        aoTransforms.push_back(oItem.Unwrap());
    }
    return aoTransforms;
}

CPLJSONObject CoordinateTransformation::ToJSON() const
{
    CPLJSONObject obj;
    obj.Add("type", TransformationTypeToString(meType));
    switch (meType)
    {
        case Type::Identity:
            break;
        case Type::Scale:
            obj.Add("scale", WriteNumbers(mValues));
            break;
        case Type::Translation:
            obj.Add("translation", WriteNumbers(mValues));
            break;
        case Type::Affine:
        {
            CPLJSONArray oRows;
            for (const auto& adfRow : mMatrix)
                oRows.Add(WriteNumbers(adfRow));
            obj.Add("affine", oRows);
            break;
        }
        case Type::Sequence:
        {
            CPLJSONArray oSteps;
            for (const auto& oStep : mSteps)
                oSteps.Add(oStep.ToJSON());
            obj.Add("transformations", oSteps);
            break;
        }
    }
    if (mInput.IsSet())
        obj.Add("input", WriteSystemRef(mInput));
    if (mOutput.IsSet())
        obj.Add("output", WriteSystemRef(mOutput));
    return obj;
}

std::string CoordinateTransformation::ToString() const
{
    switch (meType)
    {
        case Type::Identity:
            return "identity";
        case Type::Scale:
            return "scale" + FormatNumbers(mValues);
        case Type::Translation:
            return "translation" + FormatNumbers(mValues);
        case Type::Affine:
        {
            std::string osText = "affine[";
            for (size_t i = 0; i < mMatrix.size(); ++i)
            {
                if (i > 0)
                    osText += ", ";
                osText += FormatNumbers(mMatrix[i]);
            }
            return osText + "]";
        }
        case Type::Sequence:
        {
            std::string osText = "sequence(";
            for (size_t i = 0; i < mSteps.size(); ++i)
            {
                if (i > 0)
                    osText += " -> ";
                osText += mSteps[i].ToString();
            }
            return osText + ")";
        }
    }
    return "unknown";
}

bool CoordinateTransformation::operator==(const CoordinateTransformation& other) const
{
    return meType == other.meType && mValues == other.mValues && mMatrix == other.mMatrix &&
           mSteps == other.mSteps && mInput.osName == other.mInput.osName &&
           mOutput.osName == other.mOutput.osName;
}

Result<std::array<double, 9>, std::string> ComposeAffine2D(const CoordinateTransformation& oTransform)
{
    using Type = CoordinateTransformation::Type;

    switch (oTransform.GetType())
    {
        case Type::Identity:
            return IdentityMatrix();

        case Type::Scale:
        {
            const auto& adf = oTransform.GetValues();
            const size_t n = adf.size();
            if (n < 2)
                return Err(std::string("scale needs at least 2 components"));
            return Matrix3{adf[n - 2], 0, 0, 0, adf[n - 1], 0, 0, 0, 1};
        }

        case Type::Translation:
        {
            const auto& adf = oTransform.GetValues();
            const size_t n = adf.size();
            if (n < 2)
                return Err(std::string("translation needs at least 2 components"));
            return Matrix3{1, 0, adf[n - 2], 0, 1, adf[n - 1], 0, 0, 1};
        }

        case Type::Affine:
        {
            const auto& aadf = oTransform.GetMatrix();
            if (aadf.size() < 2 || aadf.front().empty())
                return Err(std::string("affine matrix needs at least 2 rows"));
            const size_t nCols = aadf.front().size();
            size_t nOutDims = aadf.size();
            // Drop the homogeneous [0 ... 0 1] row when present
            const auto& adfLast = aadf.back();
            bool bHomogeneous = adfLast.back() == 1.0;
            for (size_t j = 0; j + 1 < adfLast.size() && bHomogeneous; ++j)
                bHomogeneous = adfLast[j] == 0.0;
            if (bHomogeneous)
                --nOutDims;
            if (nCols < 3 || nOutDims < 2)
                return Err(std::string("affine matrix has fewer than 2 spatial dimensions"));

            const auto& adfRow0 = aadf[nOutDims - 2];
            const auto& adfRow1 = aadf[nOutDims - 1];
            return Matrix3{adfRow0[nCols - 3], adfRow0[nCols - 2], adfRow0[nCols - 1],
                           adfRow1[nCols - 3], adfRow1[nCols - 2], adfRow1[nCols - 1],
                           0,                  0,                  1};
        }

        case Type::Sequence:
        {
            Matrix3 oMatrix = IdentityMatrix();
            for (const auto& oStep : oTransform.GetSteps())
            {
                auto oStepMatrix = ComposeAffine2D(oStep);
                if (oStepMatrix.IsErr())
                    return oStepMatrix;
                oMatrix = Multiply(oStepMatrix.Value(), oMatrix);
            }
            return oMatrix;
        }
    }
    return Err(std::string("unknown transformation type"));
}
}  // namespace SDZarr
