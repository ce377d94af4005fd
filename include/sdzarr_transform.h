#pragma once

#include <array>
#include <string>
#include <vector>

#include "cpl_json.h"
#include "sdzarr_result.h"

namespace SDZarr
{
/**
 * @brief Named coordinate system reference of a transformation (input or output)
 */
struct CoordinateSystemRef
{
    std::string osName;
    std::vector<std::string> aosAxes;

    bool IsSet() const { return !osName.empty(); }
};

/**
 * @brief Tagged coordinate transformation value
 *
 * identity, scale(factors), translation(offsets), affine(matrix) or an
 * ordered sequence of transformations applied first to last.
 */
class CoordinateTransformation
{
  public:
    enum class Type
    {
        Identity,
        Scale,
        Translation,
        Affine,
        Sequence
    };

    CoordinateTransformation() = default;

    static CoordinateTransformation Identity();
    static CoordinateTransformation Scale(std::vector<double> adfFactors);
    static CoordinateTransformation Translation(std::vector<double> adfOffsets);
    static CoordinateTransformation Affine(std::vector<std::vector<double>> aadfMatrix);
    static CoordinateTransformation Sequence(std::vector<CoordinateTransformation> aoSteps);

    /**
     * @brief Parse one NGFF transformation object ({"type": "scale", "scale": [...]}, ...)
     */
    static Result<CoordinateTransformation, std::string> FromJSON(const CPLJSONObject& oObj);

    /**
     * @brief Parse a transformation list; a single object is accepted as a list of one
     *
     * Fails on an empty list or on any invalid entry.
     */
    static Result<std::vector<CoordinateTransformation>, std::string> ParseList(const CPLJSONObject& oList);

    Type GetType() const { return meType; }

    /** @brief Scale factors or translation offsets */
    const std::vector<double>& GetValues() const { return mValues; }
    const std::vector<std::vector<double>>& GetMatrix() const { return mMatrix; }
    const std::vector<CoordinateTransformation>& GetSteps() const { return mSteps; }

    const CoordinateSystemRef& GetInput() const { return mInput; }
    const CoordinateSystemRef& GetOutput() const { return mOutput; }
    void SetInput(CoordinateSystemRef oRef) { mInput = std::move(oRef); }
    void SetOutput(CoordinateSystemRef oRef) { mOutput = std::move(oRef); }

    CPLJSONObject ToJSON() const;
    std::string ToString() const;

    bool operator==(const CoordinateTransformation& other) const;
    bool operator!=(const CoordinateTransformation& other) const { return !(*this == other); }

  private:
    Type meType = Type::Identity;
    std::vector<double> mValues;
    std::vector<std::vector<double>> mMatrix;
    std::vector<CoordinateTransformation> mSteps;
    CoordinateSystemRef mInput;
    CoordinateSystemRef mOutput;
};

const char* TransformationTypeToString(CoordinateTransformation::Type eType);

/**
 * @brief Collapse a transformation onto its two trailing axes as a 3x3 homogeneous matrix
 *
 * The matrix is row major, in the axis order of the transformation (for
 * image axes (c, y, x) the rows are y, x, 1). Sequences compose first to last.
 */
Result<std::array<double, 9>, std::string> ComposeAffine2D(const CoordinateTransformation& oTransform);
}  // namespace SDZarr
