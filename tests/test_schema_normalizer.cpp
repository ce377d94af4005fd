#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "cpl_error.h"
#include "sdzarr_schema.h"
#include "test_utils.h"

using namespace SDZarr;
using SDZarrTest::ParseJSON;

namespace
{
struct CapturedDiagnostics
{
    std::vector<std::string> aosWarnings;
    std::vector<std::string> aosFailures;
};

void CPL_STDCALL CaptureHandler(CPLErr eErrClass, CPLErrorNum, const char* pszMsg)
{
    auto* poCaptured = static_cast<CapturedDiagnostics*>(CPLGetErrorHandlerUserData());
    if (eErrClass == CE_Warning)
        poCaptured->aosWarnings.push_back(pszMsg);
    else if (eErrClass == CE_Failure)
        poCaptured->aosFailures.push_back(pszMsg);
}
}  // namespace

static const char* IMAGE_ATTRS = R"({
  "multiscales": [{
    "name": "blobs",
    "axes": [{"name": "c", "type": "channel"}, {"name": "y", "type": "space"}, {"name": "x", "type": "space"}],
    "datasets": [
      {"path": "0", "coordinateTransformations": [{"type": "scale", "scale": [1.0, 1.0, 1.0]}]},
      {"path": "1", "coordinateTransformations": [{"type": "scale", "scale": [1.0, 2.0, 2.0]}]}
    ],
    "coordinateTransformations": [{"type": "identity", "output": {"name": "global"}}]
  }],
  "omero": {"channels": [{"label": "DAPI"}, {"label": "GFP"}, {"label": "RFP"}]},
  "spatialdata_attrs": {"version": "0.1"}
})";

void testValidImage()
{
    std::cout << "Testing valid image attributes..." << std::endl;

    auto oResult = ElementSchemaNormalizer::Normalize(ElementKind::Images, "blobs", ParseJSON(IMAGE_ATTRS));
    assert(oResult.IsOk());
    const NormalizedAttributes& oAttrs = oResult.Value();
    assert(oAttrs.bValidated);
    assert(oAttrs.aosIssues.empty());
    assert(oAttrs.oSpatialData.bPresent);
    assert(oAttrs.oSpatialData.osVersion == "0.1");

    const RasterAttrs* poRaster = std::get_if<RasterAttrs>(&oAttrs.oPayload);
    assert(poRaster);
    assert(poRaster->aoMultiscales.size() == 1);
    const Multiscale& oMs = poRaster->aoMultiscales.front();
    assert(oMs.osName == "blobs");
    assert(oMs.aoAxes.size() == 3);
    assert(oMs.aoAxes[1].osName == "y" && oMs.aoAxes[1].osType == "space");
    assert(oMs.aoDatasets.size() == 2);
    assert(oMs.aoDatasets[1].aoTransformations.front().GetValues()[2] == 2.0);
    assert(oMs.aoTransformations.front().GetOutput().osName == "global");
    assert(poRaster->aosChannelLabels == std::vector<std::string>({"DAPI", "GFP", "RFP"}));

    std::cout << "  ✓ Multiscales, axes and channels extracted" << std::endl;
}

void testOmeEnvelopePromoted()
{
    std::cout << "Testing ome envelope promotion..." << std::endl;

    const CPLJSONObject oRaw = ParseJSON(R"({
      "ome": {
        "version": "0.5",
        "multiscales": [{"axes": ["y", "x"], "datasets": [{"path": "0"}]}],
        "omero": {"channels": [{"label": "nuclei"}]}
      },
      "omero": {"channels": [{"label": "stale"}]},
      "spatialdata_attrs": {"version": "0.2"}
    })");

    const CPLJSONObject oPromoted = ElementSchemaNormalizer::PromoteOmeEnvelope(oRaw);
    assert(!oPromoted.GetObj("ome").IsValid());
    assert(oPromoted.GetObj("multiscales").IsValid());
    assert(oPromoted.GetString("version") == "0.5");
    assert(oPromoted.GetObj("spatialdata_attrs").GetString("version") == "0.2");

    auto oResult = ElementSchemaNormalizer::Normalize(ElementKind::Images, "nuclei", oRaw);
    assert(oResult.IsOk());
    const NormalizedAttributes& oAttrs = oResult.Value();
    assert(oAttrs.bValidated);
    assert(!oAttrs.oAttrs.GetObj("ome").IsValid());
    assert(oAttrs.oAttrs.GetObj("omero").IsValid());
    const RasterAttrs* poRaster = std::get_if<RasterAttrs>(&oAttrs.oPayload);
    assert(poRaster->aosChannelLabels == std::vector<std::string>({"nuclei"}));

    // The raw attributes are left untouched
    assert(oRaw.GetObj("ome").IsValid());

    // Attributes without an envelope come back as they are
    const CPLJSONObject oPlain = ParseJSON(IMAGE_ATTRS);
    assert(ElementSchemaNormalizer::PromoteOmeEnvelope(oPlain).Format(CPLJSONObject::PrettyFormat::Plain) ==
           oPlain.Format(CPLJSONObject::PrettyFormat::Plain));

    std::cout << "  ✓ ome siblings lifted, ome key removed" << std::endl;
}

void testInvalidAttributesFallBack()
{
    std::cout << "Testing fallback to raw attributes..." << std::endl;

    const CPLJSONObject oRaw = ParseJSON(R"({
      "multiscales": [{"axes": ["x"], "datasets": []}],
      "custom": 1
    })");

    CapturedDiagnostics oCaptured;
    CPLPushErrorHandlerEx(CaptureHandler, &oCaptured);
    auto oResult = ElementSchemaNormalizer::Normalize(ElementKind::Labels, "cells", oRaw);
    CPLPopErrorHandler();

    assert(oResult.IsOk());
    const NormalizedAttributes& oAttrs = oResult.Value();
    assert(!oAttrs.bValidated);
    assert(!oAttrs.aosIssues.empty());
    assert(oAttrs.oAttrs.GetInteger("custom") == 1);
    assert(oCaptured.aosWarnings.size() == 1);
    assert(oCaptured.aosFailures.empty());
    std::cout << "  Warning: " << oCaptured.aosWarnings.front() << std::endl;
    assert(oCaptured.aosWarnings.front().find("cells") != std::string::npos);

    std::cout << "  ✓ Warning raised, raw attributes used" << std::endl;
}

void testUnsupportedVersionsFail()
{
    std::cout << "Testing unsupported formats..." << std::endl;

    auto oImage = ElementSchemaNormalizer::Normalize(
        ElementKind::Images, "future",
        ParseJSON(R"({"multiscales": [{"axes": ["y", "x"], "datasets": [{"path": "0"}]}],
                      "spatialdata_attrs": {"version": "9.9"}})"));
    assert(oImage.IsErr());
    assert(oImage.Error().eKind == SchemaError::Kind::UnsupportedFormat);
    assert(oImage.Error().osElementKey == "future");
    assert(oImage.Error().osVersion == "9.9");
    std::cout << "  Message: " << oImage.Error().ToString() << std::endl;

    auto oPoints = ElementSchemaNormalizer::Normalize(
        ElementKind::Points, "transcripts",
        ParseJSON(R"({"encoding-type": "ngff:points", "axes": ["x", "y"], "spatialdata_attrs": {"version": "0.7"}})"));
    assert(oPoints.IsErr());

    auto oEncoding = ElementSchemaNormalizer::Normalize(
        ElementKind::Shapes, "cells", ParseJSON(R"({"encoding-type": "geojson", "axes": ["x", "y"]})"));
    assert(oEncoding.IsErr());
    assert(oEncoding.Error().osEncodingType == "geojson");

    auto oPolygons = ElementSchemaNormalizer::Normalize(
        ElementKind::Shapes, "polygons",
        ParseJSON(R"({"encoding-type": "ngff:shapes", "axes": ["x", "y"],
                      "spatialdata_attrs": {"version": "0.1", "geos": {"name": "POLYGON", "type": 3}}})"));
    assert(oPolygons.IsErr());

    std::cout << "  ✓ Undecodable formats are errors" << std::endl;
}

void testVectorAndTableAttributes()
{
    std::cout << "Testing points, shapes and tables..." << std::endl;

    auto oCircles = ElementSchemaNormalizer::Normalize(
        ElementKind::Shapes, "circles",
        ParseJSON(R"({"encoding-type": "ngff:shapes", "axes": ["x", "y"],
                      "coordinateTransformations": [{"type": "scale", "scale": [2.0, 2.0],
                                                     "output": {"name": "global"}}],
                      "spatialdata_attrs": {"version": "0.1", "geos": {"name": "POINT", "type": 0}}})"));
    assert(oCircles.IsOk());
    assert(oCircles.Value().bValidated);
    const VectorAttrs* poVector = std::get_if<VectorAttrs>(&oCircles.Value().oPayload);
    assert(poVector);
    assert(poVector->osEncodingType == "ngff:shapes");
    assert(poVector->aosAxes.size() == 2);
    assert(poVector->aoTransformations.size() == 1);
    assert(poVector->aoTransformations.front().GetType() == CoordinateTransformation::Type::Scale);

    auto oPoints = ElementSchemaNormalizer::Normalize(
        ElementKind::Points, "transcripts",
        ParseJSON(R"({"encoding-type": "ngff:points", "axes": ["x", "y", "z"], "spatialdata_attrs": {"version": "0.1"}})"));
    assert(oPoints.IsOk());
    assert(oPoints.Value().bValidated);

    auto oTable = ElementSchemaNormalizer::Normalize(
        ElementKind::Tables, "table",
        ParseJSON(R"({"encoding-type": "anndata", "encoding-version": "0.1.0",
                      "spatialdata_attrs": {"instance_key": "cell_id", "region": ["blobs_labels"],
                                            "region_key": "region", "version": "0.1"}})"));
    assert(oTable.IsOk());
    const TableAttrs* poTable = std::get_if<TableAttrs>(&oTable.Value().oPayload);
    assert(poTable);
    assert(poTable->osInstanceKey == "cell_id");
    assert(poTable->osRegionKey == "region");
    assert(poTable->aosRegions == std::vector<std::string>({"blobs_labels"}));
    assert(poTable->osEncodingType == "anndata");

    std::cout << "  ✓ Vector and table payloads extracted" << std::endl;
}

int main()
{
    std::cout << "=== Element Schema Tests ===" << std::endl;
    try
    {
        testValidImage();
        testOmeEnvelopePromoted();
        testInvalidAttributesFallBack();
        testUnsupportedVersionsFail();
        testVectorAndTableAttributes();
        std::cout << "✅ All element schema tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
