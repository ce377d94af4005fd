#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cpl_error.h"
#include "sdzarr_element.h"
#include "sdzarr_resolver.h"
#include "test_utils.h"

using namespace SDZarr;
using SDZarrTest::MemoryStoreReader;
using SDZarrTest::ParseJSON;

static std::shared_ptr<Element> MakeElement(ElementKind eKind, const std::string& key, const std::string& osAttrs)
{
    auto poNode = std::make_shared<ZarrGroupNode>(key, std::string(ElementKindToString(eKind)) + "/" + key,
                                                  ParseJSON(osAttrs));
    return Element::Create(eKind, key, poNode, std::make_shared<MemoryStoreReader>()).Unwrap();
}

static const char* IMAGE_IN_GLOBAL = R"({
  "multiscales": [{
    "axes": ["c", "y", "x"],
    "datasets": [
      {"path": "0", "coordinateTransformations": [{"type": "scale", "scale": [1.0, 1.0, 1.0]}]},
      {"path": "1", "coordinateTransformations": [{"type": "scale", "scale": [1.0, 2.0, 2.0]}]}
    ],
    "coordinateTransformations": [{"type": "identity", "input": {"name": "cyx"}, "output": {"name": "global"}}]
  }],
  "spatialdata_attrs": {"version": "0.1"}
})";

void testSingleCoordinateSystem()
{
    std::cout << "Testing element with one coordinate system..." << std::endl;

    auto poImage = MakeElement(ElementKind::Images, "blobs", IMAGE_IN_GLOBAL);
    TransformationResolver oResolver;

    auto oAll = oResolver.ResolveAll(*poImage);
    assert(oAll.size() == 1);
    assert(oAll.count("global") == 1);

    // Level 0 scale followed by the element identity
    const CoordinateTransformation& oGlobal = oAll.at("global");
    assert(oGlobal.GetType() == CoordinateTransformation::Type::Sequence);
    assert(oGlobal.GetSteps().size() == 2);
    assert(oGlobal.GetSteps()[0].GetType() == CoordinateTransformation::Type::Scale);
    assert(oGlobal.GetSteps()[1].GetType() == CoordinateTransformation::Type::Identity);

    auto oDefault = oResolver.Resolve(*poImage);
    assert(oDefault.IsOk());
    assert(oDefault.Value() == oGlobal);

    auto oMissing = oResolver.Resolve(*poImage, std::string("other"));
    assert(oMissing.IsErr());
    assert(oMissing.Error().eKind == ResolutionError::Kind::CoordinateSystemNotFound);
    assert(oMissing.Error().osRequested == "other");
    assert(oMissing.Error().aosAvailable == std::vector<std::string>({"global"}));
    std::cout << "  Message: " << oMissing.Error().ToString() << std::endl;

    std::cout << "  ✓ global resolves, other is reported with the available systems" << std::endl;
}

void testMultiscaleLevel()
{
    std::cout << "Testing multiscale level selection..." << std::endl;

    auto poImage = MakeElement(ElementKind::Images, "blobs", IMAGE_IN_GLOBAL);

    TransformationResolver oLevelOne(DEFAULT_COORDINATE_SYSTEM, 1);
    auto oMatrix = ComposeAffine2D(oLevelOne.Resolve(*poImage).Unwrap()).Unwrap();
    assert(oMatrix[0] == 2.0 && oMatrix[4] == 2.0);

    // Levels past the last one use the coarsest level
    TransformationResolver oLevelNine(DEFAULT_COORDINATE_SYSTEM, 9);
    auto oCoarsest = ComposeAffine2D(oLevelNine.Resolve(*poImage).Unwrap()).Unwrap();
    assert(oCoarsest[0] == 2.0);

    std::cout << "  ✓ Dataset transformations of the selected level applied" << std::endl;
}

void testExplicitCoordinateSystems()
{
    std::cout << "Testing spatialdata_attrs coordinate systems..." << std::endl;

    auto poShapes = MakeElement(ElementKind::Shapes, "cells", R"({
      "encoding-type": "ngff:shapes",
      "axes": ["x", "y"],
      "coordinateTransformations": [{"type": "scale", "scale": [0.5, 0.5]}],
      "spatialdata_attrs": {
        "version": "0.2",
        "coordinateSystems": {
          "aligned": [{"type": "translation", "translation": [100.0, 50.0]}],
          "global": {"type": "identity"}
        }
      }
    })");

    TransformationResolver oResolver;
    auto oAll = oResolver.ResolveAll(*poShapes);
    assert(oAll.size() == 2);
    assert(oAll.at("aligned").GetType() == CoordinateTransformation::Type::Translation);
    assert(oAll.at("global").GetType() == CoordinateTransformation::Type::Identity);

    auto oAligned = oResolver.Resolve(*poShapes, std::string("aligned"));
    assert(oAligned.IsOk());
    assert(oAligned.Value().GetValues()[0] == 100.0);

    std::cout << "  ✓ Declared coordinate systems take priority" << std::endl;
}

void testMalformedCoordinateSystem()
{
    std::cout << "Testing malformed coordinate system entry..." << std::endl;

    auto poShapes = MakeElement(ElementKind::Shapes, "cells", R"({
      "encoding-type": "ngff:shapes",
      "axes": ["x", "y"],
      "spatialdata_attrs": {
        "version": "0.2",
        "coordinateSystems": {
          "aligned": [{"type": "translation", "translation": [1.0, 2.0]}],
          "broken": []
        }
      }
    })");

    TransformationResolver oResolver;
    CPLPushErrorHandler(CPLQuietErrorHandler);
    auto oAll = oResolver.ResolveAll(*poShapes);
    auto oBroken = oResolver.Resolve(*poShapes, std::string("broken"));
    auto oUnknown = oResolver.Resolve(*poShapes, std::string("unknown"));
    CPLPopErrorHandler();

    assert(oAll.size() == 1);
    assert(oAll.count("aligned") == 1);

    assert(oBroken.IsErr());
    assert(oBroken.Error().eKind == ResolutionError::Kind::InvalidTransformation);
    assert(oBroken.Error().osDetail.find("broken") != std::string::npos);
    assert(oBroken.Error().aosAvailable == std::vector<std::string>({"aligned"}));
    std::cout << "  Message: " << oBroken.Error().ToString() << std::endl;

    assert(oUnknown.IsErr());
    assert(oUnknown.Error().eKind == ResolutionError::Kind::CoordinateSystemNotFound);

    std::cout << "  ✓ Malformed list reported as an invalid transformation" << std::endl;
}

void testUndeclaredElementUsesDefault()
{
    std::cout << "Testing element without declared coordinate system..." << std::endl;

    auto poPoints = MakeElement(ElementKind::Points, "transcripts", R"({
      "encoding-type": "ngff:points",
      "axes": ["x", "y"],
      "coordinateTransformations": [{"type": "scale", "scale": [3.0, 3.0]}]
    })");

    TransformationResolver oResolver("microscope");
    auto oAll = oResolver.ResolveAll(*poPoints);
    assert(oAll.size() == 1);
    assert(oAll.at("microscope").GetType() == CoordinateTransformation::Type::Scale);

    auto poBare = MakeElement(ElementKind::Points, "bare", R"({"encoding-type": "ngff:points", "axes": ["x", "y"]})");
    auto oBare = oResolver.Resolve(*poBare);
    assert(oBare.IsOk());
    assert(oBare.Value().GetType() == CoordinateTransformation::Type::Identity);

    std::cout << "  ✓ Untargeted transformations land in the default system" << std::endl;
}

void testUnionOverElements()
{
    std::cout << "Testing coordinate systems of several elements..." << std::endl;

    auto poImage = MakeElement(ElementKind::Images, "blobs", IMAGE_IN_GLOBAL);
    auto poShapes = MakeElement(ElementKind::Shapes, "cells", R"({
      "encoding-type": "ngff:shapes", "axes": ["x", "y"],
      "coordinateTransformations": [{"type": "identity", "output": {"name": "aligned"}}],
      "spatialdata_attrs": {"version": "0.2"}
    })");
    auto poTable = MakeElement(ElementKind::Tables, "table", R"({
      "spatialdata_attrs": {"coordinateSystems": {"ignored": {"type": "identity"}}}
    })");

    TransformationResolver oResolver;
    auto oSystems = oResolver.ResolveAllSystems({poImage, poShapes, poTable});
    assert(oSystems == std::set<std::string>({"global", "aligned"}));
    assert(oResolver.ResolveAll(*poTable).empty());

    std::cout << "  ✓ Union is {global, aligned}, tables skipped" << std::endl;
}

int main()
{
    std::cout << "=== Transformation Resolver Tests ===" << std::endl;
    try
    {
        testSingleCoordinateSystem();
        testMultiscaleLevel();
        testExplicitCoordinateSystems();
        testMalformedCoordinateSystem();
        testUndeclaredElementUsesDefault();
        testUnionOverElements();
        std::cout << "✅ All resolver tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
