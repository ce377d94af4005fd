#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include "cpl_json.h"
#include "sdzarr_metadata.h"
#include "test_utils.h"

using namespace SDZarr;
using SDZarrTest::ParseJSON;

static const char* FLAT_DOC = R"({
  "zarr_consolidated_format": 1,
  "metadata": {
    ".zgroup": {"zarr_format": 2},
    ".zattrs": {"spatialdata_attrs": {"version": "0.1"}},
    "images/.zgroup": {"zarr_format": 2},
    "images/blobs/.zgroup": {"zarr_format": 2},
    "images/blobs/.zattrs": {"multiscales": []},
    "images/blobs/0/.zarray": {"shape": [3, 64, 64], "dtype": "<f8"},
    "images/blobs/0/.zattrs": {"_ARRAY_DIMENSIONS": ["c", "y", "x"]},
    "unrelated-key": 5
  }
})";

// Inverse of the flat to nested conversion, used to check that nothing is lost
static std::map<std::string, std::string> Reflatten(const ConsolidatedMetadata& oMetadata)
{
    std::map<std::string, std::string> oFlat;
    for (const auto& osPath : oMetadata.GetPaths())
    {
        for (const auto& oEntry : oMetadata.GetNode(osPath).GetChildren())
        {
            const std::string osKey = osPath.empty() ? oEntry.GetName() : osPath + "/" + oEntry.GetName();
            oFlat[osKey] = oEntry.Format(CPLJSONObject::PrettyFormat::Plain);
        }
    }
    return oFlat;
}

void testShapeDetection()
{
    std::cout << "Testing metadata shape detection..." << std::endl;

    assert(MetadataNormalizer::DetectShape(ParseJSON(FLAT_DOC)) == MetadataShape::Flat);
    assert(MetadataNormalizer::DetectShape(ParseJSON(R"({"metadata": {"images": {".zgroup": {}}}})")) ==
           MetadataShape::Nested);
    assert(MetadataNormalizer::DetectShape(ParseJSON(
               R"({"zarr_format": 3, "node_type": "group", "consolidated_metadata": {"metadata": {}}})")) ==
           MetadataShape::V3Envelope);
    assert(MetadataNormalizer::DetectShape(ParseJSON(R"({"zarr_format": 3})")) == MetadataShape::Unknown);

    std::string osPath;
    std::string osSuffix;
    assert(MetadataNormalizer::SplitFlatKey("images/blobs/0/.zarray", osPath, osSuffix));
    assert(osPath == "images/blobs/0" && osSuffix == ".zarray");
    assert(MetadataNormalizer::SplitFlatKey(".zattrs", osPath, osSuffix));
    assert(osPath.empty() && osSuffix == ".zattrs");
    assert(!MetadataNormalizer::SplitFlatKey("images/blobs/0/0.0.0", osPath, osSuffix));

    std::cout << "  ✓ Shapes detected" << std::endl;
}

void testFlatIsRekeyed()
{
    std::cout << "Testing flat metadata normalization..." << std::endl;

    const CPLJSONObject oDoc = ParseJSON(FLAT_DOC);
    auto oResult = MetadataNormalizer::Normalize(oDoc);
    assert(oResult.IsOk());
    const ConsolidatedMetadata& oMetadata = oResult.Value();

    assert(oMetadata.GetNodeCount() == 4);
    assert(oMetadata.HasNode(""));
    assert(oMetadata.HasNode("images/blobs"));
    assert(oMetadata.IsArray("images/blobs/0"));
    assert(!oMetadata.IsArray("images/blobs"));
    assert(oMetadata.GetArrayDescriptor("images/blobs/0").GetArray("shape").Size() == 3);
    assert(oMetadata.GetAttributes("images/blobs/0").GetArray("_ARRAY_DIMENSIONS").Size() == 3);
    assert(oMetadata.GetRoot().GetInteger("zarr_consolidated_format") == 1);
    assert(!oMetadata.GetNode("images/missing").IsValid());

    // Every suffixed key survives; the unrecognized key is dropped
    auto oFlat = Reflatten(oMetadata);
    int nSuffixed = 0;
    for (const auto& oEntry : oDoc.GetObj("metadata").GetChildren())
    {
        auto it = oFlat.find(oEntry.GetName());
        if (oEntry.GetName() == "unrelated-key")
        {
            assert(it == oFlat.end());
            continue;
        }
        ++nSuffixed;
        assert(it != oFlat.end());
        assert(it->second == oEntry.Format(CPLJSONObject::PrettyFormat::Plain));
    }
    assert(static_cast<int>(oFlat.size()) == nSuffixed);

    std::cout << "  ✓ Flat keys re-keyed by node path" << std::endl;
}

void testNestedIsUnchanged()
{
    std::cout << "Testing nested metadata passes through..." << std::endl;

    const CPLJSONObject oDoc = ParseJSON(R"({
      "metadata": {
        "": {".zgroup": {"zarr_format": 2}},
        "points/transcripts": {".zattrs": {"encoding-type": "ngff:points"}, ".zgroup": {"zarr_format": 2}}
      }
    })");
    auto oResult = MetadataNormalizer::Normalize(oDoc);
    assert(oResult.IsOk());
    const ConsolidatedMetadata& oMetadata = oResult.Value();

    assert(oMetadata.GetRoot().Format(CPLJSONObject::PrettyFormat::Plain) ==
           oDoc.Format(CPLJSONObject::PrettyFormat::Plain));
    assert(oMetadata.GetNodeCount() == 2);
    assert(oMetadata.GetAttributes("points/transcripts").GetString("encoding-type") == "ngff:points");

    // A nested document normalized twice is the same document
    auto oAgain = MetadataNormalizer::Normalize(oMetadata.GetRoot());
    assert(oAgain.IsOk());
    assert(oAgain.Value().GetPaths() == oMetadata.GetPaths());

    std::cout << "  ✓ Nested metadata unchanged" << std::endl;
}

void testV3Envelope()
{
    std::cout << "Testing zarr v3 consolidated metadata..." << std::endl;

    const CPLJSONObject oDoc = ParseJSON(R"({
      "zarr_format": 3,
      "node_type": "group",
      "attributes": {"spatialdata_attrs": {"version": "0.1"}},
      "consolidated_metadata": {
        "kind": "inline",
        "metadata": {
          "images": {"zarr_format": 3, "node_type": "group", "attributes": {}},
          "images/blobs": {"zarr_format": 3, "node_type": "group", "attributes": {"multiscales": []}},
          "images/blobs/0": {"zarr_format": 3, "node_type": "array", "shape": [3, 64, 64],
                             "data_type": "float64", "attributes": {"dimension_names": ["c", "y", "x"]}}
        }
      }
    })");

    auto oResult = MetadataNormalizer::Normalize(oDoc, MetadataShape::V3Envelope);
    assert(oResult.IsOk());
    const ConsolidatedMetadata& oMetadata = oResult.Value();

    assert(oMetadata.GetNodeCount() == 4);
    assert(oMetadata.GetAttributes("").GetObj("spatialdata_attrs").GetString("version") == "0.1");
    assert(oMetadata.IsArray("images/blobs/0"));
    assert(oMetadata.GetArrayDescriptor("images/blobs/0").GetString("data_type") == "float64");
    assert(!oMetadata.IsArray("images/blobs"));
    assert(oMetadata.GetNode("images/blobs").GetObj(".zgroup").IsValid());
    assert(oMetadata.GetAttributes("images/blobs").GetObj("multiscales").IsValid());

    std::cout << "  ✓ v3 nodes mapped onto .zattrs/.zarray/.zgroup records" << std::endl;
}

void testInvalidDocuments()
{
    std::cout << "Testing invalid documents..." << std::endl;

    auto oArray = MetadataNormalizer::Normalize(ParseJSON("[1, 2, 3]"));
    assert(oArray.IsErr());
    assert(oArray.Error().eKind == NormalizationError::Kind::InvalidDocument);

    auto oNoMetadata = MetadataNormalizer::Normalize(ParseJSON(R"({"zarr_consolidated_format": 1})"));
    assert(oNoMetadata.IsErr());
    std::cout << "  Message: " << oNoMetadata.Error().ToString() << std::endl;

    auto oScalars = MetadataNormalizer::Normalize(ParseJSON(R"({"metadata": {"a": 1}})"));
    assert(oScalars.IsErr());

    // A hint that does not match falls back to detection
    auto oHinted = MetadataNormalizer::Normalize(ParseJSON(FLAT_DOC), MetadataShape::V3Envelope);
    assert(oHinted.IsOk());
    assert(oHinted.Value().GetNodeCount() == 4);

    std::cout << "  ✓ Invalid documents rejected" << std::endl;
}

int main()
{
    std::cout << "=== Metadata Normalizer Tests ===" << std::endl;
    try
    {
        testShapeDetection();
        testFlatIsRekeyed();
        testNestedIsUnchanged();
        testV3Envelope();
        testInvalidDocuments();
        std::cout << "✅ All metadata normalizer tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
