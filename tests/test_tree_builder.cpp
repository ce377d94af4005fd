#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sdzarr_metadata.h"
#include "sdzarr_tree.h"
#include "test_utils.h"

using namespace SDZarr;
using SDZarrTest::MemoryStoreReader;
using SDZarrTest::ParseJSON;

static ConsolidatedMetadata Normalized(const std::string& osJSON)
{
    return MetadataNormalizer::Normalize(ParseJSON(osJSON)).Unwrap();
}

void testTreeHasOneNodePerPath()
{
    std::cout << "Testing tree construction..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {
        ".zgroup": {"zarr_format": 2},
        ".zattrs": {"note": "root"},
        "images/.zgroup": {"zarr_format": 2},
        "images/blobs/.zgroup": {"zarr_format": 2},
        "images/blobs/.zattrs": {"multiscales": []},
        "images/blobs/0/.zarray": {"shape": [3, 64, 64]},
        "images/blobs/1/.zarray": {"shape": [3, 32, 32]},
        "points/transcripts/points.parquet/.zgroup": {"zarr_format": 2}
    }})");

    auto poReader = std::make_shared<MemoryStoreReader>();
    auto oTree = TreeBuilder::Build(oMetadata, poReader);
    assert(oTree.IsOk());
    auto poRoot = oTree.Value();

    // 5 non-root records, plus the implicit "points" and "points/transcripts" groups
    assert(poRoot->CountNodes() == 7);
    assert(poRoot->GetAttributes().GetString("note") == "root");

    auto poBlobs = poRoot->GetGroup("images") ? poRoot->GetGroup("images")->GetGroup("blobs") : nullptr;
    assert(poBlobs);
    assert(poBlobs->GetPath() == "images/blobs");
    assert(poBlobs->GetAttributes().GetObj("multiscales").IsValid());

    auto poLevel = poBlobs->GetLeaf("0");
    assert(poLevel);
    assert(poLevel->IsLeaf());
    assert(poLevel->GetPath() == "images/blobs/0");
    assert(poLevel->GetDeclaredShape() == std::vector<uint64_t>({3, 64, 64}));
    // Attributes of nodes without .zattrs are an empty object
    assert(poLevel->GetAttributes().IsValid());
    assert(poLevel->GetAttributes().GetChildren().empty());

    auto poImplicit = poRoot->Resolve("points/transcripts");
    assert(poImplicit && poImplicit->IsGroup());
    assert(poRoot->Resolve("images/blobs/1") == poBlobs->GetChild("1"));
    assert(!poRoot->Resolve("images/blobs/0/extra"));
    assert(!poRoot->Resolve("labels"));

    // Building the tree reads no array data
    assert(poReader->GetOpenCount("images/blobs/0") == 0);
    assert(poLevel->GetLoadState() == ZarrLeafNode::LoadState::Unloaded);

    std::cout << "  ✓ Tree mirrors the metadata paths" << std::endl;
}

void testLeafCannotHaveChildren()
{
    std::cout << "Testing array used as parent..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {
        "a/b/.zarray": {"shape": [4]},
        "a/b/c/.zarray": {"shape": [4]}
    }})");

    CPLPushErrorHandler(CPLQuietErrorHandler);
    auto oTree = TreeBuilder::Build(oMetadata, std::make_shared<MemoryStoreReader>());
    CPLPopErrorHandler();

    assert(oTree.IsErr());
    assert(oTree.Error().eKind == TreeBuildError::Kind::LeafUsedAsParent);
    assert(oTree.Error().osPath == "a/b/c");
    assert(oTree.Error().osConflictingPath == "a/b");
    std::cout << "  Message: " << oTree.Error().ToString() << std::endl;

    std::cout << "  ✓ Structural error names the offending path" << std::endl;
}

void testLeafAccessorIsMemoized()
{
    std::cout << "Testing lazy array access..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {
        "tables/table/obs/cell_id/.zarray": {"shape": [3]}
    }})");
    auto poReader = std::make_shared<MemoryStoreReader>();
    poReader->AddArray("tables/table/obs/cell_id", {1.0, 2.0, 3.0});

    auto poRoot = TreeBuilder::Build(oMetadata, poReader).Unwrap();
    auto poLeaf = std::dynamic_pointer_cast<ZarrLeafNode>(poRoot->Resolve("tables/table/obs/cell_id"));
    assert(poLeaf);

    auto oFirst = poLeaf->Load();
    auto oSecond = poLeaf->Load();
    assert(oFirst.IsOk() && oSecond.IsOk());
    assert(oFirst.Value() == oSecond.Value());
    assert(oFirst.Value()->ReadAsDouble().Value().size() == 3);
    assert(poReader->GetOpenCount("tables/table/obs/cell_id") == 1);
    assert(poLeaf->GetLoadCount() == 1);

    std::cout << "  ✓ Two accesses share one handle" << std::endl;
}

void testConcurrentFirstAccess()
{
    std::cout << "Testing concurrent first access..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {"images/blobs/0/.zarray": {"shape": [2]}}})");
    auto poReader = std::make_shared<MemoryStoreReader>();
    poReader->AddArray("images/blobs/0", {0.5, 1.5});

    auto poRoot = TreeBuilder::Build(oMetadata, poReader).Unwrap();
    auto poLeaf = std::dynamic_pointer_cast<ZarrLeafNode>(poRoot->Resolve("images/blobs/0"));

    std::vector<std::shared_ptr<ArrayHandle>> apoHandles(6);
    std::vector<std::thread> aoThreads;
    for (size_t i = 0; i < apoHandles.size(); ++i)
        aoThreads.emplace_back([&poLeaf, &apoHandles, i]() { apoHandles[i] = poLeaf->Get().get().Value(); });
    for (auto& oThread : aoThreads)
        oThread.join();

    for (const auto& poHandle : apoHandles)
        assert(poHandle == apoHandles.front());
    assert(poReader->GetOpenCount("images/blobs/0") == 1);

    std::cout << "  ✓ One open for concurrent callers" << std::endl;
}

void testFailedAccessIsRetried()
{
    std::cout << "Testing retry after a failed array open..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {"labels/cells/0/.zarray": {"shape": [2]}}})");
    auto poReader = std::make_shared<MemoryStoreReader>();
    poReader->AddArray("labels/cells/0", {1.0, 2.0});
    poReader->FailNextOpens("labels/cells/0", 1);

    auto poRoot = TreeBuilder::Build(oMetadata, poReader).Unwrap();
    auto poLeaf = std::dynamic_pointer_cast<ZarrLeafNode>(poRoot->Resolve("labels/cells/0"));

    auto oFailed = poLeaf->Load();
    assert(oFailed.IsErr());
    assert(poLeaf->GetLoadState() == ZarrLeafNode::LoadState::Failed);

    auto oRetried = poLeaf->Load();
    assert(oRetried.IsOk());
    assert(poReader->GetOpenCount("labels/cells/0") == 2);

    std::cout << "  ✓ Failure not cached" << std::endl;
}

void testSerializeTree()
{
    std::cout << "Testing tree serialization..." << std::endl;

    const auto oMetadata = Normalized(R"({"metadata": {
        "images/blobs/.zattrs": {"multiscales": []},
        "images/blobs/0/.zarray": {"shape": [2]}
    }})");
    auto poRoot = TreeBuilder::Build(oMetadata, std::make_shared<MemoryStoreReader>()).Unwrap();

    const CPLJSONObject oJSON = SerializeTree(*poRoot);
    const CPLJSONObject oBlobs = oJSON.GetObj("images/blobs");
    assert(oBlobs.IsValid());
    assert(oBlobs.GetObj("_attrs").GetObj("multiscales").IsValid());
    assert(oBlobs.GetObj("0").GetString("get") == "<lazy>");
    assert(oBlobs.GetObj("0").GetObj("_zarray").GetArray("shape").Size() == 1);
    assert(!oJSON.GetObj("_attrs").IsValid());

    std::cout << "  ✓ Serialized tree marks lazy arrays" << std::endl;
}

int main()
{
    std::cout << "=== Tree Builder Tests ===" << std::endl;
    try
    {
        testTreeHasOneNodePerPath();
        testLeafCannotHaveChildren();
        testLeafAccessorIsMemoized();
        testConcurrentFirstAccess();
        testFailedAccessIsRetried();
        testSerializeTree();
        std::cout << "✅ All tree builder tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
