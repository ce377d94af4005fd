#include <iostream>
#include <string>

#include "cpl_conv.h"
#include "cpl_string.h"
#include "gdal_priv.h"
#include "sdzarr.h"

using namespace SDZarr;

static void Usage()
{
    std::cerr << "Usage: sdzarrinfo [--json] [--cs] [-oo NAME=VALUE]... <store>" << std::endl
              << std::endl
              << "  --json   print the store hierarchy as JSON" << std::endl
              << "  --cs     print the transformation of every element into each coordinate system" << std::endl
              << "  -oo      open option: SELECTION, DEFAULT_COORDINATE_SYSTEM, MULTISCALE_LEVEL," << std::endl
              << "           MAX_METADATA_SIZE" << std::endl;
}

static void PrintElements(const SpatialData& oData)
{
    for (ElementKind eKind : AllElementKinds())
    {
        for (const auto& entry : oData.GetElements(eKind))
            std::cout << "  " << ElementKindToString(eKind) << "/" << entry.second->Describe() << std::endl;
    }
}

static void PrintCoordinateSystems(const SpatialData& oData)
{
    for (const auto& poElement : oData.GetSpatialElements())
    {
        std::cout << poElement->GetPath() << std::endl;
        for (const auto& entry : oData.GetResolver().ResolveAll(*poElement))
            std::cout << "  " << entry.first << ": " << entry.second.ToString() << std::endl;
    }
}

int main(int argc, char** argv)
{
    GDALAllRegister();

    argc = GDALGeneralCmdLineProcessor(argc, &argv, 0);
    if (argc < 1)
        return argc == 0 ? 0 : 1;

    bool bJSON = false;
    bool bCoordinateSystems = false;
    CPLStringList aosOpenOptions;
    std::string osStore;

    for (int i = 1; i < argc; ++i)
    {
        if (EQUAL(argv[i], "--json"))
            bJSON = true;
        else if (EQUAL(argv[i], "--cs"))
            bCoordinateSystems = true;
        else if (EQUAL(argv[i], "-oo") && i + 1 < argc)
            aosOpenOptions.AddString(argv[++i]);
        else if (EQUAL(argv[i], "--help") || EQUAL(argv[i], "-h"))
        {
            Usage();
            CSLDestroy(argv);
            return 0;
        }
        else if (argv[i][0] == '-' && argv[i][1] != '\0')
        {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            Usage();
            CSLDestroy(argv);
            return 1;
        }
        else if (osStore.empty())
            osStore = argv[i];
        else
        {
            std::cerr << "Only one store may be given" << std::endl;
            CSLDestroy(argv);
            return 1;
        }
    }
    CSLDestroy(argv);

    if (osStore.empty())
    {
        Usage();
        return 1;
    }

    OpenOptions oOptions = OpenOptions::FromStringList(aosOpenOptions.List());
    oOptions.fnOnBadElement = [](ElementKind eKind, const std::string& key, const std::string& message)
    { std::cerr << "Skipped " << ElementKindToString(eKind) << "/" << key << ": " << message << std::endl; };

    auto oResult = SpatialData::Open(osStore, oOptions);
    if (oResult.IsErr())
    {
        std::cerr << oResult.Error().ToString() << std::endl;
        GDALDestroyDriverManager();
        return 1;
    }

    std::unique_ptr<SpatialData> poData = oResult.Unwrap();
    if (bJSON)
        std::cout << poData->ToJSON().Format(CPLJSONObject::PrettyFormat::Pretty) << std::endl;
    else
    {
        std::cout << poData->ToString() << std::endl;
        PrintElements(*poData);
    }

    if (bCoordinateSystems)
        PrintCoordinateSystems(*poData);

    poData.reset();
    GDALDestroyDriverManager();
    return 0;
}
