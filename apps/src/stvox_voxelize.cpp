// Voxelize a selection export and write the slice partition as JSON.
//
// Usage:
//   stvox_voxelize --dataset <d.json> [--config <c.json>] [--gene-colors <g.json>]
//                  [--display <display.json>] [--plane N | --slice-y Y]
//                  [--genes A,B,...] [--output <out.json>]
//
// Without --plane or --slice-y every plane is solid. The output holds the
// scene summary, the render layer plan, the gene legend and the solid/ghost
// voxel lists. A selection with no voxel centers yields an empty result.

#include "stvox/core/io/DatasetIO.hpp"
#include "stvox/core/pipeline/VoxelPipeline.hpp"
#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/GeneSpots.hpp"
#include "stvox/core/util/LoadJson.hpp"
#include "stvox/core/util/Logging.hpp"
#include "stvox/core/util/SlicePartition.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace fs = std::filesystem;

static stvox::GeneSelection parseGeneList(const std::string& list)
{
    std::vector<std::string> parts;
    boost::split(parts, list, boost::is_any_of(","));
    stvox::GeneSelection genes;
    for (auto& g : parts) {
        if (!g.empty())
            genes.insert(g);
    }
    return genes;
}

static nlohmann::json emptyResult(const std::string& reason)
{
    stvox::SlicePartition empty;
    return {
        {"empty", true},
        {"reason", reason},
        {"layers", nlohmann::json::array()},
        {"genes", nlohmann::json::array()},
        {"partition", stvox::io::toJson(empty)}
    };
}

static void emit(const nlohmann::json& result, const std::optional<fs::path>& output)
{
    if (output) {
        stvox::io::writeJson(result, *output);
        stvox::Logger()->info("Wrote {}", output->string());
    } else {
        std::cout << result.dump(2) << "\n";
    }
}

int main(int argc, char* argv[]) {
    po::options_description opts("stvox_voxelize options");
    opts.add_options()
        ("help,h", "Show help")
        ("dataset,d", po::value<std::string>()->required(), "Selection export JSON (bounds, spots, cells)")
        ("config,c", po::value<std::string>(), "Voxel config JSON {voxelSize, totalPlanes}")
        ("gene-colors,g", po::value<std::string>(), "Gene color JSON (object or glyph array)")
        ("display", po::value<std::string>(), "Display options JSON")
        ("plane,p", po::value<int>(), "Partition at this plane")
        ("slice-y", po::value<float>(), "Partition at this render-y")
        ("genes", po::value<std::string>(), "Comma separated genes to keep")
        ("output,o", po::value<std::string>(), "Output JSON (default: stdout)")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, off")
        ("log-file", po::value<std::string>(), "Also append log output to this file");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(opts).run(), vm);
        if (vm.count("help")) {
            std::cout << opts << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return 1;
    }

    if (vm.count("plane") && vm.count("slice-y")) {
        std::cerr << "Error: --plane and --slice-y are mutually exclusive\n";
        return 1;
    }

    stvox::SetLogLevel(vm["log-level"].as<std::string>());
    if (vm.count("log-file") && !stvox::AddLogFile(vm["log-file"].as<std::string>())) {
        std::cerr << "Error: cannot open log file " << vm["log-file"].as<std::string>() << "\n";
        return 1;
    }

    std::optional<fs::path> output;
    if (vm.count("output"))
        output = vm["output"].as<std::string>();

    try {
        const stvox::Dataset dataset = stvox::io::loadDataset(vm["dataset"].as<std::string>());

        stvox::VoxelConfig config;
        if (vm.count("config"))
            config = stvox::io::loadVoxelConfig(vm["config"].as<std::string>());

        stvox::GeneColorTable colors;
        if (vm.count("gene-colors"))
            colors = stvox::io::loadGeneColors(vm["gene-colors"].as<std::string>());

        stvox::DisplayOptions display;
        if (vm.count("display"))
            display = stvox::io::displayOptionsFromJson(stvox::json::load_json_file(vm["display"].as<std::string>()));

        std::optional<stvox::GeneSelection> selection;
        if (vm.count("genes"))
            selection = parseGeneList(vm["genes"].as<std::string>());

        stvox::VoxelScene scene;
        try {
            scene = stvox::buildVoxelScene(dataset, config, colors);
        } catch (const stvox::EmptyRegionError& e) {
            stvox::Logger()->warn("{}; nothing to render", e.what());
            emit(emptyResult(e.what()), output);
            return 0;
        }

        float sliceY = stvox::fullStackSliceY(scene);
        if (vm.count("plane"))
            sliceY = stvox::sliceYForPlane(scene, vm["plane"].as<int>());
        else if (vm.count("slice-y"))
            sliceY = vm["slice-y"].as<float>();

        const stvox::SlicePartition partition =
            stvox::partitionBySlice(scene, sliceY, selection ? &*selection : nullptr);
        const auto layers = stvox::planLayers(partition, display);

        stvox::Logger()->info("Slice y {}: {} solid / {} ghost gene markers, {} layers",
                              sliceY, partition.genes.solid.size(), partition.genes.ghost.size(),
                              layers.size());

        nlohmann::json result = {
            {"empty", scene.empty()},
            {"scene", stvox::io::sceneSummaryToJson(scene)},
            {"layers", stvox::io::toJson(layers)},
            {"genes", stvox::io::toJson(stvox::summarizeGenes(scene.genes, colors))},
            {"partition", stvox::io::toJson(partition)}
        };
        emit(result, output);
    } catch (const std::exception& e) {
        stvox::Logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}
