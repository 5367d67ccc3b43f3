// Write a synthetic selection export for demos and tests.
//
// Usage:
//   stvox_gen_dataset --output <d.json> [--seed S] [--planes N] [--cells N]
//                     [--spots-per-plane N]

#include "stvox/core/io/DatasetIO.hpp"
#include "stvox/core/util/Logging.hpp"
#include "stvox/core/util/TestDataset.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description opts("stvox_gen_dataset options");
    opts.add_options()
        ("help,h", "Show help")
        ("output,o", po::value<std::string>()->required(), "Output dataset JSON")
        ("seed", po::value<uint64_t>()->default_value(1), "Random seed")
        ("planes", po::value<int>()->default_value(6), "Number of planes in the stack")
        ("cells", po::value<int>()->default_value(12), "Number of distinct cells")
        ("spots-per-plane", po::value<int>()->default_value(25), "Average spots per plane")
        ("depth", po::value<float>()->default_value(120.0f), "Stack depth in pixels")
        ("no-cell-colors", "Leave cells without a fill color");

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

    stvox::TestDatasetOptions options;
    options.planes = vm["planes"].as<int>();
    options.cells = vm["cells"].as<int>();
    options.spotsPerPlane = vm["spots-per-plane"].as<int>();
    options.bounds.depth = vm["depth"].as<float>();
    options.colorCells = !vm.count("no-cell-colors");

    if (options.planes < 1 || options.cells < 0 || options.spotsPerPlane < 0) {
        std::cerr << "Error: --planes must be >= 1, --cells and --spots-per-plane >= 0\n";
        return 1;
    }

    const uint64_t seed = vm["seed"].as<uint64_t>();
    const stvox::Dataset dataset = stvox::generateTestDataset(seed, options);

    try {
        stvox::io::writeJson(stvox::io::toJson(dataset), vm["output"].as<std::string>());
    } catch (const std::exception& e) {
        stvox::Logger()->error("{}", e.what());
        return 1;
    }

    stvox::Logger()->info("Wrote {} spots and {} cell boundaries over {} planes (seed {})",
                          dataset.spots.size(), dataset.cells.size(), options.planes, seed);
    return 0;
}
