#include "ffpfact/descriptors.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/descriptors/statistics.hpp"
#include "ffpfact/descriptors/tessellation.hpp"
#include "ffpfact/io.hpp"
#include "ffpfact/prediction.hpp"
#include "ffpfact/structure.hpp"
#include "ffpfact/utils.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#ifdef FFPFACT_WITH_TBB
#include <tbb/global_control.h>
#endif

using namespace ffpfact;

void printVersion() {
    std::cout << "\033[1;36mffpfact\033[0m (force-field precursor site features) v0.1.0" << std::endl;
}

void printHelp(const cxxopts::Options& options) {
    std::cout << options.help() << std::endl;
}

void printLabels(const FeatureAssembler& assembler) {
    for (const auto& name : assembler.getBlockNames()) {
        const SiteFingerprint* block = assembler.getBlock(name);
        std::cout << "\033[1;32m# " << name << "\033[0m (" << block->featureCount() << "): "
                  << block->getDescription() << std::endl;
        for (const auto& label : block->featureLabels()) {
            std::cout << label << std::endl;
        }
    }
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("ffpfact", "Per-site descriptors and force-field precursor prediction for atomic structures");

    options.add_options()
        ("h,help", "Print usage information")
        ("v,version", "Display version information")
        ("labels", "Print the feature column labels and exit");

    options.add_options("Input/Output")
        ("i,input", "Structure JSON file", cxxopts::value<std::string>())
        ("f,facets", "Precomputed Voronoi facets JSON file", cxxopts::value<std::string>())
        ("o,output", "Output file (feature CSV, or structure JSON with --predict)", cxxopts::value<std::string>())
        ("element-table", "JSON table of ionization energies and electronegativities", cxxopts::value<std::string>());

    options.add_options("Descriptors")
        ("tolerance", "Bond length tolerance added to the covalent radii (Angstrom)",
            cxxopts::value<double>()->default_value("0.5"))
        ("cutoff", "Voronoi tessellation cutoff radius (Angstrom)", cxxopts::value<double>()->default_value("6.5"))
        ("use-weights", "Add weighted i-fold symmetry indices")
        ("weight-field", "Facet weight: solid_angle, area, volume or face_dist",
            cxxopts::value<std::string>()->default_value("solid_angle"))
        ("stats-vol", "Voronoi volume statistics", cxxopts::value<std::string>()->default_value("mean,std_dev,minimum,maximum"))
        ("stats-area", "Voronoi area statistics", cxxopts::value<std::string>()->default_value("mean,std_dev,minimum,maximum"))
        ("stats-dist", "Neighbour distance statistics", cxxopts::value<std::string>()->default_value("mean,std_dev,minimum,maximum"))
        ("on-site-error", "What to do with a failing site: abort or skip", cxxopts::value<std::string>()->default_value("abort"));

    options.add_options("Prediction")
        ("p,predict", "Comma-separated force-field precursors to predict, or 'all'", cxxopts::value<std::string>())
        ("m,models", "Directory with the pretrained scalers and models", cxxopts::value<std::string>());

    options.add_options("Performance")
        ("t,threads", "Number of parallel threads (0=auto)", cxxopts::value<int>())
        ("log-level", "DEBUG, INFO, WARNING, ERROR or FATAL", cxxopts::value<std::string>()->default_value("WARNING"))
        ("verbose", "Enable detailed logging output");

    options.set_width(100);

    // Fast help/version display
    if (argc == 1 || (argc > 1 && (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0))) {
        printHelp(options);
        return 0;
    }
    if (argc > 1 && (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0)) {
        printVersion();
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) { printHelp(options); return 0; }
        if (result.count("version")) { printVersion(); return 0; }

        // Configure global settings
        globalConfig.numThreads = result.count("threads") ? result["threads"].as<int>() : 0;
        globalConfig.verbose = result.count("verbose") > 0;
        globalConfig.logLevel = result["log-level"].as<std::string>();

        if (globalConfig.verbose) {
            globalLogger.setMinLevel(LogLevel::DEBUG);
            globalLogger.info("Verbose mode enabled.");
        } else {
            globalLogger.setMinLevel(parseLogLevel(globalConfig.logLevel));
        }

        if (globalConfig.numThreads <= 0) {
            int availableCores = static_cast<int>(std::thread::hardware_concurrency());
            globalConfig.numThreads = availableCores > 1 ? availableCores - 1 : 1;
            globalLogger.info("Auto-configured to use " + std::to_string(globalConfig.numThreads) + " threads.");
        }

#ifdef FFPFACT_WITH_TBB
        tbb::global_control globalLimit(tbb::global_control::max_allowed_parallelism,
                                        static_cast<std::size_t>(globalConfig.numThreads));
#else
        if (globalConfig.numThreads > 1) {
            globalLogger.info("Built without TBB, running single-threaded.");
            globalConfig.numThreads = 1;
        }
#endif

        // Descriptor configuration is validated before any file is read
        AssemblerOptions assemblerOptions;
        assemblerOptions.bondTolerance = result["tolerance"].as<double>();
        assemblerOptions.tessellationCutoff = result["cutoff"].as<double>();
        assemblerOptions.voronoi.useWeights = result.count("use-weights") > 0;
        assemblerOptions.voronoi.weightField = descriptors::parseFacetWeight(result["weight-field"].as<std::string>());
        assemblerOptions.voronoi.volumeStats =
            descriptors::parseStatistics(util::splitList(result["stats-vol"].as<std::string>()));
        assemblerOptions.voronoi.areaStats =
            descriptors::parseStatistics(util::splitList(result["stats-area"].as<std::string>()));
        assemblerOptions.voronoi.distanceStats =
            descriptors::parseStatistics(util::splitList(result["stats-dist"].as<std::string>()));
        assemblerOptions.voronoi.validate();
        assemblerOptions.policy = parseSiteErrorPolicy(result["on-site-error"].as<std::string>());

        std::vector<prediction::PrecursorType> precursors;
        std::unique_ptr<prediction::PredictionPipeline> pipeline;
        const bool predict = result.count("predict") > 0;
        if (predict) {
            precursors = prediction::parsePrecursorRequest(util::splitList(result["predict"].as<std::string>()));
            if (!result.count("models")) {
                globalLogger.error("--predict requires --models");
                return 1;
            }
            pipeline = std::make_unique<prediction::PredictionPipeline>(
                std::make_shared<prediction::JsonModelStore>(result["models"].as<std::string>()));
        }

        descriptors::ElementalPropertyTable loadedTable;
        const descriptors::ElementalPropertyTable* table = &descriptors::ElementalPropertyTable::builtin();
        if (result.count("element-table")) {
            loadedTable = descriptors::ElementalPropertyTable::fromFile(result["element-table"].as<std::string>());
            table = &loadedTable;
            globalLogger.info("Loaded " + std::to_string(loadedTable.size()) + " elements from " +
                              result["element-table"].as<std::string>());
        }

        if (result.count("labels")) {
            auto none = std::make_shared<descriptors::PrecomputedTessellation>(
                "", assemblerOptions.tessellationCutoff, descriptors::SiteFacets());
            printLabels(FeatureAssembler::standard(*table, none, assemblerOptions));
            return 0;
        }

        if (!result.count("input") || !result.count("facets") || !result.count("output")) {
            std::cerr << "\033[1;31mError:\033[0m input, facets and output are required arguments." << std::endl;
            printHelp(options);
            return 1;
        }

        const std::string inputPath = result["input"].as<std::string>();
        const std::string facetsPath = result["facets"].as<std::string>();
        const std::string outputPath = result["output"].as<std::string>();

        for (const auto& path : {inputPath, facetsPath}) {
            if (!std::filesystem::exists(std::filesystem::path(path))) {
                globalLogger.error("Input file does not exist: " + path);
                return 1;
            }
        }

        auto startTime = std::chrono::steady_clock::now();

        Structure structure = Structure::fromFile(inputPath);
        globalLogger.info("Loaded structure '" + structure.getName() + "' with " +
                          std::to_string(structure.size()) + " sites");

        auto precomputed = std::make_shared<descriptors::PrecomputedTessellation>(
            descriptors::PrecomputedTessellation::fromFile(facetsPath));
        auto tessellation = std::make_shared<descriptors::CachingTessellation>(precomputed);

        FeatureAssembler assembler = FeatureAssembler::standard(*table, tessellation, assemblerOptions);
        FeatureMatrix features = assembler.assemble(structure);

        if (pipeline) {
            pipeline->annotate(structure, features, precursors);
            structure.writeJSON(outputPath);
        } else {
            FeatureWriter writer(outputPath, features.labels);
            writer.writeStructure(structure.getName(), features);
            writer.flush();
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        std::cout << "\033[1;32m✓\033[0m Featurized \033[1m" << features.rows() << "\033[0m of "
                  << structure.size() << " sites (" << features.cols() << " features)" << std::endl;
        if (!features.skipped.empty()) {
            std::cout << "\033[1;33m!\033[0m Skipped \033[1m" << features.skipped.size() << "\033[0m sites" << std::endl;
        }
        std::cout << "\033[1;32m✓\033[0m Results written to \033[1m" << outputPath << "\033[0m" << std::endl;
        globalLogger.info("Total processing time: " + std::to_string(duration.count() / 1000.0) + " seconds");

    } catch (const cxxopts::exceptions::exception& e) {
        globalLogger.error("Error parsing options: " + std::string(e.what()));
        return 1;
    } catch (const DescriptorException& e) {
        globalLogger.error(std::string(errorCodeName(e.getCode())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        globalLogger.error(std::string("Error: ") + e.what());
        return 1;
    }

    return 0;
}
