#include <sstream>
#include <string>

#include <catch2/catch.hpp>

#include "ffpfact/descriptors.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/descriptors/fingerprints.hpp"
#include "ffpfact/descriptors/tessellation.hpp"
#include "ffpfact/io.hpp"
#include "ffpfact/utils.hpp"

#include "helpers.hpp"

using namespace ffpfact;
using namespace ffpfact::descriptors;

TEST_CASE("feature assembler") {
    const auto& table = ElementalPropertyTable::builtin();
    auto tessellation = std::make_shared<CountingTessellation>(fcc_facets());
    auto assembler = FeatureAssembler::standard(table, tessellation);

    auto chain = linear_chain({"C", "N", "O", "C"}, 1.4);
    attach_external_blocks(chain);

    SECTION("block order") {
        CHECK(assembler.getBlockNames() == std::vector<std::string>{
            "agni", "crystal_nn", "shell", "op_site", "voronoi"
        });
        CHECK(assembler.getBlock("agni")->featureCount() == 8);
        CHECK(assembler.getBlock("crystal_nn")->featureCount() == 24);
        CHECK(assembler.getBlock("shell")->featureCount() == 10);
        CHECK(assembler.getBlock("op_site")->featureCount() == 37);
        CHECK(assembler.getBlock("voronoi")->featureCount() == 30);
        CHECK(assembler.getBlock("missing") == nullptr);
    }

    SECTION("labels") {
        auto labels = assembler.featureLabels();
        REQUIRE(labels.size() == 109);
        CHECK(assembler.featureCount() == 109);
        CHECK(labels[0] == "AGNI eta=8.00e-01");
        CHECK(labels[7] == "AGNI eta=1.60e+01");
        CHECK(labels[8] == "wt CN_1");
        CHECK(labels[31] == "wt CN_24");
        CHECK(labels[32] == "site_ionization_energy");
        CHECK(labels[41] == "shell2_mean_distance");
        CHECK(labels[42] == "sgl_bd CN_1");
        CHECK(labels[78] == "q6 CN_12");
        CHECK(labels[79] == "Voro_index_3");
        CHECK(labels[108] == "Voro_dist_maximum");
    }

    SECTION("columns follow the block order") {
        auto features = assembler.assemble(chain);
        REQUIRE(features.rows() == 4);
        REQUIRE(features.cols() == 109);
        CHECK(features.values.rows() == 4);
        CHECK(features.siteIndices == std::vector<size_t>{0, 1, 2, 3});
        CHECK(features.skipped.empty());
        CHECK(features.labels == assembler.featureLabels());

        for (Eigen::Index site = 0; site < 4; site++) {
            auto row = features.values.row(site);
            // external blocks are copied as they are
            CHECK((row.segment(0, 32).array() == site + 0.5).all());
            CHECK((row.segment(42, 37).array() == site + 0.5).all());
        }

        auto shell = ShellDescriptorCalculator(table);
        auto expected = shell.describeSite(chain, buildBondGraph(chain), 1);
        for (Eigen::Index k = 0; k < 10; k++) {
            CHECK(features.values(1, 32 + k) == expected[static_cast<size_t>(k)]);
        }

        // fcc Voronoi indices
        CHECK(features.values(2, 80) == 12.0);
        CHECK(features.values(2, 88) == 1.0);

        CHECK(tessellation->calls() == 1);
    }

    SECTION("assembling twice gives the same matrix") {
        auto first = assembler.assemble(chain);
        auto second = assembler.assemble(chain);
        CHECK(first.values == second.values);
    }

    SECTION("missing external block") {
        auto bare = linear_chain({"C", "N", "O", "C"}, 1.4);
        try {
            assembler.assemble(bare);
            FAIL("expected a parse error");
        } catch (const DescriptorException& e) {
            CHECK(e.getCode() == ErrorCode::PARSE_ERROR);
        }
    }

    SECTION("mis-shaped external block") {
        chain.setSiteFeatures("crystal_nn", Eigen::MatrixXd::Zero(4, 23));
        CHECK_THROWS_AS(assembler.assemble(chain), DescriptorException);
    }

    SECTION("non-default options change the Voronoi block only") {
        auto options = AssemblerOptions();
        options.voronoi.useWeights = true;
        options.voronoi.volumeStats = {Statistic::Mean};
        auto custom = FeatureAssembler::standard(table, tessellation, options);
        // 24 indices, 2 sums, 1 + 4 + 4 statistics
        CHECK(custom.featureCount() == 79 + 24 + 2 + 1 + 4 + 4);
        CHECK(custom.assemble(chain).cols() == custom.featureCount());
    }
}

TEST_CASE("site error policy") {
    const auto& table = ElementalPropertyTable::builtin();
    auto tessellation = std::make_shared<CountingTessellation>(fcc_facets());

    // the last atom has no bonded neighbour
    auto structure = make_structure("with-isolated-atom", {"C", "N", "O", "C", "C"}, {
        {0.0, 0.0, 0.0},
        {1.4, 0.0, 0.0},
        {2.8, 0.0, 0.0},
        {4.2, 0.0, 0.0},
        {20.0, 0.0, 0.0},
    });
    attach_external_blocks(structure);

    SECTION("parsing") {
        CHECK(parseSiteErrorPolicy("abort") == SiteErrorPolicy::Abort);
        CHECK(parseSiteErrorPolicy("skip") == SiteErrorPolicy::Skip);
        CHECK_THROWS_AS(parseSiteErrorPolicy("ignore"), DescriptorException);
    }

    SECTION("abort") {
        auto assembler = FeatureAssembler::standard(table, tessellation);
        CHECK(assembler.getPolicy() == SiteErrorPolicy::Abort);
        try {
            assembler.assemble(structure);
            FAIL("expected an EmptyShellError");
        } catch (const EmptyShellError& e) {
            CHECK(e.getSiteIndex() == 4);
            CHECK(e.getShell() == 1);
            CHECK(std::string(e.what()).find("with-isolated-atom") != std::string::npos);
        }
    }

    SECTION("skip") {
        auto options = AssemblerOptions();
        options.policy = SiteErrorPolicy::Skip;
        auto assembler = FeatureAssembler::standard(table, tessellation, options);

        auto features = assembler.assemble(structure);
        CHECK(features.rows() == 4);
        CHECK(features.values.rows() == 4);
        CHECK(features.siteIndices == std::vector<size_t>{0, 1, 2, 3});
        REQUIRE(features.skipped.size() == 1);
        CHECK(features.skipped[0].site == 4);
        CHECK(features.skipped[0].code == ErrorCode::EMPTY_SHELL);

        // remaining rows are unchanged
        CHECK((features.values.row(3).segment(0, 8).array() == 3.5).all());
    }

    SECTION("skip degenerate tessellation") {
        auto chain = linear_chain({"C", "N", "O", "C"}, 1.4);
        attach_external_blocks(chain);
        auto degenerate = std::make_shared<CountingTessellation>(fcc_facets());
        degenerate->empty_sites = {2};

        auto options = AssemblerOptions();
        options.policy = SiteErrorPolicy::Skip;
        auto assembler = FeatureAssembler::standard(table, degenerate, options);

        auto features = assembler.assemble(chain);
        CHECK(features.siteIndices == std::vector<size_t>{0, 1, 3});
        REQUIRE(features.skipped.size() == 1);
        CHECK(features.skipped[0].code == ErrorCode::DEGENERATE_TESSELLATION);

        assembler.setPolicy(SiteErrorPolicy::Abort);
        CHECK_THROWS_AS(assembler.assemble(chain), DegenerateTessellationError);
    }

    SECTION("unknown species is always fatal") {
        auto helium = linear_chain({"C", "N", "He", "C"}, 1.4);
        attach_external_blocks(helium);

        auto options = AssemblerOptions();
        options.policy = SiteErrorPolicy::Skip;
        auto assembler = FeatureAssembler::standard(table, tessellation, options);
        CHECK_THROWS_AS(assembler.assemble(helium), UnknownSpeciesError);
    }
}

// Sets globalConfig.numThreads for the lifetime of the object
class ThreadCountGuard {
public:
    explicit ThreadCountGuard(int threads): previous_(globalConfig.numThreads) {
        globalConfig.numThreads = threads;
    }
    ~ThreadCountGuard() {
        globalConfig.numThreads = previous_;
    }

private:
    int previous_;
};

// Carbon chain with sites 7 and 21 moved away from every other atom
static Structure broken_chain() {
    auto symbols = std::vector<std::string>(30, "C");
    auto positions = std::vector<std::vector<double>>();
    for (size_t i = 0; i < symbols.size(); i++) {
        auto y = (i == 7 || i == 21) ? 20.0 : 0.0;
        positions.push_back({1.4 * static_cast<double>(i), y, 0.0});
    }
    auto structure = make_structure("broken-chain", symbols, positions);
    attach_external_blocks(structure);
    return structure;
}

TEST_CASE("parallel per-site computation") {
    const auto& table = ElementalPropertyTable::builtin();
    auto tessellation = std::make_shared<CountingTessellation>(bcc_facets());
    tessellation->empty_sites = {25, 3};

    auto structure = broken_chain();

    SECTION("skip") {
        auto options = AssemblerOptions();
        options.policy = SiteErrorPolicy::Skip;
        auto assembler = FeatureAssembler::standard(table, tessellation, options);

        FeatureMatrix serial;
        {
            auto guard = ThreadCountGuard(1);
            serial = assembler.assemble(structure);
        }
        FeatureMatrix parallel;
        {
            auto guard = ThreadCountGuard(4);
            parallel = assembler.assemble(structure);
        }

        CHECK(serial.rows() == 26);
        CHECK(parallel.siteIndices == serial.siteIndices);
        CHECK(parallel.values == serial.values);

        REQUIRE(parallel.skipped.size() == 4);
        auto skipped_sites = std::vector<size_t>();
        auto skipped_codes = std::vector<ErrorCode>();
        for (const auto& failure: parallel.skipped) {
            skipped_sites.push_back(failure.site);
            skipped_codes.push_back(failure.code);
        }
        CHECK(skipped_sites == std::vector<size_t>{3, 7, 21, 25});
        CHECK(skipped_codes == std::vector<ErrorCode>{
            ErrorCode::DEGENERATE_TESSELLATION, ErrorCode::EMPTY_SHELL,
            ErrorCode::EMPTY_SHELL, ErrorCode::DEGENERATE_TESSELLATION
        });
        for (size_t i = 0; i < parallel.skipped.size(); i++) {
            CHECK(parallel.skipped[i].site == serial.skipped[i].site);
            CHECK(parallel.skipped[i].message == serial.skipped[i].message);
        }
    }

    SECTION("abort reports the lowest failing site") {
        auto assembler = FeatureAssembler::standard(table, tessellation);

        for (int threads: {1, 4}) {
            auto guard = ThreadCountGuard(threads);
            try {
                assembler.assemble(structure);
                FAIL("expected a DegenerateTessellationError");
            } catch (const DegenerateTessellationError& e) {
                CHECK(e.getSiteIndex() == 3);
            }
        }
    }

    SECTION("every site succeeds") {
        auto complete = std::make_shared<CountingTessellation>(bcc_facets());
        auto chain = linear_chain(std::vector<std::string>(40, "C"), 1.4);
        attach_external_blocks(chain);
        auto assembler = FeatureAssembler::standard(table, complete);

        FeatureMatrix serial;
        {
            auto guard = ThreadCountGuard(1);
            serial = assembler.assemble(chain);
        }
        auto guard = ThreadCountGuard(4);
        auto parallel = assembler.assemble(chain);

        CHECK(parallel.rows() == 40);
        CHECK(parallel.skipped.empty());
        CHECK(parallel.values == serial.values);
    }
}

TEST_CASE("feature assembler registration") {
    auto assembler = FeatureAssembler();
    assembler.registerBlock(PrecomputedFingerprint::agni());
    CHECK(assembler.featureCount() == 8);
    CHECK_THROWS_AS(assembler.registerBlock(PrecomputedFingerprint::agni()), DescriptorException);
    CHECK_THROWS_AS(assembler.registerBlock(nullptr), DescriptorException);
}

TEST_CASE("featurize structure files") {
    auto data = std::string(FFPFACT_TEST_DATA_DIR);
    auto structure = Structure::fromFile(data + "/acetylene.json");
    auto precomputed = std::make_shared<PrecomputedTessellation>(
        PrecomputedTessellation::fromFile(data + "/acetylene_facets.json")
    );
    auto tessellation = std::make_shared<CachingTessellation>(precomputed);

    auto assembler = FeatureAssembler::standard(ElementalPropertyTable::builtin(), tessellation);
    auto features = assembler.assemble(structure);

    REQUIRE(features.rows() == 4);
    REQUIRE(features.cols() == 109);
    CHECK(features.skipped.empty());
    CHECK(features.values.allFinite());

    // external blocks are copied as given
    CHECK(features.values(0, 0) == Approx(0.1));
    CHECK(features.values(3, 7) == Approx(0.47));
    CHECK(features.values(1, 8) == Approx(0.2));

    // the molecule is symmetric under H-C-C-H reversal
    for (Eigen::Index col = 32; col < 42; col++) {
        CHECK(features.values(0, col) == Approx(features.values(3, col)));
        CHECK(features.values(1, col) == Approx(features.values(2, col)));
    }

    std::ostringstream output;
    auto writer = FeatureWriter(output, features.labels);
    writer.writeStructure(structure.getName(), features);
    CHECK(writer.getRowsWritten() == 4);
    CHECK(output.str().rfind("structure,site,", 0) == 0);
    CHECK(output.str().find("\nacetylene,3,") != std::string::npos);
}
