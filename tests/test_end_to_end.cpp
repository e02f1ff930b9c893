// VBIN - test_end_to_end.cpp
// Full runs over real FASTA and SAM files with the production stages

#include "test_utils.h"
#include "pipeline/errors.h"
#include "pipeline/pipeline_driver.h"
#include "stages/binning_stages.h"
#include "util/logger.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <unordered_set>

using namespace vbin;
using namespace vbin::test;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Scenario {
    TempDir dir;
    RunParameters params;

    // n_contigs in the FASTA, the first n_references of them in the SAM header
    Scenario(size_t n_contigs, size_t n_references) {
        auto contigs = make_contigs(n_contigs, 1000);
        write_fasta(dir / "contigs.fna", contigs);

        std::vector<SamReference> refs;
        for (size_t i = 0; i < n_references; ++i) refs.push_back({contigs[i].name, 1000});
        write_sam(dir / "sample.sam", refs, reads_for(refs, 3));

        params.output_dir = (dir / "out").string();
        params.fasta_path = (dir / "contigs.fna").string();
        params.bam_paths = {(dir / "sample.sam").string()};
        params.min_contig_length = 100;
        params.subprocesses = 1;
        params.model.hidden_layers = {16};
        params.model.latent_dim = 4;
        params.model.epochs = 2;
        params.model.batch_size = 4;
    }

    fs::path out(const std::string& name) const { return fs::path(params.output_dir) / name; }
};

std::vector<size_t> positions_of(const std::string& text, const std::vector<std::string>& needles) {
    std::vector<size_t> positions;
    for (const auto& n : needles) positions.push_back(text.find(n));
    return positions;
}

}  // namespace

TEST_CASE("ten contigs with a matching alignment header", "[e2e]") {
    Scenario s(10, 10);
    RunConfiguration config = validate(s.params);

    Logger log("test", Verbosity::Quiet);
    BinningStages stages(log);
    PipelineDriver driver(stages, log);
    ClusterAssignment result = driver.execute(config);

    CHECK(result.bin_count() >= 1);
    CHECK(result.contig_count() <= 10);

    auto lines = read_lines(s.out("clusters.tsv"));
    CHECK(lines.size() == result.contig_count());
    std::unordered_set<std::string> contigs;
    for (const auto& line : lines) {
        auto tab = line.find('\t');
        REQUIRE(tab != std::string::npos);
        CHECK(contigs.insert(line.substr(tab + 1)).second);
    }
    CHECK(contigs.size() <= 10);

    std::string trace = read_text(s.out("log.txt"));
    auto pos = positions_of(trace, {"Finished stage features", "Finished stage coverage",
                                    "Finished stage embedding", "Finished stage clustering"});
    for (size_t p : pos) REQUIRE(p != std::string::npos);
    CHECK(pos[0] < pos[1]);
    CHECK(pos[1] < pos[2]);
    CHECK(pos[2] < pos[3]);
    CHECK_THAT(trace, ContainsSubstring("Processed 10000 bases in 10 contigs"));

    for (const char* name : {"tnf.tsv", "rpkm.tsv", "latent.tsv", "model.pt"}) {
        CHECK(fs::exists(s.out(name)));
    }
}

TEST_CASE("alignment header listing fewer references than contigs", "[e2e]") {
    Scenario s(10, 8);
    RunConfiguration config = validate(s.params);

    Logger log("test", Verbosity::Quiet);
    BinningStages stages(log);
    PipelineDriver driver(stages, log);

    try {
        driver.execute(config);
        FAIL("expected ContigCountMismatch");
    } catch (const ContigCountMismatch& e) {
        CHECK(e.expected() == 10);
        CHECK(e.observed() == 8);
    }

    std::string trace = read_text(s.out("log.txt"));
    CHECK(trace.find("stage embedding") == std::string::npos);
    CHECK_FALSE(fs::exists(s.out("model.pt")));
    CHECK_FALSE(fs::exists(s.out("latent.tsv")));
}

TEST_CASE("run_vbin reports the mismatch with a non-zero status", "[e2e]") {
    Scenario s(10, 8);
    Logger log("test", Verbosity::Quiet);
    BinningStages stages(log);

    CHECK(run_vbin(validate(s.params), stages, log) == 1);
}

TEST_CASE("weighting ratio of 0 and 1 rejected, 0.5 accepted", "[e2e]") {
    Scenario s(10, 10);
    RunParameters params = s.params;

    params.model.mse_ratio = 0.0;
    CHECK_THROWS_AS(validate(params), InvalidParameter);
    params.model.mse_ratio = 1.0;
    CHECK_THROWS_AS(validate(params), InvalidParameter);
    params.model.mse_ratio = 0.5;
    CHECK_NOTHROW(validate(params));
    CHECK_FALSE(fs::exists(params.output_dir));
}
