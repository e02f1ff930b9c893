// VBIN - test_pipeline_driver.cpp
// Orchestration against in-memory collaborators

#include "test_utils.h"
#include "pipeline/artifact_store.h"
#include "pipeline/errors.h"
#include "pipeline/pipeline_driver.h"
#include "util/logger.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <stdexcept>
#include <unordered_set>

using namespace vbin;
using namespace vbin::test;
using Catch::Matchers::ContainsSubstring;

namespace {

// Collaborators with scripted outputs. Each call records what the driver
// held and what was on disk at that point.
class FakeStages : public PipelineStages {
public:
    explicit FakeStages(size_t contigs) : n_contigs(contigs), coverage_rows(contigs),
                                          embedding_rows(contigs) {}

    size_t n_contigs;
    size_t coverage_rows;
    size_t embedding_rows;
    bool duplicate_contig = false;
    bool coverage_throws = false;
    int bins = 2;

    std::vector<std::string> calls;
    fs::path outdir;
    const PipelineDriver* driver = nullptr;
    ResidentMatrices resident_at_clustering;
    size_t features_rows_seen_by_coverage = 0;
    size_t coverage_rows_seen_by_embedding = 0;
    int args_min_score = -1;
    int args_min_length = -1;
    int args_workers = -1;
    int args_max_clusters = 0;
    int args_min_size = 0;

    ContigSet extract_features(const std::string&, int min_length) override {
        calls.push_back("features");
        ContigSet set;
        for (size_t i = 0; i < n_contigs; ++i) {
            set.names.push_back("c" + std::to_string(i));
            set.lengths.push_back(static_cast<uint32_t>(min_length + i));
        }
        set.tnf = Matrix::Constant(static_cast<Eigen::Index>(n_contigs), TNF_DIM, 1.0f / TNF_DIM);
        return set;
    }

    CoverageMatrix estimate_coverage(const std::vector<std::string>&, int min_score,
                                     int min_length, int worker_count) override {
        calls.push_back("coverage");
        args_min_score = min_score;
        args_min_length = min_length;
        args_workers = worker_count;
        if (coverage_throws) throw std::runtime_error("truncated BAM");

        // The feature artifact is complete before this stage starts
        auto tnf = ArtifactStore::read_matrix({ArtifactKind::Features, outdir / "tnf.tsv", "tsv"});
        features_rows_seen_by_coverage = static_cast<size_t>(tnf.values.rows());

        CoverageMatrix cov;
        cov.rpkm = Matrix::Constant(static_cast<Eigen::Index>(coverage_rows), 2, 3.0f);
        return cov;
    }

    Embedding train_embedding(const CoverageMatrix& coverage, const Matrix& tnf,
                              const ModelHyperparameters& hyper,
                              const fs::path& model_path) override {
        calls.push_back("embedding");
        auto rpkm = ArtifactStore::read_matrix({ArtifactKind::Coverage, outdir / "rpkm.tsv", "tsv"});
        coverage_rows_seen_by_embedding = static_cast<size_t>(rpkm.values.rows());
        REQUIRE(static_cast<size_t>(tnf.rows()) == coverage.rows());

        write_text(model_path, "weights");
        Embedding emb;
        emb.latent = Matrix::Random(static_cast<Eigen::Index>(embedding_rows), hyper.latent_dim);
        return emb;
    }

    ClusterAssignment cluster_embedding(const Embedding& embedding,
                                        const std::vector<std::string>& names,
                                        int max_clusters, int min_size,
                                        const fs::path& report_path) override {
        calls.push_back("clustering");
        args_max_clusters = max_clusters;
        args_min_size = min_size;
        if (driver) resident_at_clustering = driver->resident();
        REQUIRE(embedding.rows() == names.size());

        ClusterAssignment assignment;
        for (int b = 0; b < bins; ++b) assignment.bins.push_back({"cluster_" + std::to_string(b + 1), {}});
        for (size_t i = 0; i < names.size(); ++i) {
            assignment.bins[i % bins].contigs.push_back(names[i]);
        }
        if (duplicate_contig) assignment.bins[1].contigs.push_back(names[0]);

        std::ofstream out(report_path);
        for (const auto& bin : assignment.bins) {
            for (const auto& c : bin.contigs) out << bin.name << "\t" << c << "\n";
        }
        return assignment;
    }
};

struct DriverFixture {
    TempDir dir;
    RunParameters params;
    Logger log{"test", Verbosity::Quiet};

    DriverFixture() {
        params = valid_parameters(dir);
        params.min_alignment_score = 7;
        params.subprocesses = 3;
        params.model.latent_dim = 4;
        params.max_clusters = 5;
        params.min_cluster_size = 1;
    }

    fs::path outdir() const { return fs::path(params.output_dir); }
};

// Positions of the stage lines in the run log, in order of appearance
std::vector<std::string> finished_stages(const std::string& trace) {
    std::vector<std::string> stages;
    const std::string marker = "Finished stage ";
    size_t pos = 0;
    while ((pos = trace.find(marker, pos)) != std::string::npos) {
        pos += marker.size();
        stages.push_back(trace.substr(pos, trace.find(' ', pos) - pos));
    }
    return stages;
}

}  // namespace

TEST_CASE("successful run produces every artifact and a valid assignment", "[driver]") {
    DriverFixture f;
    FakeStages stages(10);
    stages.outdir = f.outdir();
    RunConfiguration config = validate(f.params);

    PipelineDriver driver(stages, f.log);
    stages.driver = &driver;
    ClusterAssignment result = driver.execute(config);

    CHECK(stages.calls == std::vector<std::string>{"features", "coverage", "embedding", "clustering"});
    CHECK(stages.args_min_score == 7);
    CHECK(stages.args_min_length == DEFAULT_MIN_CONTIG_LENGTH);
    CHECK(stages.args_workers == 3);
    CHECK(stages.args_max_clusters == 5);
    CHECK(stages.args_min_size == 1);

    CHECK(result.bin_count() == 2);
    CHECK(result.contig_count() == 10);
    std::unordered_set<std::string> seen;
    for (const auto& bin : result.bins) {
        for (const auto& c : bin.contigs) CHECK(seen.insert(c).second);
    }

    for (const char* name : {"tnf.tsv", "rpkm.tsv", "latent.tsv", "model.pt", "clusters.tsv", "log.txt"}) {
        CHECK(fs::exists(f.outdir() / name));
    }
    CHECK_FALSE(fs::exists(f.outdir() / "clusters.tsv.tmp"));
    CHECK(read_lines(f.outdir() / "clusters.tsv").size() == 10);

    auto latent = ArtifactStore::read_matrix({ArtifactKind::Embedding, f.outdir() / "latent.tsv", "tsv"});
    CHECK(latent.values.rows() == 10);
    CHECK(latent.values.cols() == 4);
    CHECK(latent.row_labels.front() == "c0");
}

TEST_CASE("each stage sees its predecessor's artifact complete", "[driver]") {
    DriverFixture f;
    FakeStages stages(6);
    stages.outdir = f.outdir();

    PipelineDriver driver(stages, f.log);
    driver.execute(validate(f.params));

    CHECK(stages.features_rows_seen_by_coverage == 6);
    CHECK(stages.coverage_rows_seen_by_embedding == 6);
}

TEST_CASE("feature and coverage matrices are released before clustering", "[driver]") {
    DriverFixture f;
    FakeStages stages(4);
    stages.outdir = f.outdir();

    PipelineDriver driver(stages, f.log);
    stages.driver = &driver;
    driver.execute(validate(f.params));

    CHECK_FALSE(stages.resident_at_clustering.features);
    CHECK_FALSE(stages.resident_at_clustering.coverage);
    CHECK(stages.resident_at_clustering.embedding);

    ResidentMatrices after = driver.resident();
    CHECK_FALSE(after.features);
    CHECK_FALSE(after.coverage);
    CHECK_FALSE(after.embedding);
}

TEST_CASE("coverage row mismatch stops the run before embedding", "[driver]") {
    DriverFixture f;
    FakeStages stages(10);
    stages.outdir = f.outdir();
    stages.coverage_rows = 8;

    PipelineDriver driver(stages, f.log);
    try {
        driver.execute(validate(f.params));
        FAIL("expected ContigCountMismatch");
    } catch (const ContigCountMismatch& e) {
        CHECK(e.stage() == STAGE_COVERAGE);
        CHECK(e.expected() == 10);
        CHECK(e.observed() == 8);
        CHECK_THAT(e.what(), ContainsSubstring("10"));
        CHECK_THAT(e.what(), ContainsSubstring("8"));
    }

    CHECK(stages.calls == std::vector<std::string>{"features", "coverage"});
    // Committed artifacts stay, the mismatched matrix is never persisted
    CHECK(fs::exists(f.outdir() / "tnf.tsv"));
    CHECK_FALSE(fs::exists(f.outdir() / "rpkm.tsv"));
    CHECK_FALSE(fs::exists(f.outdir() / "model.pt"));

    std::string trace = read_text(f.outdir() / "log.txt");
    CHECK(trace.find("stage embedding") == std::string::npos);
    CHECK(driver.report().find(STAGE_COVERAGE)->succeeded == false);
}

TEST_CASE("embedding row mismatch is fatal", "[driver]") {
    DriverFixture f;
    FakeStages stages(5);
    stages.outdir = f.outdir();
    stages.embedding_rows = 4;

    PipelineDriver driver(stages, f.log);
    CHECK_THROWS_AS(driver.execute(validate(f.params)), ContigCountMismatch);
    CHECK(stages.calls.back() == "embedding");
    CHECK_FALSE(fs::exists(f.outdir() / "latent.tsv"));
}

TEST_CASE("collaborator errors surface as StageFailure", "[driver]") {
    DriverFixture f;
    FakeStages stages(5);
    stages.outdir = f.outdir();
    stages.coverage_throws = true;

    PipelineDriver driver(stages, f.log);
    try {
        driver.execute(validate(f.params));
        FAIL("expected StageFailure");
    } catch (const StageFailure& e) {
        CHECK(e.stage() == STAGE_COVERAGE);
        CHECK_THAT(e.what(), ContainsSubstring("truncated BAM"));
    }
}

TEST_CASE("a contig placed in two bins is rejected", "[driver]") {
    DriverFixture f;
    FakeStages stages(6);
    stages.outdir = f.outdir();
    stages.duplicate_contig = true;

    PipelineDriver driver(stages, f.log);
    try {
        driver.execute(validate(f.params));
        FAIL("expected StageFailure");
    } catch (const StageFailure& e) {
        CHECK(e.stage() == STAGE_CLUSTERING);
        CHECK_THAT(e.what(), ContainsSubstring("c0"));
    }
    CHECK_FALSE(fs::exists(f.outdir() / "clusters.tsv"));
}

TEST_CASE("more bins than the limit is rejected", "[driver]") {
    DriverFixture f;
    f.params.max_clusters = 2;
    FakeStages stages(6);
    stages.outdir = f.outdir();
    stages.bins = 3;

    PipelineDriver driver(stages, f.log);
    CHECK_THROWS_AS(driver.execute(validate(f.params)), StageFailure);
}

TEST_CASE("no contigs above the length filter", "[driver]") {
    DriverFixture f;
    FakeStages stages(0);
    stages.outdir = f.outdir();

    PipelineDriver driver(stages, f.log);
    CHECK_THROWS_AS(driver.execute(validate(f.params)), StageFailure);
    CHECK(stages.calls == std::vector<std::string>{"features"});
}

TEST_CASE("run log holds the stage lines in order and the summary", "[driver]") {
    DriverFixture f;
    FakeStages stages(8);
    stages.outdir = f.outdir();

    PipelineDriver driver(stages, f.log);
    driver.execute(validate(f.params));

    std::string trace = read_text(f.outdir() / "log.txt");
    CHECK(finished_stages(trace) ==
          std::vector<std::string>{"features", "coverage", "embedding", "clustering"});
    CHECK_THAT(trace, ContainsSubstring("Starting vbin version"));
    CHECK_THAT(trace, ContainsSubstring("Completed vbin in"));
    CHECK_THAT(trace, ContainsSubstring("Clustered 8 contigs in 2 bins"));
    CHECK_THAT(trace, ContainsSubstring("Summary: features"));

    REQUIRE(driver.report().stages().size() == 4);
    CHECK(driver.report().find(STAGE_FEATURES)->counts.front().second == 8);
}

TEST_CASE("output directory that appeared after validation", "[driver]") {
    DriverFixture f;
    FakeStages stages(3);
    RunConfiguration config = validate(f.params);
    fs::create_directory(f.outdir());

    PipelineDriver driver(stages, f.log);
    CHECK_THROWS_AS(driver.execute(config), PathConflict);
    CHECK(stages.calls.empty());
}

TEST_CASE("run_vbin maps outcomes to exit codes", "[driver]") {
    SECTION("success") {
        DriverFixture f;
        FakeStages stages(4);
        stages.outdir = f.outdir();
        CHECK(run_vbin(validate(f.params), stages, f.log) == 0);
    }

    SECTION("contract violation") {
        DriverFixture f;
        FakeStages stages(4);
        stages.outdir = f.outdir();
        stages.coverage_rows = 3;
        CHECK(run_vbin(validate(f.params), stages, f.log) == 1);
        CHECK_THAT(read_text(f.outdir() / "log.txt"),
                   ContainsSubstring("[ERROR] ContigCountMismatch"));
    }
}
