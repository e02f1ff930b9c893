// VBIN - pipeline_driver.cpp

#include "pipeline_driver.h"
#include "errors.h"
#include "stage_runner.h"

#include <chrono>
#include <unordered_map>
#include <unordered_set>

namespace vbin {

namespace fs = std::filesystem;

namespace {

// Every placed contig must be a known contig and appear once; bins must
// respect the size and count limits of the run
void check_assignment(const ClusterAssignment& assignment,
                      const std::vector<std::string>& names,
                      int max_clusters, int min_size) {
    std::unordered_set<std::string> known(names.begin(), names.end());
    std::unordered_map<std::string, std::string> placed;

    if (max_clusters != UNBOUNDED_CLUSTERS &&
        assignment.bin_count() > static_cast<size_t>(max_clusters)) {
        throw StageFailure(STAGE_CLUSTERING,
                           std::to_string(assignment.bin_count()) + " bins reported, limit is " +
                               std::to_string(max_clusters));
    }

    for (const auto& bin : assignment.bins) {
        if (bin.contigs.empty() || bin.contigs.size() < static_cast<size_t>(min_size)) {
            throw StageFailure(STAGE_CLUSTERING, "bin " + bin.name + " has " +
                                                     std::to_string(bin.contigs.size()) +
                                                     " contigs, minimum is " +
                                                     std::to_string(min_size));
        }
        for (const auto& contig : bin.contigs) {
            if (!known.count(contig)) {
                throw StageFailure(STAGE_CLUSTERING,
                                   "bin " + bin.name + " contains unknown contig " + contig);
            }
            auto [it, inserted] = placed.emplace(contig, bin.name);
            if (!inserted) {
                throw StageFailure(STAGE_CLUSTERING, "contig " + contig + " placed in both " +
                                                         it->second + " and " + bin.name);
            }
        }
    }
}

}  // namespace

PipelineDriver::PipelineDriver(PipelineStages& stages, Logger& log)
    : stages_(stages), log_(log) {}

ResidentMatrices PipelineDriver::resident() const {
    ResidentMatrices r;
    r.features = contigs_.has_features();
    r.coverage = coverage_.has_value();
    r.embedding = embedding_.has_value();
    return r;
}

ClusterAssignment PipelineDriver::execute(const RunConfiguration& config) {
    report_ = RunReport();
    contigs_ = ContigSet();
    coverage_.reset();
    embedding_.reset();

    ScopedOutputDirectory outdir(config.output_dir());
    store_ = std::make_unique<ArtifactStore>(outdir.path());

    const fs::path log_path = store_->path_for(ArtifactKind::RunLog);
    if (!log_.open_trace(log_path.string())) {
        throw PathNotFound("outdir", log_path.string(), "cannot create run log");
    }
    // From here on, artifacts of committed stages stay for inspection
    outdir.keep();

    const auto begin = std::chrono::steady_clock::now();
    log_.info("Starting vbin version " + std::string(VERSION));
    log_.info("Date and time is " + Logger::timestamp());
    log_.section("Parameters");
    log_.metric("output directory", config.output_dir());
    log_.metric("fasta", config.fasta_path());
    log_.metric("alignment files", std::to_string(config.bam_paths().size()));
    log_.metric("minimum contig length", std::to_string(config.params().min_contig_length));
    log_.metric("minimum alignment score", std::to_string(config.params().min_alignment_score));
    log_.metric("subprocesses", std::to_string(config.params().subprocesses));
    log_.metric("latent dimensions", std::to_string(config.model().latent_dim));
    log_.metric("epochs", std::to_string(config.model().epochs));
    log_.metric("batch size", std::to_string(config.model().batch_size));
    log_.metric("capacity", config.model().capacity, 2);
    log_.metric("weighting ratio", config.model().mse_ratio, 3);
    log_.metric("cuda", config.model().use_cuda ? "yes" : "no");
    log_.metric("minimum cluster size", std::to_string(config.params().min_cluster_size));
    log_.metric("maximum clusters", std::to_string(config.params().max_clusters));

    run_features(config);
    run_coverage(config);
    run_embedding(config);
    release_inputs();
    ClusterAssignment assignment = run_clustering(config);
    embedding_.reset();

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
    log_.info("Completed vbin in " + Logger::format_seconds(elapsed) + " seconds");
    log_.info("Summary: " + report_.summary());
    report_.write_table(log_);

    return assignment;
}

void PipelineDriver::run_features(const RunConfiguration& config) {
    StageRunner runner(log_, report_);
    const int min_length = config.params().min_contig_length;

    contigs_ = runner.run(STAGE_FEATURES, [&] {
        ContigSet set = stages_.extract_features(config.fasta_path(), min_length);
        if (!set.consistent() || static_cast<size_t>(set.tnf.rows()) != set.size()) {
            throw StageFailure(STAGE_FEATURES,
                               "inconsistent contig set: " + std::to_string(set.names.size()) +
                                   " names, " + std::to_string(set.lengths.size()) +
                                   " lengths, " + std::to_string(set.tnf.rows()) +
                                   " feature rows");
        }
        if (set.size() == 0) {
            throw StageFailure(STAGE_FEATURES, "no contigs of at least " +
                                                   std::to_string(min_length) + " bp in " +
                                                   config.fasta_path());
        }
        store_->put(ArtifactKind::Features, set.tnf, set.names, "tnf_");
        log_.info("Processed " + std::to_string(set.total_bases()) + " bases in " +
                  std::to_string(set.size()) + " contigs");
        return set;
    });

    report_.add_count(STAGE_FEATURES, "contigs", static_cast<int64_t>(contigs_.size()));
    report_.add_count(STAGE_FEATURES, "bases", static_cast<int64_t>(contigs_.total_bases()));
}

void PipelineDriver::run_coverage(const RunConfiguration& config) {
    StageRunner runner(log_, report_);
    const auto& params = config.params();
    const size_t ncontigs = contigs_.size();

    coverage_ = runner.run(STAGE_COVERAGE, [&] {
        log_.info("Parsing " + std::to_string(params.bam_paths.size()) +
                  " alignment files with " + std::to_string(params.subprocesses) +
                  " subprocesses");
        CoverageMatrix cov = stages_.estimate_coverage(params.bam_paths,
                                                       params.min_alignment_score,
                                                       params.min_contig_length,
                                                       params.subprocesses);
        if (cov.rows() != ncontigs) {
            throw ContigCountMismatch(STAGE_COVERAGE, ncontigs, cov.rows());
        }
        store_->put(ArtifactKind::Coverage, cov.rpkm, contigs_.names, "sample_");
        return cov;
    });

    report_.add_count(STAGE_COVERAGE, "samples", static_cast<int64_t>(coverage_->samples()));
}

void PipelineDriver::run_embedding(const RunConfiguration& config) {
    StageRunner runner(log_, report_);
    const size_t ncontigs = contigs_.size();

    embedding_ = runner.run(STAGE_EMBEDDING, [&] {
        Embedding emb;
        store_->commit(ArtifactKind::ModelCheckpoint, [&](const fs::path& model_path) {
            emb = stages_.train_embedding(*coverage_, contigs_.tnf, config.model(), model_path);
        });
        if (emb.rows() != ncontigs) {
            throw ContigCountMismatch(STAGE_EMBEDDING, ncontigs, emb.rows());
        }
        store_->put(ArtifactKind::Embedding, emb.latent, contigs_.names, "dim_");
        return emb;
    });

    report_.add_count(STAGE_EMBEDDING, "latent_dims",
                      static_cast<int64_t>(embedding_->latent.cols()));
}

void PipelineDriver::release_inputs() {
    // Clustering only needs the embedding and the contig names
    contigs_.release_features();
    coverage_.reset();
    log_.detail("Released feature and coverage matrices");
}

ClusterAssignment PipelineDriver::run_clustering(const RunConfiguration& config) {
    StageRunner runner(log_, report_);
    const int max_clusters = config.params().max_clusters;
    const int min_size = config.params().min_cluster_size;

    ClusterAssignment assignment = runner.run(STAGE_CLUSTERING, [&] {
        ClusterAssignment result;
        store_->commit(ArtifactKind::ClusterReport, [&](const fs::path& report_path) {
            result = stages_.cluster_embedding(*embedding_, contigs_.names, max_clusters,
                                               min_size, report_path);
            check_assignment(result, contigs_.names, max_clusters, min_size);
        });
        log_.info("Clustered " + std::to_string(result.contig_count()) + " contigs in " +
                  std::to_string(result.bin_count()) + " bins");
        return result;
    });

    report_.add_count(STAGE_CLUSTERING, "bins", static_cast<int64_t>(assignment.bin_count()));
    report_.add_count(STAGE_CLUSTERING, "contigs", static_cast<int64_t>(assignment.contig_count()));
    return assignment;
}

int run_vbin(const RunConfiguration& config, PipelineStages& stages, Logger& log) {
    try {
        PipelineDriver driver(stages, log);
        driver.execute(config);
    } catch (const PipelineError& e) {
        log.error(std::string(e.kind()) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace vbin
