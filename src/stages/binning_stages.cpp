// VBIN - binning_stages.cpp

#include "binning_stages.h"
#include "../algorithms/coverage_features.h"
#include "../algorithms/kmer_features.h"
#include "../encoder/vae.h"
#include "../util/logger.h"

#include <utility>

namespace vbin {

BinningStages::BinningStages(Logger& log, clustering::MedoidConfig medoid)
    : log_(log), medoid_(std::move(medoid)) {}

ContigSet BinningStages::extract_features(const std::string& fasta_path, int min_length) {
    return extract_tnf(fasta_path, min_length, &log_);
}

CoverageMatrix BinningStages::estimate_coverage(const std::vector<std::string>& bam_paths,
                                                int min_score, int min_length,
                                                int worker_count) {
    return CoverageExtractor::estimate_rpkm(bam_paths, min_score, min_length, worker_count,
                                            &log_);
}

Embedding BinningStages::train_embedding(const CoverageMatrix& coverage, const Matrix& tnf,
                                         const ModelHyperparameters& hyper,
                                         const std::filesystem::path& model_path) {
    encoder::VaeConfig config;
    config.hidden_layers = hyper.hidden_layers;
    config.latent_dim = hyper.latent_dim;
    config.epochs = hyper.epochs;
    config.batch_size = hyper.batch_size;
    config.capacity = hyper.capacity;
    config.mse_ratio = hyper.mse_ratio;
    config.use_cuda = hyper.use_cuda;

    Embedding embedding;
    embedding.latent = encoder::train_vae(coverage.rpkm, tnf, config, model_path.string(), &log_);
    return embedding;
}

ClusterAssignment BinningStages::cluster_embedding(const Embedding& embedding,
                                                   const std::vector<std::string>& names,
                                                   int max_clusters, int min_size,
                                                   const std::filesystem::path& report_path) {
    auto raw = clustering::cluster_medoids(embedding.latent, medoid_);
    log_.detail("Medoid clustering produced " + std::to_string(raw.size()) + " raw clusters");

    ClusterAssignment assignment = clustering::filter_clusters(raw, names, max_clusters, min_size);
    clustering::write_cluster_report(report_path.string(), assignment);
    return assignment;
}

}  // namespace vbin
