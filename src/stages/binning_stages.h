// VBIN - binning_stages.h
// The production collaborators: TNF, RPKM, VAE and medoid clustering

#pragma once

#include "../clustering/medoid_clustering.h"
#include "../pipeline/pipeline_stages.h"

namespace vbin {

class Logger;

class BinningStages : public PipelineStages {
public:
    explicit BinningStages(Logger& log,
                           clustering::MedoidConfig medoid = clustering::MedoidConfig());

    ContigSet extract_features(const std::string& fasta_path, int min_length) override;

    CoverageMatrix estimate_coverage(const std::vector<std::string>& bam_paths,
                                     int min_score, int min_length,
                                     int worker_count) override;

    Embedding train_embedding(const CoverageMatrix& coverage, const Matrix& tnf,
                              const ModelHyperparameters& hyper,
                              const std::filesystem::path& model_path) override;

    ClusterAssignment cluster_embedding(const Embedding& embedding,
                                        const std::vector<std::string>& names,
                                        int max_clusters, int min_size,
                                        const std::filesystem::path& report_path) override;

private:
    Logger& log_;
    clustering::MedoidConfig medoid_;
};

}  // namespace vbin
