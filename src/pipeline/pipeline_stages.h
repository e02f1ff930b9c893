// VBIN - pipeline_stages.h
// The four collaborators the driver sequences. Implementations own their
// algorithms; the driver only relies on these signatures.

#pragma once

#include "types.h"
#include <vbin/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace vbin {

class PipelineStages {
public:
    virtual ~PipelineStages() = default;

    // Composition features, names and lengths of contigs >= min_length
    virtual ContigSet extract_features(const std::string& fasta_path, int min_length) = 0;

    // contigs x samples abundance; worker_count bounds any internal parallelism
    virtual CoverageMatrix estimate_coverage(const std::vector<std::string>& bam_paths,
                                             int min_score, int min_length,
                                             int worker_count) = 0;

    // Trains the model, saves its checkpoint to model_path and returns the
    // latent embedding of every contig
    virtual Embedding train_embedding(const CoverageMatrix& coverage, const Matrix& tnf,
                                      const ModelHyperparameters& hyper,
                                      const std::filesystem::path& model_path) = 0;

    // Clusters the embedding, applies the size/count post-filters and writes
    // the report to report_path
    virtual ClusterAssignment cluster_embedding(const Embedding& embedding,
                                                const std::vector<std::string>& names,
                                                int max_clusters, int min_size,
                                                const std::filesystem::path& report_path) = 0;
};

}  // namespace vbin
