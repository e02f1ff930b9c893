// VBIN - Centralized Configuration Structures
// Raw run parameters and the frozen, validated run configuration
#ifndef VBIN_CONFIG_HPP
#define VBIN_CONFIG_HPP

#include <string>
#include <utility>
#include <vector>
#include "vbin/version.h"

namespace vbin {

// Global version (set by cmake)
constexpr const char* VERSION = VBIN_VERSION_STRING;

// Floors and defaults for the run options
constexpr int MIN_CONTIG_LENGTH_FLOOR = 100;
constexpr int DEFAULT_MIN_CONTIG_LENGTH = 100;
constexpr int DEFAULT_MIN_ALIGNMENT_SCORE = 50;
constexpr int MAX_DEFAULT_SUBPROCESSES = 8;
constexpr int DEFAULT_LATENT_DIM = 40;
constexpr int DEFAULT_EPOCHS = 400;
constexpr int DEFAULT_BATCH_SIZE = 128;
constexpr double DEFAULT_CAPACITY = 1000.0;
constexpr double DEFAULT_MSE_RATIO = 0.2;
constexpr int DEFAULT_MIN_CLUSTER_SIZE = 1;
constexpr int UNBOUNDED_CLUSTERS = -1;

// min(8, cpu count), at least 1
int default_subprocesses();

// Hyperparameters handed to the embedding stage
struct ModelHyperparameters {
    std::vector<int> hidden_layers{325, 325, 325};
    int latent_dim = DEFAULT_LATENT_DIM;
    int epochs = DEFAULT_EPOCHS;
    int batch_size = DEFAULT_BATCH_SIZE;
    double capacity = DEFAULT_CAPACITY;
    double mse_ratio = DEFAULT_MSE_RATIO;   // weight of TNF versus depth, in (0,1)
    bool use_cuda = false;
};

// Unvalidated user input, filled by the CLI (or directly by callers/tests)
struct RunParameters {
    // I/O
    std::string output_dir;
    std::string fasta_path;
    std::vector<std::string> bam_paths;

    // Contig and alignment filtering
    int min_contig_length = DEFAULT_MIN_CONTIG_LENGTH;
    int min_alignment_score = DEFAULT_MIN_ALIGNMENT_SCORE;
    int subprocesses = default_subprocesses();

    // Encoder
    ModelHyperparameters model;

    // Clustering
    int min_cluster_size = DEFAULT_MIN_CLUSTER_SIZE;
    int max_clusters = UNBOUNDED_CLUSTERS;
};

class ParameterValidator;

// Frozen configuration. Only ParameterValidator can produce one, so holding a
// RunConfiguration means every rule has been checked.
class RunConfiguration {
public:
    const RunParameters& params() const { return params_; }

    const std::string& output_dir() const { return params_.output_dir; }
    const std::string& fasta_path() const { return params_.fasta_path; }
    const std::vector<std::string>& bam_paths() const { return params_.bam_paths; }
    const ModelHyperparameters& model() const { return params_.model; }

private:
    friend class ParameterValidator;
    explicit RunConfiguration(RunParameters params) : params_(std::move(params)) {}

    const RunParameters params_;
};

}  // namespace vbin

#endif  // VBIN_CONFIG_HPP
