// VBIN - parameter_validator.cpp

#include "parameter_validator.h"
#include "errors.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>

namespace vbin {

namespace fs = std::filesystem;

int default_subprocesses() {
    int cpus = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, std::min(MAX_DEFAULT_SUBPROCESSES, cpus));
}

namespace {

void require_readable_file(const std::string& field, const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        throw PathNotFound(field, path, "file does not exist");
    }
    if (!fs::is_regular_file(path, ec)) {
        throw PathNotFound(field, path, "not a regular file");
    }
    if (access(path.c_str(), R_OK) != 0) {
        throw PathNotFound(field, path, "file is not readable");
    }
}

}  // namespace

ParameterValidator::ParameterValidator(AcceleratorProbe accelerator_available)
    : accelerator_available_(std::move(accelerator_available)) {}

RunConfiguration ParameterValidator::validate(const RunParameters& raw) const {
    check_paths(raw);
    check_io_options(raw);
    check_training_options(raw);
    check_clustering_options(raw);
    return RunConfiguration(raw);
}

void ParameterValidator::check_paths(const RunParameters& raw) const {
    if (raw.output_dir.empty()) {
        throw InvalidParameter("outdir", "output directory must be given");
    }

    std::error_code ec;
    fs::path outdir(raw.output_dir);
    if (fs::exists(outdir, ec) || fs::is_symlink(outdir, ec)) {
        throw PathConflict("outdir", raw.output_dir);
    }

    // "out/" names the directory "out", not an entry inside it
    fs::path parent = outdir.has_filename() ? outdir.parent_path()
                                            : outdir.parent_path().parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        throw PathNotFound("outdir", parent.string(), "parent directory does not exist");
    }

    require_readable_file("fasta", raw.fasta_path);

    if (raw.bam_paths.empty()) {
        throw InvalidParameter("bamfiles", "at least one alignment file is required");
    }
    for (const auto& bam : raw.bam_paths) {
        require_readable_file("bamfiles", bam);
    }
}

void ParameterValidator::check_io_options(const RunParameters& raw) const {
    if (raw.min_contig_length < MIN_CONTIG_LENGTH_FLOOR) {
        throw InvalidParameter("-m", "minimum contig length must be at least " +
                                         std::to_string(MIN_CONTIG_LENGTH_FLOOR) + ", not " +
                                         std::to_string(raw.min_contig_length));
    }
    if (raw.subprocesses < 1) {
        throw InvalidParameter("-p", "zero or negative subprocesses requested (" +
                                         std::to_string(raw.subprocesses) + ")");
    }
    if (raw.min_alignment_score < 0) {
        throw InvalidParameter("-a", "minimum alignment score cannot be negative (" +
                                         std::to_string(raw.min_alignment_score) + ")");
    }
}

void ParameterValidator::check_training_options(const RunParameters& raw) const {
    const auto& model = raw.model;

    if (model.hidden_layers.empty()) {
        throw InvalidParameter("-n", "at least one hidden layer is required");
    }
    int narrowest = *std::min_element(model.hidden_layers.begin(), model.hidden_layers.end());
    if (narrowest < 1) {
        throw InvalidParameter("-n", "minimum 1 neuron per layer, not " + std::to_string(narrowest));
    }
    if (model.latent_dim < 1) {
        throw InvalidParameter("-l", "minimum 1 latent neuron, not " +
                                         std::to_string(model.latent_dim));
    }
    if (model.epochs < 1) {
        throw InvalidParameter("-e", "minimum 1 epoch, not " + std::to_string(model.epochs));
    }
    if (model.batch_size < 1) {
        throw InvalidParameter("-b", "minimum batch size of 1, not " +
                                         std::to_string(model.batch_size));
    }
    if (!(model.capacity >= 0.0)) {
        throw InvalidParameter("-s", "capacity cannot be negative (" +
                                         std::to_string(model.capacity) + ")");
    }
    if (!(model.mse_ratio > 0.0 && model.mse_ratio < 1.0)) {
        throw InvalidParameter("-r", "weighting ratio must be above 0 and below 1, not " +
                                         std::to_string(model.mse_ratio));
    }
    if (model.use_cuda && !(accelerator_available_ && accelerator_available_())) {
        throw AcceleratorUnavailable();
    }
}

void ParameterValidator::check_clustering_options(const RunParameters& raw) const {
    if (raw.min_cluster_size < 1) {
        throw InvalidParameter("-i", "minimum cluster size must be at least 1, not " +
                                         std::to_string(raw.min_cluster_size));
    }
    if (raw.max_clusters != UNBOUNDED_CLUSTERS && raw.max_clusters < 1) {
        throw InvalidParameter("-c", "maximum cluster count must be -1 (unbounded) or at "
                                     "least 1, not " + std::to_string(raw.max_clusters));
    }
}

}  // namespace vbin
