#pragma once

#include "../pipeline/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vbin::clustering {

struct MedoidConfig {
    float threshold = 0.08f;      // Pearson distance radius of a cluster
    int max_steps = 25;           // medoid moves per cluster
    int max_candidates = 25;      // members tried as new medoid per move
    uint32_t random_seed = 0;
};

// Rows centred and scaled to unit length, so that a dot product between rows
// is their Pearson correlation. Constant rows become all zeros.
Matrix pearson_normalize(const Matrix& latent);

// Iterative medoid clustering. Every row lands in exactly one cluster;
// clusters are returned in emission order as row indices.
std::vector<std::vector<size_t>> cluster_medoids(const Matrix& latent,
                                                 const MedoidConfig& config = MedoidConfig());

// Drops clusters smaller than min_size and stops after max_clusters emitted
// bins (-1 = no limit). Bins are named cluster_1, cluster_2, ...
ClusterAssignment filter_clusters(const std::vector<std::vector<size_t>>& clusters,
                                  const std::vector<std::string>& names,
                                  int max_clusters, int min_size);

// One "bin<TAB>contig" line per placed contig
void write_cluster_report(const std::string& path, const ClusterAssignment& assignment);

}  // namespace vbin::clustering
