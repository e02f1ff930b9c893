#include "medoid_clustering.h"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <random>
#include <stdexcept>

namespace vbin::clustering {

namespace {

struct Neighborhood {
    std::vector<size_t> members;
    double mean_distance = 0.0;
};

// Remaining rows within threshold of the medoid; the medoid itself always
// belongs to its own neighborhood
Neighborhood neighborhood(const Matrix& x, size_t medoid, const std::vector<char>& remaining,
                          float threshold) {
    Eigen::VectorXf dist = 0.5f - 0.5f * (x * x.row(medoid).transpose()).array();

    Neighborhood hood;
    double sum = 0.0;
    for (size_t i = 0; i < remaining.size(); ++i) {
        if (!remaining[i]) continue;
        if (i == medoid || dist(i) <= threshold) {
            hood.members.push_back(i);
            sum += (i == medoid) ? 0.0 : dist(i);
        }
    }
    hood.mean_distance = sum / hood.members.size();
    return hood;
}

bool better(const Neighborhood& a, const Neighborhood& b) {
    if (a.members.size() != b.members.size()) return a.members.size() > b.members.size();
    return a.mean_distance < b.mean_distance;
}

}  // namespace

Matrix pearson_normalize(const Matrix& latent) {
    Matrix x = latent;
    for (Eigen::Index r = 0; r < x.rows(); ++r) {
        auto row = x.row(r);
        row.array() -= row.mean();
        float norm = row.norm();
        if (norm > 0.0f) {
            row /= norm;
        } else {
            row.setZero();
        }
    }
    return x;
}

std::vector<std::vector<size_t>> cluster_medoids(const Matrix& latent, const MedoidConfig& config) {
    const size_t n = static_cast<size_t>(latent.rows());
    std::vector<std::vector<size_t>> clusters;
    if (n == 0) return clusters;

    const Matrix x = pearson_normalize(latent);
    std::vector<char> remaining(n, 1);

    std::mt19937 rng(config.random_seed);
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::shuffle(order.begin(), order.end(), rng);

    for (size_t seed : order) {
        if (!remaining[seed]) continue;

        size_t medoid = seed;
        Neighborhood hood = neighborhood(x, medoid, remaining, config.threshold);

        for (int step = 0; step < config.max_steps; ++step) {
            std::vector<size_t> candidates;
            for (size_t m : hood.members) {
                if (m != medoid) candidates.push_back(m);
            }
            if (candidates.empty()) break;
            std::shuffle(candidates.begin(), candidates.end(), rng);
            if (candidates.size() > static_cast<size_t>(config.max_candidates)) {
                candidates.resize(config.max_candidates);
            }

            size_t best_medoid = medoid;
            Neighborhood best = hood;
            for (size_t c : candidates) {
                Neighborhood h = neighborhood(x, c, remaining, config.threshold);
                if (better(h, best)) {
                    best = std::move(h);
                    best_medoid = c;
                }
            }
            if (best_medoid == medoid) break;
            medoid = best_medoid;
            hood = std::move(best);
        }

        for (size_t m : hood.members) remaining[m] = 0;
        clusters.push_back(std::move(hood.members));
    }

    return clusters;
}

ClusterAssignment filter_clusters(const std::vector<std::vector<size_t>>& clusters,
                                  const std::vector<std::string>& names,
                                  int max_clusters, int min_size) {
    ClusterAssignment assignment;
    for (const auto& cluster : clusters) {
        if (max_clusters >= 0 && assignment.bins.size() >= static_cast<size_t>(max_clusters)) {
            break;
        }
        if (cluster.size() < static_cast<size_t>(std::max(1, min_size))) continue;

        Bin bin;
        bin.name = "cluster_" + std::to_string(assignment.bins.size() + 1);
        bin.contigs.reserve(cluster.size());
        for (size_t idx : cluster) {
            if (idx >= names.size()) {
                throw std::out_of_range("Cluster member " + std::to_string(idx) +
                                        " has no contig name");
            }
            bin.contigs.push_back(names[idx]);
        }
        assignment.bins.push_back(std::move(bin));
    }
    return assignment;
}

void write_cluster_report(const std::string& path, const ClusterAssignment& assignment) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open cluster report for writing: " + path);
    }
    for (const auto& bin : assignment.bins) {
        for (const auto& contig : bin.contigs) {
            out << bin.name << "\t" << contig << "\n";
        }
    }
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing cluster report: " + path);
    }
}

}  // namespace vbin::clustering
