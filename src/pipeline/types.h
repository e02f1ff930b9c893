// VBIN - types.h
// Data handed from one pipeline stage to the next

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vbin {

// Row-major so that one contig is one contiguous row
using Matrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr int TNF_DIM = 136;  // canonical tetranucleotides

// Output of feature extraction. names, lengths and tnf rows are parallel.
struct ContigSet {
    std::vector<std::string> names;
    std::vector<uint32_t> lengths;
    Matrix tnf;

    size_t size() const { return names.size(); }

    bool consistent() const {
        return lengths.size() == names.size() &&
               (tnf.size() == 0 || static_cast<size_t>(tnf.rows()) == names.size());
    }

    bool has_features() const { return tnf.size() > 0; }

    // Drops the feature matrix, keeps names and lengths for labelling
    void release_features() { tnf.resize(0, 0); }

    uint64_t total_bases() const {
        uint64_t n = 0;
        for (uint32_t len : lengths) n += len;
        return n;
    }
};

// contigs x samples
struct CoverageMatrix {
    Matrix rpkm;

    size_t rows() const { return static_cast<size_t>(rpkm.rows()); }
    size_t samples() const { return static_cast<size_t>(rpkm.cols()); }
};

// contigs x latent dimensions, row-aligned with ContigSet
struct Embedding {
    Matrix latent;

    size_t rows() const { return static_cast<size_t>(latent.rows()); }
};

struct Bin {
    std::string name;
    std::vector<std::string> contigs;
};

// Bins in emission order. A contig appears in at most one bin.
struct ClusterAssignment {
    std::vector<Bin> bins;

    size_t bin_count() const { return bins.size(); }

    size_t contig_count() const {
        size_t n = 0;
        for (const auto& bin : bins) n += bin.contigs.size();
        return n;
    }
};

}  // namespace vbin
