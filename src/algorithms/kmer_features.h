#pragma once

#include "../pipeline/types.h"

#include <array>
#include <cstdint>
#include <string>

namespace vbin {

class Logger;

// K-mer utility functions
class KmerUtils {
public:
  // A=0, C=1, G=2, T=3, anything else 255
  static inline uint8_t base_to_bits(char base) {
    switch (base) {
    case 'A':
    case 'a':
      return 0;
    case 'C':
    case 'c':
      return 1;
    case 'G':
    case 'g':
      return 2;
    case 'T':
    case 't':
      return 3;
    default:
      return 255;
    }
  }

  // Reverse complement of a k-mer index
  static inline uint32_t reverse_complement_index(uint32_t idx, int k) {
    uint32_t rc = 0;
    for (int i = 0; i < k; ++i) {
      uint32_t base = idx & 0x3;
      rc = (rc << 2) | (3 - base);
      idx >>= 2;
    }
    return rc;
  }

  // Canonical k-mer index (smaller of kmer and its RC)
  static inline uint32_t canonical_index(uint32_t idx, int k) {
    uint32_t rc = reverse_complement_index(idx, k);
    return (idx < rc) ? idx : rc;
  }

  // Number of canonical k-mers: half of 4^k plus palindromes
  static inline size_t num_canonical_kmers(int k) {
    size_t total = 1ULL << (2 * k);
    return (total / 2) + (1ULL << (k - 1));
  }
};

// Maps each of the 256 tetranucleotides to one of the 136 canonical classes.
// Classes are numbered by first appearance in lexicographic order, so a
// tetranucleotide and its reverse complement share a column.
const std::array<uint8_t, 256>& tnf_class_table();

// Tetranucleotide frequencies of one sequence: 136 values summing to 1, or all
// zeros when the sequence has no 4-mer free of ambiguous bases
void extract_tnf_frequencies(const std::string& seq, float* out);

// Reads a FASTA (plain or gzip) and returns names, lengths and TNF rows of the
// contigs of at least min_length bases, in file order
ContigSet extract_tnf(const std::string& fasta_path, int min_length, Logger* log = nullptr);

}  // namespace vbin
