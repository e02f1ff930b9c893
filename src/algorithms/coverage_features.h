#pragma once

#include "../pipeline/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vbin {

class Logger;

// Read counts of one alignment file over the references that pass the
// length filter, in header order
struct SampleReadCounts {
  std::vector<std::string> references;
  std::vector<uint32_t> lengths;
  std::vector<uint64_t> reads;
  uint64_t total_reads = 0;
};

// Per-sample abundance from SAM/BAM/CRAM files
class CoverageExtractor {
public:
  // Counts primary, mapped records with AS >= min_score on references of at
  // least min_length bases. Records without an AS tag count only when
  // min_score is 0.
  static SampleReadCounts count_reads(const std::string &bam_path, int min_score,
                                      int min_length);

  // reads * 1e9 / (reference length * total counted reads)
  static std::vector<float> to_rpkm(const SampleReadCounts &counts);

  // One column per file. Files are parsed by up to worker_count threads.
  // Throws if a file cannot be read or the files disagree on the reference
  // count.
  static CoverageMatrix estimate_rpkm(const std::vector<std::string> &bam_paths,
                                      int min_score, int min_length,
                                      int worker_count, Logger *log = nullptr);
};

} // namespace vbin
