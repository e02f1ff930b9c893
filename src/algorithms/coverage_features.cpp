#include "coverage_features.h"
#include "../util/logger.h"

#include <algorithm>
#include <htslib/hts.h>
#include <htslib/sam.h>
#include <memory>
#include <omp.h>
#include <stdexcept>

namespace vbin {

namespace {

struct SamFileCloser {
  void operator()(samFile *fp) const { sam_close(fp); }
};
struct HeaderDeleter {
  void operator()(bam_hdr_t *hdr) const { bam_hdr_destroy(hdr); }
};
struct RecordDeleter {
  void operator()(bam1_t *rec) const { bam_destroy1(rec); }
};

using SamFilePtr = std::unique_ptr<samFile, SamFileCloser>;
using HeaderPtr = std::unique_ptr<bam_hdr_t, HeaderDeleter>;
using RecordPtr = std::unique_ptr<bam1_t, RecordDeleter>;

} // namespace

SampleReadCounts CoverageExtractor::count_reads(const std::string &bam_path,
                                                int min_score, int min_length) {
  SamFilePtr fp(sam_open(bam_path.c_str(), "r"));
  if (!fp) {
    throw std::runtime_error("Cannot open alignment file " + bam_path);
  }
  HeaderPtr header(sam_hdr_read(fp.get()));
  if (!header) {
    throw std::runtime_error("Cannot read header of " + bam_path);
  }

  // Map header tid -> row, -1 for references below the length filter
  const int n_targets = header->n_targets;
  std::vector<int> row_of_tid(n_targets, -1);
  SampleReadCounts counts;
  for (int tid = 0; tid < n_targets; ++tid) {
    uint32_t len = header->target_len[tid];
    if (static_cast<int64_t>(len) < min_length) continue;
    row_of_tid[tid] = static_cast<int>(counts.references.size());
    counts.references.emplace_back(header->target_name[tid]);
    counts.lengths.push_back(len);
  }
  counts.reads.assign(counts.references.size(), 0);

  RecordPtr rec(bam_init1());
  int ret;
  while ((ret = sam_read1(fp.get(), header.get(), rec.get())) >= 0) {
    const auto &core = rec->core;
    if (core.flag & (BAM_FUNMAP | BAM_FSECONDARY | BAM_FSUPPLEMENTARY))
      continue;
    if (core.tid < 0 || core.tid >= n_targets)
      continue;
    int row = row_of_tid[core.tid];
    if (row < 0)
      continue;

    uint8_t *as = bam_aux_get(rec.get(), "AS");
    if (as) {
      if (bam_aux2i(as) < min_score)
        continue;
    } else if (min_score > 0) {
      continue;
    }

    counts.reads[row]++;
    counts.total_reads++;
  }
  if (ret < -1) {
    throw std::runtime_error("Truncated or corrupt alignment file " + bam_path);
  }

  return counts;
}

std::vector<float> CoverageExtractor::to_rpkm(const SampleReadCounts &counts) {
  std::vector<float> rpkm(counts.reads.size(), 0.0f);
  if (counts.total_reads == 0)
    return rpkm;

  const double per_million = static_cast<double>(counts.total_reads) / 1e6;
  for (size_t i = 0; i < counts.reads.size(); ++i) {
    double kb = counts.lengths[i] / 1e3;
    rpkm[i] = static_cast<float>(counts.reads[i] / (kb * per_million));
  }
  return rpkm;
}

CoverageMatrix CoverageExtractor::estimate_rpkm(const std::vector<std::string> &bam_paths,
                                                int min_score, int min_length,
                                                int worker_count, Logger *log) {
  const int n_files = static_cast<int>(bam_paths.size());
  const int n_threads = std::max(1, std::min(worker_count, n_files));

  std::vector<SampleReadCounts> samples(bam_paths.size());
  std::vector<std::string> errors(bam_paths.size());

  // Exceptions must not cross the OpenMP region; collect them per file
  #pragma omp parallel for num_threads(n_threads) schedule(dynamic, 1)
  for (int i = 0; i < n_files; ++i) {
    try {
      samples[i] = count_reads(bam_paths[i], min_score, min_length);
    } catch (const std::exception &e) {
      errors[i] = e.what();
    }
  }

  for (const auto &err : errors) {
    if (!err.empty())
      throw std::runtime_error(err);
  }

  CoverageMatrix coverage;
  if (samples.empty())
    return coverage;

  const size_t n_rows = samples[0].references.size();
  for (size_t s = 1; s < samples.size(); ++s) {
    if (samples[s].references.size() != n_rows) {
      throw std::runtime_error("Alignment files disagree on the number of references: " +
                               bam_paths[0] + " has " + std::to_string(n_rows) + ", " +
                               bam_paths[s] + " has " +
                               std::to_string(samples[s].references.size()));
    }
  }

  coverage.rpkm.resize(static_cast<Eigen::Index>(n_rows),
                       static_cast<Eigen::Index>(samples.size()));
  for (size_t s = 0; s < samples.size(); ++s) {
    std::vector<float> column = to_rpkm(samples[s]);
    for (size_t r = 0; r < n_rows; ++r) {
      coverage.rpkm(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(s)) = column[r];
    }
    if (log) {
      log->detail(bam_paths[s] + ": " + std::to_string(samples[s].total_reads) +
                  " reads counted over " + std::to_string(n_rows) + " references");
      if (samples[s].total_reads == 0) {
        log->warn("No reads passed the filters in " + bam_paths[s] +
                  "; its coverage column is all zeros");
      }
    }
  }

  return coverage;
}

} // namespace vbin
