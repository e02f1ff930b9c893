#include "kmer_features.h"
#include "sequence_utils.h"
#include "../util/logger.h"

#include <omp.h>
#include <unordered_set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace vbin {

const std::array<uint8_t, 256>& tnf_class_table() {
  static const std::array<uint8_t, 256> table = [] {
    std::array<uint8_t, 256> t{};
    std::array<int, 256> class_of_canonical;
    class_of_canonical.fill(-1);
    int next_class = 0;
    for (uint32_t idx = 0; idx < 256; ++idx) {
      uint32_t canon = KmerUtils::canonical_index(idx, 4);
      if (class_of_canonical[canon] < 0) {
        class_of_canonical[canon] = next_class++;
      }
      t[idx] = static_cast<uint8_t>(class_of_canonical[canon]);
    }
    return t;
  }();
  return table;
}

void extract_tnf_frequencies(const std::string &seq, float *out) {
  const auto &table = tnf_class_table();
  std::array<uint32_t, TNF_DIM> counts{};
  uint64_t total = 0;

  // Rolling 2-bit encoding; valid counts bases since the last ambiguous one
  uint32_t idx = 0;
  int valid = 0;
  for (char c : seq) {
    uint8_t bits = KmerUtils::base_to_bits(c);
    if (bits > 3) {
      valid = 0;
      idx = 0;
      continue;
    }
    idx = ((idx << 2) | bits) & 0xFF;
    if (++valid >= 4) {
      counts[table[idx]]++;
      total++;
    }
  }

  for (int i = 0; i < TNF_DIM; ++i) {
    out[i] = total > 0 ? static_cast<float>(counts[i]) / static_cast<float>(total) : 0.0f;
  }
}

ContigSet extract_tnf(const std::string &fasta_path, int min_length, Logger *log) {
  std::vector<FASTASequence> records;
  std::unordered_set<std::string> seen;
  size_t n_skipped = 0;

  FASTAReader reader(fasta_path);
  FASTASequence rec;
  while (reader.next(rec)) {
    if (static_cast<int64_t>(rec.sequence.size()) < min_length) {
      n_skipped++;
      continue;
    }
    if (!seen.insert(rec.id).second) {
      throw std::runtime_error("Duplicate contig name '" + rec.id + "' in " + fasta_path);
    }
    records.push_back(std::move(rec));
    rec = FASTASequence();
  }

  ContigSet set;
  set.names.reserve(records.size());
  set.lengths.reserve(records.size());
  set.tnf.resize(static_cast<Eigen::Index>(records.size()), TNF_DIM);

  for (const auto &r : records) {
    set.names.push_back(r.id);
    set.lengths.push_back(static_cast<uint32_t>(r.sequence.size()));
  }

  #pragma omp parallel for schedule(dynamic, 64)
  for (size_t i = 0; i < records.size(); ++i) {
    extract_tnf_frequencies(records[i].sequence, set.tnf.row(static_cast<Eigen::Index>(i)).data());
  }

  if (log) {
    log->detail("Skipped " + std::to_string(n_skipped) + " contigs shorter than " +
                std::to_string(min_length) + " bp");
  }
  return set;
}

}  // namespace vbin
