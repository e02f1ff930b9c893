// VBIN - run_report.h
// Per-stage timings and counts collected for the final log summary

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vbin {

class Logger;

struct StageRecord {
    std::string stage;
    double elapsed_seconds = 0.0;
    bool succeeded = false;
    std::vector<std::pair<std::string, int64_t>> counts;
};

class RunReport {
public:
    void record(const std::string& stage, double elapsed_seconds, bool succeeded);
    void add_count(const std::string& stage, const std::string& key, int64_t value);

    const std::vector<StageRecord>& stages() const { return stages_; }
    const StageRecord* find(const std::string& stage) const;
    double total_seconds() const;

    // "features 0.12s (contigs=10, bases=5000); coverage ...; total 1.30s"
    std::string summary() const;
    void write_table(Logger& log) const;

private:
    StageRecord& entry(const std::string& stage);

    std::vector<StageRecord> stages_;
};

}  // namespace vbin
