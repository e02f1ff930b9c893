// VBIN - run_report.cpp

#include "run_report.h"
#include "../util/logger.h"

#include <sstream>

namespace vbin {

StageRecord& RunReport::entry(const std::string& stage) {
    for (auto& rec : stages_) {
        if (rec.stage == stage) return rec;
    }
    stages_.push_back(StageRecord{stage, 0.0, false, {}});
    return stages_.back();
}

void RunReport::record(const std::string& stage, double elapsed_seconds, bool succeeded) {
    auto& rec = entry(stage);
    rec.elapsed_seconds = elapsed_seconds;
    rec.succeeded = succeeded;
}

void RunReport::add_count(const std::string& stage, const std::string& key, int64_t value) {
    auto& rec = entry(stage);
    for (auto& kv : rec.counts) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    rec.counts.emplace_back(key, value);
}

const StageRecord* RunReport::find(const std::string& stage) const {
    for (const auto& rec : stages_) {
        if (rec.stage == stage) return &rec;
    }
    return nullptr;
}

double RunReport::total_seconds() const {
    double total = 0.0;
    for (const auto& rec : stages_) total += rec.elapsed_seconds;
    return total;
}

std::string RunReport::summary() const {
    std::ostringstream ss;
    for (const auto& rec : stages_) {
        ss << rec.stage << " " << Logger::format_seconds(rec.elapsed_seconds) << "s";
        if (!rec.succeeded) ss << " FAILED";
        if (!rec.counts.empty()) {
            ss << " (";
            for (size_t i = 0; i < rec.counts.size(); i++) {
                if (i > 0) ss << ", ";
                ss << rec.counts[i].first << "=" << rec.counts[i].second;
            }
            ss << ")";
        }
        ss << "; ";
    }
    ss << "total " << Logger::format_seconds(total_seconds()) << "s";
    return ss.str();
}

void RunReport::write_table(Logger& log) const {
    log.table_header("stages", {"stage", "seconds", "status", "counts"});
    for (const auto& rec : stages_) {
        std::string counts;
        for (const auto& kv : rec.counts) {
            if (!counts.empty()) counts += ",";
            counts += kv.first + "=" + std::to_string(kv.second);
        }
        log.table_row({rec.stage, Logger::format_seconds(rec.elapsed_seconds),
                       rec.succeeded ? "ok" : "failed", counts.empty() ? "-" : counts});
    }
}

}  // namespace vbin
