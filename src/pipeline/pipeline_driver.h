// VBIN - pipeline_driver.h
// Runs features -> coverage -> embedding -> clustering and enforces the
// contracts between them

#pragma once

#include "artifact_store.h"
#include "pipeline_stages.h"
#include "run_report.h"
#include "types.h"
#include "../util/logger.h"
#include <vbin/config.hpp>

#include <memory>
#include <optional>
#include <string>

namespace vbin {

// Stage names, in execution order. They appear in the run log.
constexpr const char* STAGE_FEATURES = "features";
constexpr const char* STAGE_COVERAGE = "coverage";
constexpr const char* STAGE_EMBEDDING = "embedding";
constexpr const char* STAGE_CLUSTERING = "clustering";

// Which stage matrices the driver currently holds in memory
struct ResidentMatrices {
    bool features = false;
    bool coverage = false;
    bool embedding = false;
};

class PipelineDriver {
public:
    PipelineDriver(PipelineStages& stages, Logger& log);

    // Creates the output directory, runs all four stages and returns the
    // final assignment. Throws PipelineError subclasses.
    ClusterAssignment execute(const RunConfiguration& config);

    const RunReport& report() const { return report_; }
    ResidentMatrices resident() const;

private:
    void run_features(const RunConfiguration& config);
    void run_coverage(const RunConfiguration& config);
    void run_embedding(const RunConfiguration& config);
    ClusterAssignment run_clustering(const RunConfiguration& config);
    void release_inputs();

    PipelineStages& stages_;
    Logger& log_;
    RunReport report_;
    std::unique_ptr<ArtifactStore> store_;

    ContigSet contigs_;
    std::optional<CoverageMatrix> coverage_;
    std::optional<Embedding> embedding_;
};

// Entry point used by the CLI: runs the pipeline, prints a single error line
// on failure and returns the process exit code
int run_vbin(const RunConfiguration& config, PipelineStages& stages, Logger& log);

}  // namespace vbin
