// VBIN - errors.cpp

#include "errors.h"

namespace vbin {

InvalidParameter::InvalidParameter(const std::string& field, const std::string& msg)
    : PipelineError("Invalid parameter '" + field + "': " + msg), field_(field) {}

PathNotFound::PathNotFound(const std::string& field, const std::string& path,
                           const std::string& what)
    : InvalidParameter(field, what + ": " + path), path_(path) {}

PathConflict::PathConflict(const std::string& field, const std::string& path)
    : InvalidParameter(field, "path already exists: " + path), path_(path) {}

AcceleratorUnavailable::AcceleratorUnavailable()
    : InvalidParameter("--cuda", "CUDA was requested but is not available") {}

ContigCountMismatch::ContigCountMismatch(const std::string& stage, size_t expected,
                                         size_t observed)
    : PipelineError("Number of contigs from feature extraction (" + std::to_string(expected) +
                    ") does not match the " + stage + " rows (" + std::to_string(observed) +
                    "). Do the alignment files originate from the same contigs and "
                    "carry their headers?"),
      stage_(stage),
      expected_(expected),
      observed_(observed) {}

StageFailure::StageFailure(const std::string& stage, const std::string& msg)
    : PipelineError("Stage '" + stage + "' failed: " + msg), stage_(stage) {}

}  // namespace vbin
