// VBIN - errors.h
// Exception taxonomy for validation, cross-stage contracts and stage failures

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vbin {

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {}
    virtual const char* kind() const noexcept { return "PipelineError"; }
};

// Bad user input, detected before any stage runs
class InvalidParameter : public PipelineError {
public:
    InvalidParameter(const std::string& field, const std::string& msg);
    const std::string& field() const { return field_; }
    const char* kind() const noexcept override { return "InvalidParameter"; }

private:
    std::string field_;
};

class PathNotFound : public InvalidParameter {
public:
    PathNotFound(const std::string& field, const std::string& path, const std::string& what);
    const std::string& path() const { return path_; }
    const char* kind() const noexcept override { return "PathNotFound"; }

private:
    std::string path_;
};

class PathConflict : public InvalidParameter {
public:
    PathConflict(const std::string& field, const std::string& path);
    const std::string& path() const { return path_; }
    const char* kind() const noexcept override { return "PathConflict"; }

private:
    std::string path_;
};

class AcceleratorUnavailable : public InvalidParameter {
public:
    AcceleratorUnavailable();
    const char* kind() const noexcept override { return "AcceleratorUnavailable"; }
};

// Row count of a stage output disagrees with the contig count of the
// feature stage. Always fatal.
class ContigCountMismatch : public PipelineError {
public:
    ContigCountMismatch(const std::string& stage, size_t expected, size_t observed);
    const std::string& stage() const { return stage_; }
    size_t expected() const { return expected_; }
    size_t observed() const { return observed_; }
    const char* kind() const noexcept override { return "ContigCountMismatch"; }

private:
    std::string stage_;
    size_t expected_;
    size_t observed_;
};

// Any other error raised by a collaborator, tagged with the stage name.
// The original exception is kept as the nested exception.
class StageFailure : public PipelineError {
public:
    StageFailure(const std::string& stage, const std::string& msg);
    const std::string& stage() const { return stage_; }
    const char* kind() const noexcept override { return "StageFailure"; }

private:
    std::string stage_;
};

}  // namespace vbin
