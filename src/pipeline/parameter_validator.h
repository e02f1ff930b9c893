// VBIN - parameter_validator.h
// Checks every user-supplied parameter before any stage runs

#pragma once

#include <vbin/config.hpp>
#include <functional>

namespace vbin {

// Answers whether accelerated execution is possible on this machine
using AcceleratorProbe = std::function<bool()>;

class ParameterValidator {
public:
    explicit ParameterValidator(AcceleratorProbe accelerator_available);

    // Returns the frozen configuration or throws InvalidParameter (or one of
    // its subclasses) naming the offending field. Touches the file system only
    // to test for existence; never creates the output directory.
    RunConfiguration validate(const RunParameters& raw) const;

    void check_paths(const RunParameters& raw) const;
    void check_io_options(const RunParameters& raw) const;
    void check_training_options(const RunParameters& raw) const;
    void check_clustering_options(const RunParameters& raw) const;

private:
    AcceleratorProbe accelerator_available_;
};

}  // namespace vbin
