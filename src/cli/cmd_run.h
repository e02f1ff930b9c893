// VBIN - cmd_run.h
// CLI handler for the 'run' subcommand

#pragma once

#include <vbin/config.hpp>

namespace vbin {

// argv[0] is the subcommand name. Throws InvalidParameter on malformed input.
RunParameters parse_run_arguments(int argc, char** argv);

int cmd_run(int argc, char** argv);

}  // namespace vbin
