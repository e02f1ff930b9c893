// VBIN - cmd_run.cpp
// CLI handler for the 'run' subcommand

#include "cmd_run.h"
#include "cli_common.h"
#include "../encoder/vae.h"
#include "../pipeline/errors.h"
#include "../pipeline/parameter_validator.h"
#include "../pipeline/pipeline_driver.h"
#include "../stages/binning_stages.h"
#include "../util/logger.h"

#include <iostream>
#include <string>

namespace vbin {

RunParameters parse_run_arguments(int argc, char** argv) {
    CLICommand cmd = make_run_command();
    ParsedArgs args = cmd.parse(argc, argv);

    RunParameters params;
    params.output_dir = args.positionals[0];
    params.fasta_path = args.positionals[1];
    params.bam_paths.assign(args.positionals.begin() + 2, args.positionals.end());

    if (args.has("-m")) params.min_contig_length = parse_int("-m", args.get("-m"));
    if (args.has("-a")) params.min_alignment_score = parse_int("-a", args.get("-a"));
    if (args.has("-p")) params.subprocesses = parse_int("-p", args.get("-p"));

    if (args.has("-n")) {
        params.model.hidden_layers.clear();
        for (const auto& v : args.get_all("-n")) {
            params.model.hidden_layers.push_back(parse_int("-n", v));
        }
    }
    if (args.has("-l")) params.model.latent_dim = parse_int("-l", args.get("-l"));
    if (args.has("-e")) params.model.epochs = parse_int("-e", args.get("-e"));
    if (args.has("-b")) params.model.batch_size = parse_int("-b", args.get("-b"));
    if (args.has("-s")) params.model.capacity = parse_double("-s", args.get("-s"));
    if (args.has("-r")) params.model.mse_ratio = parse_double("-r", args.get("-r"));
    params.model.use_cuda = args.has("--cuda");

    if (args.has("-i")) params.min_cluster_size = parse_int("-i", args.get("-i"));
    if (args.has("-c")) params.max_clusters = parse_int("-c", args.get("-c"));

    return params;
}

int cmd_run(int argc, char** argv) {
    CLICommand cmd = make_run_command();

    if (argc < 2 || cmd.has_help_flag(argc, argv)) {
        cmd.print_help(std::cout);
        return 0;
    }

    Logger log(VERSION);
    try {
        RunParameters params = parse_run_arguments(argc, argv);
        ParameterValidator validator(&accelerator_available);
        RunConfiguration config = validator.validate(params);

        BinningStages stages(log);
        return run_vbin(config, stages, log);
    } catch (const InvalidParameter& e) {
        log.error(e.what());
        std::cerr << "Run 'vbin run --help' for usage.\n";
        return 2;
    }
}

}  // namespace vbin
