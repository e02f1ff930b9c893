// VBIN - Variational autoencoder BINner
// Main entry point with git-style subcommand dispatch

#include <vbin/config.hpp>
#include "cli/cmd_run.h"
#include <iostream>
#include <string>

static void print_version() {
    std::cout << "vbin " << vbin::VERSION << "\n";
}

static void print_usage(const char* prog) {
    std::cout << "VBIN - Variational autoencoder BINner\n";
    std::cout << "Version: " << vbin::VERSION << "\n\n";
    std::cout << "Usage: " << prog << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run              Bin contigs from a FASTA and its read alignments\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "  -v, --version  Show version information\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  vbin run out/ contigs.fna sample1.bam sample2.bam\n";
    std::cout << "\n";
    std::cout << "For command-specific help, use: vbin <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 0;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "run") {
        return vbin::cmd_run(argc - 1, argv + 1);
    }

    std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
    print_usage(argv[0]);
    return 1;
}
