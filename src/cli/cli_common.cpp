// VBIN - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include "../pipeline/errors.h"
#include <vbin/config.hpp>

#include <cctype>
#include <cstddef>

namespace vbin {

std::string ParsedArgs::get(const std::string& name, const std::string& default_val) const {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) return default_val;
    return it->second.back();
}

std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) return {};
    return it->second;
}

const CLIOption* CLICommand::find_option(const std::string& name) const {
    for (const auto& opt : options) {
        if (opt.name == name) return &opt;
    }
    return nullptr;
}

void CLICommand::print_help(std::ostream& out) const {
    out << "Usage: vbin " << name;
    for (const auto& pos : positionals) {
        out << " <" << pos.name << ">" << (pos.repeated ? "..." : "");
    }
    out << " [options]\n\n";
    out << description << "\n";
    for (const auto& line : description_extra) {
        out << line << "\n";
    }
    out << "\n";

    const size_t MIN_COL = 21;
    size_t col = MIN_COL;
    for (const auto& opt : options) {
        size_t len = 2 + opt.name.length();
        if (!opt.arg_name.empty()) len += 1 + opt.arg_name.length() + (opt.multi ? 3 : 0);
        if (len + 1 > col) col = len + 1;
    }
    for (const auto& pos : positionals) {
        if (pos.name.length() + 3 > col) col = pos.name.length() + 3;
    }

    if (!positionals.empty()) {
        out << "Required arguments:\n";
        for (const auto& pos : positionals) {
            std::string s = "  " + pos.name;
            while (s.length() < col) s += " ";
            out << s << pos.description << "\n";
        }
        out << "\n";
    }

    // Options grouped in declaration order of their group
    std::vector<std::string> groups;
    for (const auto& opt : options) {
        bool seen = false;
        for (const auto& g : groups) seen = seen || g == opt.group;
        if (!seen) groups.push_back(opt.group);
    }
    for (const auto& group : groups) {
        out << group << ":\n";
        for (const auto& opt : options) {
            if (opt.group != group) continue;
            std::string s = "  " + opt.name;
            if (!opt.arg_name.empty()) {
                s += " " + opt.arg_name + (opt.multi ? "..." : "");
            }
            while (s.length() < col) s += " ";
            std::string desc = opt.description;
            if (!opt.default_value.empty()) {
                desc += " [" + opt.default_value + "]";
            }
            out << s << desc << "\n";
        }
        out << "\n";
    }

    if (!outputs.empty()) {
        out << "Output:\n";
        for (const auto& o : outputs) {
            std::string s = "  " + o.filename;
            while (s.length() < col) s += " ";
            out << s << o.description << "\n";
        }
        out << "\n";
    }

    if (!note.empty()) {
        out << "Note:\n  " << note << "\n\n";
    }

    if (!examples.empty()) {
        out << "Example:\n";
        for (const auto& ex : examples) {
            out << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return true;
        }
    }
    return false;
}

namespace {

// "-5" and "-0.2" are values, "-m" is an option
bool looks_like_number(const std::string& s) {
    if (s.size() < 2 || s[0] != '-') return false;
    return std::isdigit(static_cast<unsigned char>(s[1])) || s[1] == '.';
}

bool is_number(const std::string& s) {
    size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i])) && s[i] != '.') return false;
    }
    return true;
}

bool looks_like_option(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && !looks_like_number(s);
}

}  // namespace

ParsedArgs CLICommand::parse(int argc, char** argv) const {
    ParsedArgs parsed;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!looks_like_option(arg)) {
            parsed.positionals.push_back(arg);
            continue;
        }

        const CLIOption* opt = find_option(arg);
        if (!opt) {
            throw InvalidParameter(arg, "unknown option");
        }

        auto& slot = parsed.values[opt->name];
        if (opt->is_flag()) {
            slot.push_back("1");
            continue;
        }

        if (i + 1 >= argc || looks_like_option(argv[i + 1])) {
            throw InvalidParameter(opt->name, "expected a value (" + opt->arg_name + ")");
        }
        if (opt->multi) {
            slot.clear();
            // Only numbers are taken, so the positionals after "-n 64 64" survive
            while (i + 1 < argc && is_number(argv[i + 1])) {
                slot.push_back(argv[++i]);
            }
            if (slot.empty()) {
                throw InvalidParameter(opt->name, "expected one or more values (" +
                                                      opt->arg_name + ")");
            }
        } else {
            slot.assign(1, argv[++i]);
        }
    }

    size_t required = 0;
    bool repeated = false;
    for (const auto& pos : positionals) {
        required++;
        repeated = repeated || pos.repeated;
    }
    if (parsed.positionals.size() < required) {
        throw InvalidParameter(positionals[parsed.positionals.size()].name,
                               "missing required argument");
    }
    if (!repeated && parsed.positionals.size() > required) {
        throw InvalidParameter(parsed.positionals[required], "unexpected argument");
    }

    return parsed;
}

int parse_int(const std::string& field, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter(field, "expected an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw InvalidParameter(field, "expected an integer, got '" + value + "'");
    }
    return result;
}

double parse_double(const std::string& field, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter(field, "expected a number, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw InvalidParameter(field, "expected a number, got '" + value + "'");
    }
    return result;
}

CLICommand make_run_command() {
    CLICommand cmd;
    cmd.name = "run";
    cmd.description = "Bin metagenomic contigs with a variational autoencoder.";
    cmd.description_extra = {
        "",
        "Stages: tetranucleotide frequencies -> RPKM from alignments -> VAE latent",
        "embedding -> medoid clustering. Each stage output is kept in <outdir>.",
    };

    cmd.positionals = {
        {"outdir", "output directory to create"},
        {"fasta", "path to contigs FASTA (plain or gzip)"},
        {"bamfiles", "paths to BAM/SAM files of reads mapped to the contigs", true},
    };

    const std::string io = "IO options";
    const std::string training = "Training options";
    const std::string clustering = "Clustering options";
    cmd.options = {
        {"-h", "", "print help and exit", "", "Help"},
        {"-m", "INT", "ignore contigs shorter than this",
         std::to_string(DEFAULT_MIN_CONTIG_LENGTH), io},
        {"-a", "INT", "ignore reads with alignment score below this",
         std::to_string(DEFAULT_MIN_ALIGNMENT_SCORE), io},
        {"-p", "INT", "reading subprocesses to spawn",
         "min(" + std::to_string(MAX_DEFAULT_SUBPROCESSES) + ", cpus)", io},
        {"-n", "INT", "hidden neurons", "325 325 325", training, true},
        {"-l", "INT", "latent neurons", std::to_string(DEFAULT_LATENT_DIM), training},
        {"-e", "INT", "epochs", std::to_string(DEFAULT_EPOCHS), training},
        {"-b", "INT", "batch size", std::to_string(DEFAULT_BATCH_SIZE), training},
        {"-s", "FLOAT", "amount to learn (capacity)", "1000.0", training},
        {"-r", "FLOAT", "weight of TNF versus depth, in (0,1)", "0.2", training},
        {"--cuda", "", "use GPU", "", training},
        {"-i", "INT", "minimum cluster size", std::to_string(DEFAULT_MIN_CLUSTER_SIZE),
         clustering},
        {"-c", "INT", "stop after this many clusters, -1 = unbounded",
         std::to_string(UNBOUNDED_CLUSTERS), clustering},
    };

    cmd.outputs = {
        {"log.txt", "run log with timestamped stage lines"},
        {"tnf.tsv", "tetranucleotide frequencies per contig"},
        {"rpkm.tsv", "RPKM per contig and sample"},
        {"model.pt", "trained VAE checkpoint"},
        {"latent.tsv", "latent embedding per contig"},
        {"clusters.tsv", "bin name and contig name per line"},
    };

    cmd.note = "The output directory must not exist; its parent must.";

    cmd.examples = {
        "vbin run out contigs.fna.gz sample1.bam sample2.bam",
        "vbin run out contigs.fna sample1.bam -m 2000 -n 512 512 -l 32 --cuda",
    };

    return cmd;
}

}  // namespace vbin
