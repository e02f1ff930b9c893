// VBIN - cli_common.h
// Option table, help printing and argument parsing shared by subcommands

#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace vbin {

struct CLIOption {
    std::string name;           // e.g., "-m", "--cuda"
    std::string arg_name;       // e.g., "INT", "FLOAT", "" for flags
    std::string description;
    std::string default_value;  // "" if no default
    std::string group;          // help section
    bool multi = false;         // consumes one or more values

    CLIOption(const std::string& n, const std::string& arg, const std::string& desc,
              const std::string& def = "", const std::string& grp = "Options",
              bool many = false)
        : name(n), arg_name(arg), description(desc), default_value(def), group(grp),
          multi(many) {}

    bool is_flag() const { return arg_name.empty(); }
};

struct CLIPositional {
    std::string name;
    std::string description;
    bool repeated = false;      // one or more
};

struct CLIOutput {
    std::string filename;
    std::string description;
};

// Result of parsing argv against a CLICommand
struct ParsedArgs {
    std::vector<std::string> positionals;
    std::map<std::string, std::vector<std::string>> values;

    bool has(const std::string& name) const { return values.count(name) > 0; }
    std::string get(const std::string& name, const std::string& default_val = "") const;
    std::vector<std::string> get_all(const std::string& name) const;
};

struct CLICommand {
    std::string name;
    std::string description;
    std::vector<std::string> description_extra;
    std::vector<CLIPositional> positionals;
    std::vector<CLIOption> options;
    std::vector<CLIOutput> outputs;
    std::string note;
    std::vector<std::string> examples;

    void print_help(std::ostream& out) const;

    bool has_help_flag(int argc, char** argv) const;

    // Parses argv[1..]. Throws InvalidParameter on unknown options, missing
    // option values or missing positionals.
    ParsedArgs parse(int argc, char** argv) const;

private:
    const CLIOption* find_option(const std::string& name) const;
};

// Numeric conversions that name the offending option on failure
int parse_int(const std::string& field, const std::string& value);
double parse_double(const std::string& field, const std::string& value);

CLICommand make_run_command();

}  // namespace vbin
