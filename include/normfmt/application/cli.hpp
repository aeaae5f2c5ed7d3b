#pragma once

#include "normfmt/interfaces.hpp"
#include "normfmt/result.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace normfmt {

struct Config {
    std::vector<std::string> files;             // Empty: read stdin, write stdout
    bool enhanced = false;
    std::optional<std::string> formatter_path;  // --formatter-path, else C_FORMATTER_42_PATH
    std::optional<std::string> username;
    std::optional<std::string> email;
    bool add_header = true;
    bool dry_run = false;
    bool confirm = false;                       // Ask before overwriting each file
    bool print_plan = false;
    bool debug = false;
    bool show_help = false;
    EnvOverrides extra_env;                     // --env KEY=VALUE, passed to the formatter
};

// Command line without the program name
auto parse_args(const std::vector<std::string>& args) -> Result<Config, std::string>;

// Fill what the command line left open from the environment
auto apply_environment(Config& config, IEnvironment& environment) -> void;

auto print_usage(std::ostream& out) -> void;

} // namespace normfmt
