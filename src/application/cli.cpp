#include "normfmt/application/cli.hpp"

namespace normfmt {

namespace {

auto is_truthy(const std::string& value) -> bool {
    return value == "1" || value == "true" || value == "yes";
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> Result<Config, std::string> {
    Config config;

    auto value_of = [&](size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            return std::nullopt;
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--enhanced") {
            config.enhanced = true;
        } else if (arg == "--no-header") {
            config.add_header = false;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-c" || arg == "--confirm") {
            config.confirm = true;
        } else if (arg == "--print-plan") {
            config.print_plan = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--formatter-path" || arg == "--username" || arg == "--email" || arg == "--env") {
            auto value = value_of(i);
            if (!value) {
                return Result<Config, std::string>::failure(arg + " requires a value");
            }
            if (arg == "--formatter-path") {
                config.formatter_path = *value;
            } else if (arg == "--username") {
                config.username = *value;
            } else if (arg == "--email") {
                config.email = *value;
            } else {
                auto equals = value->find('=');
                if (equals == std::string::npos || equals == 0) {
                    return Result<Config, std::string>::failure("--env expects KEY=VALUE, got '" + *value + "'");
                }
                config.extra_env[value->substr(0, equals)] = value->substr(equals + 1);
            }
        } else if (arg.starts_with("-") && arg != "-") {
            return Result<Config, std::string>::failure("unknown option " + arg);
        } else {
            config.files.push_back(arg);
        }
    }

    return Result<Config, std::string>::success(std::move(config));
}

auto apply_environment(Config& config, IEnvironment& environment) -> void {
    if (!config.formatter_path) {
        if (auto path = environment.get("C_FORMATTER_42_PATH"); path && !path->empty()) {
            config.formatter_path = *path;
        }
    }
    if (auto debug = environment.get("NORMFMT_DEBUG"); debug && is_truthy(*debug)) {
        config.debug = true;
    }
}

auto print_usage(std::ostream& out) -> void {
    out << "Usage: normfmt [options] [FILE...]\n";
    out << "  Format C files in place for the 42 norminette. Without FILE, read stdin\n";
    out << "  and write the result to stdout.\n\n";
    out << "      --enhanced               Run the built-in norminette rules instead of c_formatter_42\n";
    out << "      --formatter-path <path>  Use this c_formatter_42 executable or package directory\n";
    out << "      --username <login>       Login for the 42 header (default: $USER)\n";
    out << "      --email <email>          Email for the 42 header (default: git config user.email)\n";
    out << "      --no-header              Do not add or refresh the 42 header\n";
    out << "      --dry-run                Print the result instead of writing the file\n";
    out << "  -c, --confirm                Ask confirmation before overwriting any file\n";
    out << "      --print-plan             Show how c_formatter_42 would be launched and exit\n";
    out << "      --env KEY=VALUE          Extra environment variable for the formatter\n";
    out << "  -v, --verbose                Debug output on stderr (also NORMFMT_DEBUG=1)\n";
    out << "  -h, --help                   Show this help\n";
    out << "\nExamples:\n";
    out << "  normfmt src/main.c                         # Format with c_formatter_42\n";
    out << "  normfmt --enhanced src/*.c                 # Built-in rules, adds the 42 header\n";
    out << "  normfmt --enhanced --dry-run < libft.c     # Preview on stdout\n";
    out << "  C_FORMATTER_42_PATH=~/venv/bin/c_formatter_42 normfmt --print-plan\n";
}

} // namespace normfmt
