#include "normfmt/application/cli.hpp"
#include "normfmt/application/normfmt_app.hpp"
#include "normfmt/exec/process_runner.hpp"
#include "normfmt/io/file_system.hpp"
#include "normfmt/resolve/strategies.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// Exit code for a command line that could not be parsed
constexpr int kUsageExitCode = 2;

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = normfmt::parse_args(args);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error() << "\n";
        normfmt::print_usage(std::cerr);
        return kUsageExitCode;
    }

    auto config = std::move(parsed).value();
    if (config.show_help) {
        normfmt::print_usage(std::cout);
        return 0;
    }

    auto environment = std::make_unique<normfmt::SystemEnvironment>();
    normfmt::apply_environment(config, *environment);

    normfmt::NormfmtApp app(std::make_unique<normfmt::FileSystem>(),
                            std::make_unique<normfmt::ProcessRunner>(),
                            std::move(environment),
                            normfmt::default_strategies());
    return app.run(config);
}
