#pragma once

#include "normfmt/interfaces.hpp"
#include <string>
#include <vector>

namespace normfmt {

// Exit code reported when the program could not be executed at all
inline constexpr int kExecFailureExitCode = 127;

// fork/exec without a shell; stdout and stderr are captured separately.
// Runs to completion, there is no timeout.
class ProcessRunner : public IProcessRunner {
public:
    auto run(const std::vector<std::string>& argv, const EnvOverrides& env) -> ProcessResult override;
};

} // namespace normfmt
