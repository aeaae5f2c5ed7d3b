#include "normfmt/types.hpp"
#include <algorithm>

namespace normfmt {

auto skipped_count(const Diagnostics& diagnostics) -> size_t {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(), [](const auto& outcome) {
        return outcome.status == PassOutcome::Status::SKIPPED;
    }));
}

auto applied_count(const Diagnostics& diagnostics) -> size_t {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(), [](const auto& outcome) {
        return outcome.status == PassOutcome::Status::APPLIED;
    }));
}

} // namespace normfmt
