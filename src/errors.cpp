#include "normfmt/errors.hpp"

namespace normfmt {

auto candidate_kind_name(CandidateKind kind) -> std::string {
    switch (kind) {
    case CandidateKind::EXPLICIT_OVERRIDE:
        return "explicit-override";
    case CandidateKind::SEARCH_PATH:
        return "search-path";
    case CandidateKind::MODULE_LOOKUP:
        return "module-lookup";
    case CandidateKind::WELL_KNOWN_DIRECTORY:
        return "well-known-directory";
    case CandidateKind::PACKAGE_MANAGER:
        return "package-manager";
    }
    return "unknown";
}

} // namespace normfmt
