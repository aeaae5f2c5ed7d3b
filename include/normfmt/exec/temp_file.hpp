#pragma once

#include "normfmt/errors.hpp"
#include "normfmt/result.hpp"
#include <string>

namespace normfmt {

// Uniquely named file in the system temp directory, removed on destruction
class ScopedTempFile {
public:
    // Create `<tmp>/normfmt-XXXXXX<suffix>` holding `content`
    static auto create(const std::string& suffix, const std::string& content)
        -> Result<ScopedTempFile, IoError>;

    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    auto operator=(const ScopedTempFile&) -> ScopedTempFile& = delete;
    ScopedTempFile(ScopedTempFile&& other) noexcept;
    auto operator=(ScopedTempFile&& other) noexcept -> ScopedTempFile&;

    auto path() const -> const std::string& { return path_; }

private:
    explicit ScopedTempFile(std::string path);

    std::string path_;
};

} // namespace normfmt
