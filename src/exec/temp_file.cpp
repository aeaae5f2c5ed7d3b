#include "normfmt/exec/temp_file.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace normfmt {

auto ScopedTempFile::create(const std::string& suffix, const std::string& content)
    -> Result<ScopedTempFile, IoError> {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Result<ScopedTempFile, IoError>::failure(
            IoError{.message = "no temporary directory: " + ec.message(), .path = ""});
    }

    auto pattern = (dir / ("normfmt-XXXXXX" + suffix)).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return Result<ScopedTempFile, IoError>::failure(
            IoError{.message = std::string("cannot create temporary file: ") + std::strerror(errno),
                    .path = pattern});
    }

    // Owns the file from here on, so every failure below removes it
    ScopedTempFile file{std::string(name.data())};

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = std::string("cannot write temporary file: ") + std::strerror(errno);
            close(fd);
            return Result<ScopedTempFile, IoError>::failure(IoError{.message = message, .path = file.path()});
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        return Result<ScopedTempFile, IoError>::failure(
            IoError{.message = std::string("cannot close temporary file: ") + std::strerror(errno),
                    .path = file.path()});
    }
    return Result<ScopedTempFile, IoError>::success(std::move(file));
}

ScopedTempFile::ScopedTempFile(std::string path) : path_(std::move(path)) {}

ScopedTempFile::~ScopedTempFile() {
    if (!path_.empty()) {
        std::remove(path_.c_str());
    }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

auto ScopedTempFile::operator=(ScopedTempFile&& other) noexcept -> ScopedTempFile& {
    if (this != &other) {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

} // namespace normfmt
