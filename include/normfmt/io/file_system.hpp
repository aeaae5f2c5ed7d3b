#pragma once

#include "normfmt/interfaces.hpp"
#include <optional>
#include <string>

namespace normfmt {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file_atomic(const std::string& path, const std::string& content) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto is_directory(const std::string& path) -> bool override;
    auto is_executable(const std::string& path) -> bool override;
};

// Process environment through getenv
class SystemEnvironment : public IEnvironment {
public:
    auto get(const std::string& name) -> std::optional<std::string> override;
};

} // namespace normfmt
