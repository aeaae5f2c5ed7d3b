#include "normfmt/io/file_system.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace normfmt {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return content.str();
}

auto FileSystem::write_file_atomic(const std::string& path, const std::string& content) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".normfmt.tmp";
    std::error_code ec;

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << content;
        file.flush();
        if (file.fail()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return false;
        }
    } // File automatically closed here

    // Keep the original's mode bits on the replacement
    auto status = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::exists(status)) {
        std::filesystem::permissions(temp_path, status.permissions(), ec);
    }

    // Atomically replace original file
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp_path, cleanup);
        return false;
    }
    return true;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::is_directory(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto FileSystem::is_executable(const std::string& path) -> bool {
    return !is_directory(path) && access(path.c_str(), X_OK) == 0;
}

auto SystemEnvironment::get(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace normfmt
