#pragma once

#include "normfmt/interfaces.hpp"
#include "normfmt/resolve/resolver_chain.hpp"
#include <gmock/gmock.h>
#include <map>
#include <set>
#include <string>

namespace normfmt {

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_file, (const std::string&), (override));
    MOCK_METHOD(bool, write_file_atomic, (const std::string&, const std::string&), (override));
    MOCK_METHOD(bool, file_exists, (const std::string&), (override));
    MOCK_METHOD(bool, is_directory, (const std::string&), (override));
    MOCK_METHOD(bool, is_executable, (const std::string&), (override));
};

class MockProcessRunner : public IProcessRunner {
public:
    MOCK_METHOD(ProcessResult, run, (const std::vector<std::string>&, const EnvOverrides&), (override));
};

class MockEnvironment : public IEnvironment {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string&), (override));
};

class MockStrategy : public IResolverStrategy {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(StrategyOutcome, attempt, (ResolveContext&), (override));
};

// Environment backed by a map
class FakeEnvironment : public IEnvironment {
public:
    std::map<std::string, std::string> values;

    auto get(const std::string& name) -> std::optional<std::string> override {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

// In-memory tree: regular files with contents, directories and executables
class FakeFileSystem : public IFileSystem {
public:
    std::map<std::string, std::string> files;
    std::set<std::string> directories;
    std::set<std::string> executables;
    bool fail_writes = false;

    auto read_file(const std::string& path) -> std::optional<std::string> override {
        auto it = files.find(path);
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto write_file_atomic(const std::string& path, const std::string& content) -> bool override {
        if (fail_writes) {
            return false;
        }
        files[path] = content;
        return true;
    }

    auto file_exists(const std::string& path) -> bool override {
        return files.contains(path) || directories.contains(path) || executables.contains(path);
    }

    auto is_directory(const std::string& path) -> bool override { return directories.contains(path); }

    auto is_executable(const std::string& path) -> bool override { return executables.contains(path); }
};

} // namespace normfmt
