// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

namespace forgefleet {
namespace test {

namespace fs = std::filesystem;

// RAII temp directory, removed with its contents on destruction
class TempDir {
  public:
    explicit TempDir(const std::string& prefix) {
        path_ = fs::temp_directory_path() / (prefix + "_" + std::to_string(getpid()) + "_" +
                                             std::to_string(counter_++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    // Non-copyable
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const {
        return path_;
    }
    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

  private:
    fs::path path_;
    static inline int counter_ = 0;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::trunc);
    ofs << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace test
} // namespace forgefleet
