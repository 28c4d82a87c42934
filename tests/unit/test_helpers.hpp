#pragma once

#include <fsgate/platform.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace fsgate::testing {

namespace fs = std::filesystem;

// Helper to create temporary directory. The path is canonical so that it
// compares equal to resolved real paths (e.g. /tmp -> /private/tmp).
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("fsgate_test_" + generate_uuid());
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string operator/(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

} // namespace fsgate::testing
