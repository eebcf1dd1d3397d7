#pragma once

#include <atomic>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace cryguard {
namespace test {

// Scratch directory removed with everything in it when the test ends.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> seq{0};
        path_ = std::filesystem::temp_directory_path() /
                ("cryguard-test-" + std::to_string(::getpid()) + "-" + std::to_string(seq++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

}  // namespace test
}  // namespace cryguard
