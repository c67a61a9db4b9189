#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace kbsync::testing {

/*
  Scratch directory removed on destruction.
*/
class TempTree {
 public:
  explicit TempTree(const std::string& name) {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("kbsync_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  ~TempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempTree(const TempTree&)            = delete;
  TempTree& operator=(const TempTree&) = delete;

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::string Path(const std::string& relative) const {
    return (root_ / relative).string();
  }

  // Writes size bytes of fill and returns the absolute path.
  std::string Write(const std::string& relative, std::size_t size, char fill = 'x') const {
    const auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, fill);
    return path.string();
  }

  // Moves the modification time by delta seconds.
  void Touch(const std::string& relative, int delta_seconds) const {
    const auto path = root_ / relative;
    std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds(delta_seconds));
  }

  void Remove(const std::string& relative) const {
    std::filesystem::remove(root_ / relative);
  }

 private:
  std::filesystem::path root_;
};

} // namespace kbsync::testing
