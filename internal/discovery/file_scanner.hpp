#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace kbsync::discovery {

struct FileInfo {
  int64_t size  = 0;
  double  mtime = 0.0; // seconds since epoch, sub-second precision
};

struct ScanOptions {
  std::vector<std::string> roots;
  std::set<std::string>    extensions; // lower-case, without the dot
  uint64_t                 min_file_size_bytes = 1024;
  bool                     follow_symlinks     = false;
};

struct ScanResult {
  std::map<std::string, FileInfo> files;
  // matching names whose stat failed; neither new nor removed this run
  std::set<std::string> unobserved;
  uint64_t              skipped_small = 0;
};

// Built-in allow-list used when the configuration lists no extensions.
const std::set<std::string>& DefaultExtensions();

// Lower-cased extension after the last dot of the file name; empty if none.
std::string LowerExtension(const std::string& path);

/*
  Walks the configured roots once and returns every candidate file.

  Any root that is missing or not a directory, and any directory
  iteration error, throws util::FilesystemError before a result is
  produced: a partial enumeration would make tracked files look removed.
*/
class FileScanner {
 public:
  explicit FileScanner(ScanOptions options);

  ScanResult Scan() const;

 private:
  void ScanRoot(const std::string& root, ScanResult& result) const;
  void Observe(const std::string& path, ScanResult& result) const;

  ScanOptions options_;
};

} // namespace kbsync::discovery
