#include "file_scanner.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kbsync::discovery {

namespace fs = std::filesystem;

using observability::StringField;

const std::set<std::string>& DefaultExtensions() {
  static const std::set<std::string> kExtensions = {"pdf", "doc", "docx", "md", "markdown", "txt", "xlsx",
                                                    "xls", "csv", "jpg", "jpeg", "png", "gif"};
  return kExtensions;
}

std::string LowerExtension(const std::string& path) {
  const auto slash = path.find_last_of('/');
  const auto dot   = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return {};

  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

FileScanner::FileScanner(ScanOptions options) : options_(std::move(options)) {
  if (options_.extensions.empty()) options_.extensions = DefaultExtensions();
}

ScanResult FileScanner::Scan() const {
  // all roots are checked before any is walked
  for (const auto& root : options_.roots) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      throw util::FilesystemError("root " + root + " is not an accessible directory" + (ec ? ": " + ec.message() : ""));
    }
  }

  ScanResult result;
  for (const auto& root : options_.roots) {
    ScanRoot(root, result);
  }
  return result;
}

void FileScanner::ScanRoot(const std::string& root, ScanResult& result) const {
  auto dir_options = fs::directory_options::none;
  if (options_.follow_symlinks) dir_options |= fs::directory_options::follow_directory_symlink;

  std::error_code                  ec;
  fs::recursive_directory_iterator it(root, dir_options, ec);
  if (ec) throw util::FilesystemError("cannot open " + root + ": " + ec.message());

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;

    std::error_code entry_ec;
    const auto&     entry = *it;
    if (!options_.follow_symlinks && entry.is_symlink(entry_ec)) continue;
    if (entry.is_directory(entry_ec)) continue;

    const std::string path = entry.path().string();
    if (!options_.extensions.contains(LowerExtension(path))) continue;

    Observe(path, result);
  }

  if (ec) throw util::FilesystemError("directory walk under " + root + " failed: " + ec.message());
}

void FileScanner::Observe(const std::string& path, ScanResult& result) const {
  struct stat st {};
  const int   rc = options_.follow_symlinks ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
  if (rc != 0) {
    const int err = errno;
    KBSYNC_LOG_WARN("stat failed, file left unobserved", {StringField("path", path), StringField("error", std::generic_category().message(err))});
    result.unobserved.insert(path);
    return;
  }

  if (!S_ISREG(st.st_mode)) return;

  if (static_cast<uint64_t>(st.st_size) < options_.min_file_size_bytes) {
    ++result.skipped_small;
    return;
  }

  FileInfo info;
  info.size  = static_cast<int64_t>(st.st_size);
  info.mtime = static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
  result.files.emplace(path, info);
}

} // namespace kbsync::discovery
