#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace kbsync::hash {

enum class HashAlgorithm {
  kSha256,
  kMd5,
};

// "sha256" | "md5"; throws std::invalid_argument otherwise.
HashAlgorithm ParseHashAlgorithm(std::string_view name);

/*
  Content digest over OpenSSL EVP, rendered as lower-case hex.

  MD5 is offered because the ingestion service dedups by MD5; SHA-256 is
  the default. Not thread-safe; one instance per worker.
*/
class FileHasher {
 public:
  explicit FileHasher(HashAlgorithm algorithm = HashAlgorithm::kSha256);
  ~FileHasher();

  FileHasher(const FileHasher&)            = delete;
  FileHasher& operator=(const FileHasher&) = delete;

  HashAlgorithm Algorithm() const {
    return algorithm_;
  }

  // Callers hash the bytes they upload, so the digest matches the payload.
  std::string HashBytes(std::string_view data);

 private:
  struct Impl;

  void        Init();
  void        Update(const void* data, std::size_t size);
  std::string Finish();

  HashAlgorithm         algorithm_;
  std::unique_ptr<Impl> impl_;
};

} // namespace kbsync::hash
