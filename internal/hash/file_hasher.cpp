#include "file_hasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace kbsync::hash {

HashAlgorithm ParseHashAlgorithm(std::string_view name) {
  if (name == "sha256") return HashAlgorithm::kSha256;
  if (name == "md5") return HashAlgorithm::kMd5;
  throw std::invalid_argument("unsupported hash algorithm: " + std::string(name));
}

struct FileHasher::Impl {
  EVP_MD_CTX* ctx = nullptr;

  Impl() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
      throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
  }

  ~Impl() {
    if (ctx) EVP_MD_CTX_free(ctx);
  }

  Impl(const Impl&)            = delete;
  Impl& operator=(const Impl&) = delete;
};

FileHasher::FileHasher(HashAlgorithm algorithm) : algorithm_(algorithm), impl_(std::make_unique<Impl>()) {
}

FileHasher::~FileHasher() = default;

void FileHasher::Init() {
  const EVP_MD* md = algorithm_ == HashAlgorithm::kMd5 ? EVP_md5() : EVP_sha256();
  if (EVP_DigestInit_ex(impl_->ctx, md, nullptr) != 1) {
    throw std::runtime_error("Failed to initialize digest");
  }
}

void FileHasher::Update(const void* data, std::size_t size) {
  if (EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update digest");
  }
}

std::string FileHasher::Finish() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;

  if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &length) != 1) {
    throw std::runtime_error("Failed to finalize digest");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

std::string FileHasher::HashBytes(std::string_view data) {
  Init();
  Update(data.data(), data.size());
  return Finish();
}

} // namespace kbsync::hash
