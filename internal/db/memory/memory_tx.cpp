#include "memory_tx.hpp"

#include <stdexcept>

namespace kbsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool writable) : repo_(repo), writable_(writable) {
  if (writable_) writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);

  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (writable_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace kbsync::db::memory
