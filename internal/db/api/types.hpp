#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/document_status.hpp"

namespace kbsync::db {

struct Pagination {
  std::size_t limit  = 0; // 0 = unbounded
  std::size_t offset = 0;
};

enum class DocumentOrder {
  kInsertion,        // id ascending
  kNewestFirst,      // created_at descending
  kRecentlyFinished, // finish_at descending
};

struct DocumentFilter {
  std::optional<kbsync::model::DocumentStatus> status;
  bool                                         exclude_deleted = false;
  DocumentOrder                                order           = DocumentOrder::kInsertion;
};

struct StatusCount {
  std::string status;
  int64_t     count = 0;
};

} // namespace kbsync::db
