#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/document_status.hpp"
#include "internal/util/time.hpp"

namespace kbsync::db::model {

/*
  One row of document_status_table.

  IMPORTANT:
  - filepath is the natural key; id is assigned by the backend on insert.
  - knowledge_id is set only after a successful submission since the
    last reset.
  - last_modified_time is kept as the exact double observed by stat() so
    change detection can compare it for equality.
*/

struct DocumentRecord {
  int64_t     id = 0;
  std::string filename;
  std::string filepath;

  kbsync::model::DocumentStatus status = kbsync::model::DocumentStatus::kDiscover;

  util::TimePoint created_at{};
  double          last_modified_time = 0.0;

  std::optional<util::TimePoint> process_at;
  std::optional<util::TimePoint> finish_at;

  std::optional<std::string> failed_msg;
  int64_t                    file_size = 0;
  std::optional<std::string> file_hash;
  std::optional<std::string> file_store_path;
  std::optional<std::string> knowledge_id;
};

} // namespace kbsync::db::model
