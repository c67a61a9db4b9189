#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace kbsync::db::model {

/*
  One row of script_process_record: a single execution of one stage.
  Append-only.
*/

inline constexpr const char* kRunSuccess = "success";
inline constexpr const char* kRunFail    = "fail";

struct ScriptRunRecord {
  int64_t     id = 0;
  std::string script_name;

  double  process_duration = 0.0; // seconds
  int64_t process_count    = 0;
  int64_t insert_count     = 0;
  int64_t update_count     = 0;
  int64_t delete_count     = 0;

  util::TimePoint process_timestamp{};
  std::string     status = kRunSuccess;
  std::string     failed_reason;
};

} // namespace kbsync::db::model
