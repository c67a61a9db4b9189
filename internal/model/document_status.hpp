#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kbsync::model {

/*
  Ledger lifecycle of one tracked file.

  Stored in the ledger as lower-case text ("discover", "pending", ...).
  kUnknown only exists for rows whose text cannot be parsed.
*/
enum class DocumentStatus : std::uint8_t {
  kUnknown    = 0,
  kDiscover   = 1,
  kPending    = 2,
  kProcessing = 3,
  kCompleted  = 4,
  kFailed     = 5,
  kDeleted    = 6,
};

constexpr bool IsTerminal(DocumentStatus status) {
  return status == DocumentStatus::kCompleted || status == DocumentStatus::kFailed || status == DocumentStatus::kDeleted;
}

// Still waiting on the ingestion system.
constexpr bool IsInFlight(DocumentStatus status) {
  return status == DocumentStatus::kPending || status == DocumentStatus::kProcessing;
}

constexpr bool CanTransition(DocumentStatus from, DocumentStatus to) {
  if (from == to) {
    return true;
  }
  if (from == DocumentStatus::kDeleted) {
    return false;
  }
  if (to == DocumentStatus::kUnknown) {
    return false;
  }
  if (to == DocumentStatus::kDeleted) {
    return true;
  }

  switch (from) {
    case DocumentStatus::kUnknown:
      return to == DocumentStatus::kDiscover || to == DocumentStatus::kFailed;
    case DocumentStatus::kDiscover:
      return to == DocumentStatus::kPending || to == DocumentStatus::kProcessing || to == DocumentStatus::kFailed;
    case DocumentStatus::kPending:
      return to == DocumentStatus::kProcessing || to == DocumentStatus::kCompleted || to == DocumentStatus::kFailed ||
             to == DocumentStatus::kDiscover;
    case DocumentStatus::kProcessing:
      return to == DocumentStatus::kPending || to == DocumentStatus::kCompleted || to == DocumentStatus::kFailed;
    case DocumentStatus::kCompleted:
    case DocumentStatus::kFailed:
      // only change detection re-opens a terminal record
      return to == DocumentStatus::kDiscover;
    case DocumentStatus::kDeleted:
      return false;
  }
  return false;
}

std::string_view ToString(DocumentStatus status);

// Case-insensitive; nullopt for anything outside the lifecycle.
std::optional<DocumentStatus> ParseDocumentStatus(std::string_view text);

} // namespace kbsync::model
