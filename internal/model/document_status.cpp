#include "document_status.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace kbsync::model {

namespace {

struct StatusName {
  DocumentStatus   status;
  std::string_view name;
};

constexpr std::array<StatusName, 6> kStatusNames = {{
    {DocumentStatus::kDiscover, "discover"},
    {DocumentStatus::kPending, "pending"},
    {DocumentStatus::kProcessing, "processing"},
    {DocumentStatus::kCompleted, "completed"},
    {DocumentStatus::kFailed, "failed"},
    {DocumentStatus::kDeleted, "deleted"},
}};

} // namespace

std::string_view ToString(DocumentStatus status) {
  for (const auto& entry : kStatusNames) {
    if (entry.status == status) return entry.name;
  }
  return "unknown";
}

std::optional<DocumentStatus> ParseDocumentStatus(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto& entry : kStatusNames) {
    if (entry.name == lowered) return entry.status;
  }
  return std::nullopt;
}

} // namespace kbsync::model
