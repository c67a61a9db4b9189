#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

namespace kbsync::config {

namespace defaults {
inline constexpr const char* kDatabasePath         = "kbsync.db";
inline constexpr unsigned    kBusyTimeoutMs        = 5000;
inline constexpr unsigned    kMinFileSizeBytes     = 1024;
inline constexpr const char* kBaseUrl              = "http://localhost:8000";
inline constexpr const char* kApiPrefix            = "/api/v1";
inline constexpr unsigned    kConnectTimeoutMs     = 10000;
inline constexpr unsigned    kRequestTimeoutMs     = 60000;
inline constexpr unsigned    kSubmitBatchSize      = 50;
inline constexpr const char* kHashAlgorithm        = "sha256";
inline constexpr unsigned    kPollRequestDelayMs   = 200;
inline constexpr unsigned    kDiscoverIntervalSec  = 600;
inline constexpr unsigned    kSubmitIntervalSec    = 120;
inline constexpr unsigned    kPollIntervalSec      = 120;
inline constexpr unsigned    kSchedulerTickMs      = 1000;
} // namespace defaults

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  an error. After parsing, KBSYNC_* environment overrides are applied,
  zero/empty values are replaced by the defaults above and the result is
  validated. Every failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static kbsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same pipeline on an in-memory document.
  static kbsync::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyEnvironmentOverrides(kbsync::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(kbsync::runtime::config::RuntimeConfig& config);
  static void Validate(const kbsync::runtime::config::RuntimeConfig& config);

  // Discovery needs at least one root once groups are expanded. Checked by
  // the entry points that will run discovery; ledger reports and one-shot
  // submit/poll runs do not need roots.
  static void RequireDiscoveryRoots(const kbsync::runtime::config::RuntimeConfig& config);

  // roots followed by every prefix/midfix/suffix expansion, de-duplicated,
  // in configuration order
  static std::vector<std::string> ExpandRoots(const kbsync::runtime::config::DiscoveryConfig& discovery);
};

} // namespace kbsync::config
