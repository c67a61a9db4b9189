#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kbsync::runtime::config {
class RuntimeConfig;
}

namespace kbsync::observability {

bool InitializeTracing(const kbsync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const kbsync::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  StageSpan

  One span per stage run, named kbsync.<stage> and tagged with the stage.
  Starts as success; MarkFailed turns it into an error span. Without
  ENABLE_OTEL every member is an inline no-op.
*/
class StageSpan {
 public:
  explicit StageSpan(std::string_view stage);
  ~StageSpan();

  StageSpan(const StageSpan&)            = delete;
  StageSpan& operator=(const StageSpan&) = delete;

  void SetCounts(std::int64_t processed, std::int64_t inserted, std::int64_t updated, std::int64_t deleted);
  void MarkFailed(std::string_view reason);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // kbsync.stage.runs
  void RecordStageRun(std::string_view stage, bool success);
  // kbsync.stage.duration_ms
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  // kbsync.document.transitions
  void RecordTransition(std::string_view stage, std::string_view outcome, std::uint64_t count = 1);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const kbsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const kbsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline StageSpan::StageSpan(std::string_view) {
}

inline StageSpan::~StageSpan() {
}

inline void StageSpan::SetCounts(std::int64_t, std::int64_t, std::int64_t, std::int64_t) {
}

inline void StageSpan::MarkFailed(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordStageRun(std::string_view, bool) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::RecordTransition(std::string_view, std::string_view, std::uint64_t) {
}
#endif

} // namespace kbsync::observability
