#include "stage_scheduler.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace kbsync::scheduler {

using observability::IntField;
using observability::StringField;

StageScheduler::StageScheduler(Duration tick) : tick_(tick.count() > 0 ? tick : Duration(1000)) {
}

StageScheduler::~StageScheduler() {
  Stop();
}

void StageScheduler::Add(std::shared_ptr<pipeline::Stage> stage, Duration interval) {
  if (started_) throw std::logic_error("stage added after scheduler start");
  if (interval.count() <= 0) throw std::invalid_argument("stage interval must be positive");
  entries_.push_back(Entry{.worker = std::make_unique<StageWorker>(std::move(stage)), .interval = interval, .next_due = {}});
}

void StageScheduler::Start() {
  if (started_) return;
  started_ = true;

  const auto now = std::chrono::steady_clock::now();
  for (auto& entry : entries_) {
    entry.next_due = now;
    entry.worker->Start();
    KBSYNC_LOG_INFO("stage scheduled", {StringField("stage", entry.worker->Name()), IntField("interval_ms", entry.interval.count())});
  }

  ticker_ = std::thread(&StageScheduler::Tick, this);
}

void StageScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!started_ || stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  if (ticker_.joinable()) ticker_.join();

  for (auto& entry : entries_) {
    entry.worker->Stop();
    auto stats = entry.worker->Stats();
    KBSYNC_LOG_INFO("stage stopped", {StringField("stage", entry.worker->Name()), IntField("runs", static_cast<int64_t>(stats.runs)),
                                      IntField("failed", static_cast<int64_t>(stats.failed)), IntField("skipped", static_cast<int64_t>(stats.skipped))});
  }
}

StageStats StageScheduler::Stats(std::string_view stage) const {
  for (const auto& entry : entries_) {
    if (entry.worker->Name() == stage) return entry.worker->Stats();
  }
  throw std::out_of_range("unknown stage: " + std::string(stage));
}

void StageScheduler::Tick() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    const auto now = std::chrono::steady_clock::now();
    for (auto& entry : entries_) {
      if (now < entry.next_due) continue;
      if (!entry.worker->TryTrigger()) {
        KBSYNC_LOG_DEBUG("stage still running, tick skipped", {StringField("stage", entry.worker->Name())});
      }
      entry.next_due = now + entry.interval;
    }
    cv_.wait_for(lock, tick_, [&] { return stopping_; });
  }
}

} // namespace kbsync::scheduler
