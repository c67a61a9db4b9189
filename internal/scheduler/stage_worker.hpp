#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/pipeline/stage.hpp"

namespace kbsync::scheduler {

struct StageStats {
  uint64_t runs    = 0;
  uint64_t failed  = 0;
  uint64_t skipped = 0; // triggers dropped while a run was queued or active
};

/*
  Background thread that runs one stage on demand.

  Holds at most one pending trigger. A trigger that arrives while the
  stage is queued or running is dropped, so a stage never overlaps with
  itself.
*/
class StageWorker {
 public:
  explicit StageWorker(std::shared_ptr<pipeline::Stage> stage);
  ~StageWorker();

  StageWorker(const StageWorker&)            = delete;
  StageWorker& operator=(const StageWorker&) = delete;

  void Start();
  // lets an active run finish, drops a queued one
  void Stop();

  // false when dropped
  bool TryTrigger();

  // blocks until no run is queued or active
  void WaitIdle();

  StageStats Stats() const;

  std::string_view Name() const {
    return stage_->Name();
  }

 private:
  void Run();

  std::shared_ptr<pipeline::Stage> stage_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool                    pending_  = false;
  bool                    busy_     = false;
  bool                    shutdown_ = false;
  StageStats              stats_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace kbsync::scheduler
