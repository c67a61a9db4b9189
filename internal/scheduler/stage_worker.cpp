#include "stage_worker.hpp"

#include "internal/db/model/script_run_record.hpp"
#include "internal/observability/logging.hpp"

namespace kbsync::scheduler {

using observability::StringField;

StageWorker::StageWorker(std::shared_ptr<pipeline::Stage> stage) : stage_(std::move(stage)) {
}

StageWorker::~StageWorker() {
  Stop();
}

void StageWorker::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&StageWorker::Run, this);
}

void StageWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    pending_  = false;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

bool StageWorker::TryTrigger() {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || pending_ || busy_) {
      ++stats_.skipped;
      return false;
    }
    pending_ = true;
  }
  cv_.notify_one();
  return true;
}

void StageWorker::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return shutdown_ || (!pending_ && !busy_); });
}

StageStats StageWorker::Stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

void StageWorker::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || pending_; });
      if (shutdown_) break;
      pending_ = false;
      busy_    = true;
    }

    bool ok = false;
    try {
      ok = stage_->Run().status == db::model::kRunSuccess;
    } catch (const std::exception& e) {
      KBSYNC_LOG_ERROR("stage run escaped", {StringField("stage", stage_->Name()), StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
      ++stats_.runs;
      if (!ok) ++stats_.failed;
    }
    idle_cv_.notify_all();
  }
}

} // namespace kbsync::scheduler
