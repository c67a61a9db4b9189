#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "stage_worker.hpp"

namespace kbsync::scheduler {

/*
  StageScheduler

  Periodic driver for the pipeline stages. Each stage gets its own
  StageWorker; a ticker thread triggers every stage whose interval has
  elapsed. All stages are due once immediately after Start().
*/
class StageScheduler {
 public:
  using Duration = std::chrono::milliseconds;

  explicit StageScheduler(Duration tick = Duration(1000));
  ~StageScheduler();

  StageScheduler(const StageScheduler&)            = delete;
  StageScheduler& operator=(const StageScheduler&) = delete;

  // before Start() only
  void Add(std::shared_ptr<pipeline::Stage> stage, Duration interval);

  void Start();
  void Stop();

  StageStats Stats(std::string_view stage) const;

 private:
  struct Entry {
    std::unique_ptr<StageWorker>          worker;
    Duration                              interval;
    std::chrono::steady_clock::time_point next_due;
  };

  void Tick();

  Duration           tick_;
  std::vector<Entry> entries_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  bool                    started_  = false;
  std::thread             ticker_;
};

} // namespace kbsync::scheduler
