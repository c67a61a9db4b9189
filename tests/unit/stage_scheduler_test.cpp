#include "internal/scheduler/stage_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/model/script_run_record.hpp"
#include "internal/scheduler/stage_worker.hpp"

namespace {

using kbsync::scheduler::StageScheduler;
using kbsync::scheduler::StageWorker;
using namespace std::chrono_literals;

// Stage whose runs block until released; tracks overlap.
class GatedStage : public kbsync::pipeline::Stage {
 public:
  explicit GatedStage(std::string_view name, bool fail = false) : name_(name), fail_(fail) {
  }

  std::string_view Name() const override {
    return name_;
  }

  kbsync::db::model::ScriptRunRecord Run() override {
    const int now_active = ++active_;
    if (now_active > max_active_) max_active_ = now_active;
    ++started_;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return open_; });
    }
    --active_;

    kbsync::db::model::ScriptRunRecord run;
    run.script_name = std::string(name_);
    run.status      = fail_ ? kbsync::db::model::kRunFail : kbsync::db::model::kRunSuccess;
    return run;
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  int Started() const {
    return started_;
  }

  int MaxActive() const {
    return max_active_;
  }

 private:
  std::string_view        name_;
  bool                    fail_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    open_ = false;
  std::atomic<int>        active_{0};
  std::atomic<int>        max_active_{0};
  std::atomic<int>        started_{0};
};

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

void TestWorkerDropsTriggersWhileBusy() {
  auto        stage = std::make_shared<GatedStage>("submit");
  StageWorker worker(stage);
  worker.Start();

  assert(worker.TryTrigger());
  assert(WaitFor([&] { return stage->Started() == 1; }));
  assert(!worker.TryTrigger());
  assert(!worker.TryTrigger());

  stage->Open();
  worker.WaitIdle();

  auto stats = worker.Stats();
  assert(stats.runs == 1);
  assert(stats.skipped == 2);
  assert(stats.failed == 0);
  assert(stage->MaxActive() == 1);

  assert(worker.TryTrigger());
  worker.WaitIdle();
  assert(worker.Stats().runs == 2);
  worker.Stop();
}

void TestFailedRunsAreCounted() {
  auto        stage = std::make_shared<GatedStage>("poll", true);
  StageWorker worker(stage);
  stage->Open();
  worker.Start();

  assert(worker.TryTrigger());
  worker.WaitIdle();
  assert(worker.Stats().failed == 1);
  worker.Stop();
}

void TestSchedulerRunsEveryStageAtStartAndNeverOverlaps() {
  auto discover = std::make_shared<GatedStage>("discover");
  auto poll     = std::make_shared<GatedStage>("poll");
  poll->Open();

  StageScheduler scheduler(10ms);
  scheduler.Add(discover, 20ms);
  scheduler.Add(poll, 20ms);
  scheduler.Start();

  assert(WaitFor([&] { return discover->Started() == 1; }));
  assert(WaitFor([&] { return scheduler.Stats("poll").runs >= 3; }));

  // discover stays blocked; its ticks are skipped
  assert(WaitFor([&] { return scheduler.Stats("discover").skipped >= 2; }));
  assert(discover->Started() == 1);
  assert(discover->MaxActive() == 1);

  discover->Open();
  scheduler.Stop();

  assert(scheduler.Stats("discover").runs >= 1);
  assert(poll->MaxActive() == 1);
}

void TestStopWaitsForActiveRun() {
  auto stage = std::make_shared<GatedStage>("discover");

  StageScheduler scheduler(10ms);
  scheduler.Add(stage, 1000ms);
  scheduler.Start();
  assert(WaitFor([&] { return stage->Started() == 1; }));

  std::thread opener([&] {
    std::this_thread::sleep_for(50ms);
    stage->Open();
  });
  scheduler.Stop();
  opener.join();

  assert(scheduler.Stats("discover").runs == 1);
}

void TestInvalidConfiguration() {
  StageScheduler scheduler(10ms);
  bool           threw = false;
  try {
    scheduler.Add(std::make_shared<GatedStage>("poll"), 0ms);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)scheduler.Stats("missing");
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWorkerDropsTriggersWhileBusy();
  TestFailedRunsAreCounted();
  TestSchedulerRunsEveryStageAtStartAndNeverOverlaps();
  TestStopWaitsForActiveRun();
  TestInvalidConfiguration();

  std::cout << "kbsync_unit_stage_scheduler: pass\n";
  return 0;
}
