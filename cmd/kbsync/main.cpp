#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/stage_scheduler.hpp"

using kbsync::factory::Build;
using kbsync::scheduler::StageScheduler;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static std::chrono::milliseconds Seconds(uint32_t value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(value));
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: kbsync <config.yaml> OR kbsync --config <config.yaml>" << std::endl;
    return 1;
  }

  kbsync::runtime::config::RuntimeConfig config;
  try {
    config = kbsync::config::ConfigLoader::LoadFromYaml(config_path);
    kbsync::config::ConfigLoader::RequireDiscoveryRoots(config);
  } catch (const std::exception& e) {
    std::cerr << "kbsync: " << e.what() << std::endl;
    return 1;
  }

  try {
    kbsync::observability::InitializeTracing(config);
    kbsync::observability::InitializeMetrics(config);
    kbsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start scheduler
    // ------------------------------------------------------------
    const auto&    schedule = config.schedule();
    StageScheduler scheduler(std::chrono::milliseconds(schedule.tick_ms()));
    scheduler.Add(app.discovery, Seconds(schedule.discover_interval_s()));
    scheduler.Add(app.submission, Seconds(schedule.submit_interval_s()));
    scheduler.Add(app.poller, Seconds(schedule.poll_interval_s()));

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    scheduler.Start();
    KBSYNC_LOG_INFO("kbsync started", {kbsync::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    KBSYNC_LOG_INFO("Shutting down kbsync");

    scheduler.Stop();
    kbsync::observability::ShutdownLogging();
    kbsync::observability::ShutdownMetrics();
    kbsync::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    KBSYNC_LOG_ERROR("Fatal error", {kbsync::observability::StringField("error", e.what())});
    kbsync::observability::ShutdownLogging();
    kbsync::observability::ShutdownMetrics();
    kbsync::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
