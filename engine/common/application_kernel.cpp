#include "application_kernel.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include "logging.hpp"

namespace pacer {
namespace engine {
namespace common {

std::atomic<ApplicationKernel*> ApplicationKernel::instance_{nullptr};

//=== Constructors & Destructor ===
ApplicationKernel::ApplicationKernel() : app_name_("pacer_app") {
  instance_ = this;
}

ApplicationKernel::~ApplicationKernel() {
  Shutdown();
  ApplicationKernel* self = this;
  instance_.compare_exchange_strong(self, nullptr);
}

//=== Main Lifecycle ===

bool ApplicationKernel::Initialize(int argc, char** argv) {
  try {
    std::string config_file;
    std::vector<std::string> overrides;
    ParseCommandLineArguments(argc, argv, &config_file, &overrides);

    loaded_config_file_ = config_file;
    if (!config_.LoadFromFile(config_file)) {
      throw std::runtime_error("cannot load config file " + config_file);
    }
    ApplyOverrides(overrides);

    // Logging needs the loaded config
    InitializeLogging(config_);
    SPDLOG_INFO("Starting application: {} (config: {})", app_name_, loaded_config_file_);
    config_.PrintAllConfig();

    SetupSignalHandlers();

    try {
      OnInitialize();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("OnInitialize hook failed: {}", e.what());
      return false;
    }
  } catch (const CLI::Error& e) {
    SPDLOG_ERROR("Command-line parsing error: {}", e.what());
    return false;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Initialization failed: {}", e.what());
    return false;
  }

  return true;
}

void ApplicationKernel::ParseCommandLineArguments(int argc, char** argv, std::string* config_file,
                                                  std::vector<std::string>* overrides) {
  CLI::App app{app_name_};
  app.add_option("--config_file", *config_file, "Path to configuration file")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_option("--set", *overrides, "Config override as dotted.key=value (repeatable)");
  app.parse(argc, argv);
}

void ApplicationKernel::ApplyOverrides(const std::vector<std::string>& overrides) {
  for (const auto& item : overrides) {
    const auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw std::runtime_error("override must be key=value, got '" + item + "'");
    }
    config_.SetString(item.substr(0, eq), item.substr(eq + 1));
  }
}

int ApplicationKernel::Run(int argc, char** argv) {
  if (!Initialize(argc, argv)) {
    return 1;
  }

  event_thread_.Start();

  SPDLOG_INFO("ApplicationKernel: Starting application");
  running_ = true;
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Start failed: {}", e.what());
    Shutdown();
    return 1;
  }

  SPDLOG_INFO("Application {} started", app_name_);

  {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    // Signal handlers cannot notify safely; poll the flag as well
    while (running_.load()) {
      shutdown_cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
  }

  SPDLOG_INFO("Shutdown requested");
  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("OnStop hook failed: {}", e.what());
  }
  Shutdown();

  SPDLOG_INFO("Application {} stopped", app_name_);
  return 0;
}

void ApplicationKernel::RequestStop() {
  running_ = false;
  shutdown_cv_.notify_all();
}

//=== Task Posting ===
void ApplicationKernel::Post(std::function<void()> task) {
  event_thread_.Post(std::move(task));
}

int ApplicationKernel::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  return event_thread_.SchedulePeriodic(std::move(task), interval);
}

void ApplicationKernel::CancelPeriodic(int task_id) {
  event_thread_.CancelPeriodic(task_id);
}

//=== Private Methods ===
void ApplicationKernel::SetupSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
}

void ApplicationKernel::SignalHandler(int signal) {
  ApplicationKernel* instance = instance_.load();
  if (instance && (signal == SIGINT || signal == SIGTERM)) {
    instance->running_.store(false, std::memory_order_release);
  }
}

void ApplicationKernel::Shutdown() {
  if (shutdown_done_.exchange(true)) {
    return;
  }
  running_ = false;
  shutdown_cv_.notify_all();

  SPDLOG_INFO("Shutting down application: {}", app_name_);
  event_thread_.Stop();

  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Shutdown hook exception: {}", e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace pacer
