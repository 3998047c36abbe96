#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "event_thread.hpp"

namespace pacer {
namespace engine {
namespace common {

/**
 * @brief Base application framework providing common infrastructure.
 *
 * ApplicationKernel provides a standardized lifecycle for applications:
 * 1. Initialize: Parse args, load config, setup logging
 * 2. Start: Begin processing (derived class logic)
 * 3. Run: Wait for a signal or RequestStop
 * 4. Stop: Graceful shutdown
 *
 * Command line: --config_file <path> (required) and any number of
 * --set key=value overrides applied on top of the loaded document.
 *
 * Usage:
 * ```cpp
 * class MyApp : public ApplicationKernel {
 *  protected:
 *   void OnStart() override { // Start your services }
 *   void OnStop() override { // Stop your services }
 * };
 * ```
 */
class ApplicationKernel {
 public:
  //=== Constructors & Destructor ===
  ApplicationKernel();
  virtual ~ApplicationKernel();

  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  //=== Main Lifecycle ===
  /**
   * @brief Main entry point for the application.
   * @return Exit code (0 for success, non-zero for error).
   */
  int Run(int argc, char** argv);

  /** @brief Ask Run to leave its wait loop (thread-safe). */
  void RequestStop();

  bool IsRunning() const { return running_.load(); }

  //=== Task Posting ===
  void Post(std::function<void()> task);
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval);
  void CancelPeriodic(int task_id);

  //=== Accessors ===
  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  const std::string& GetAppName() const { return app_name_; }
  void SetAppName(const std::string& name) { app_name_ = name; }

  EventThread& GetEventThread() { return event_thread_; }

 protected:
  //=== Lifecycle Hooks (Override in Derived Classes) ===
  /** @brief Called after config and logging are ready, before threads start. */
  virtual void OnInitialize() {}

  /** @brief Called when application starts (begin processing). */
  virtual void OnStart() {}

  /** @brief Called when application stops (end processing). */
  virtual void OnStop() {}

  /** @brief Called during final cleanup. */
  virtual void OnShutdown() {}

 private:
  std::string app_name_;
  ConfigManager config_;
  EventThread event_thread_{"app_worker"};

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_done_{false};
  std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  std::string loaded_config_file_;
  static std::atomic<ApplicationKernel*> instance_;  ///< for the signal handler

  bool Initialize(int argc, char** argv);
  void ParseCommandLineArguments(int argc, char** argv, std::string* config_file,
                                 std::vector<std::string>* overrides);
  void ApplyOverrides(const std::vector<std::string>& overrides);
  void SetupSignalHandlers();
  static void SignalHandler(int signal);
  void Shutdown();
};

}  // namespace common
}  // namespace engine
}  // namespace pacer
