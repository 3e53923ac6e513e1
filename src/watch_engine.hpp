#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "progress_processor.hpp"
#include "watch_events.hpp"

class ChangeDetector;
class ProgressDisplay;
class SettingsManager;

// Top-level coordinator: wires the detector to the processor and waits for
// the first fatal failure from either of them.
class WatchEngine {
public:
  struct Options {
    // Overrides the "checklist" setting when set.
    std::filesystem::path checklist;
    // Replaces the terminal display, mainly for tests.
    ProgressProcessor::Display display;
  };

  WatchEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~WatchEngine();

  WatchEngine(const WatchEngine&) = delete;
  WatchEngine& operator=(const WatchEngine&) = delete;

  void start();
  // Blocks until a failure arrives; returns nullopt if stopped first.
  std::optional<WatchFailure> run();
  void stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const std::filesystem::path& checklist() const { return checklist_; }
  std::optional<double> last_percentage() const;

private:
  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Logger> display_logger_;
  std::filesystem::path checklist_;
  std::shared_ptr<ChangeChannel> changes_;
  std::shared_ptr<FailureChannel> failures_;
  std::unique_ptr<ProgressDisplay> display_;
  std::unique_ptr<ChangeDetector> detector_;
  std::unique_ptr<ProgressProcessor> processor_;
  std::atomic<bool> started_{false};
};
