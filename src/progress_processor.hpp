#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "checklist.hpp"
#include "progress.hpp"
#include "watch_events.hpp"

class Logger;

// Thrown by ProgressProcessor::process() for I/O problems; parse problems
// surface as ChecklistError.
class ProcessingError : public std::runtime_error {
public:
  ProcessingError(WatchFailure::Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  WatchFailure::Kind kind() const { return kind_; }

private:
  WatchFailure::Kind kind_;
};

// One processing cycle per change: parse, count, display, and rewrite the
// file in canonical form when the percentage moved. A file whose content
// already hashes to its canonical form is left alone.
class ProgressProcessor {
public:
  using Display = std::function<void(double percentage)>;

  struct Options {
    std::filesystem::path path;
    SubEntryPolicy sub_entry_policy = SubEntryPolicy::Replace;
  };

  struct Outcome {
    ProgressCount count;
    double percentage = 0.0;
    bool rewritten = false;
    std::string digest; // sha256 of the content that was read
  };

  ProgressProcessor(Options options, Display display, std::shared_ptr<Logger> logger);
  ~ProgressProcessor();

  ProgressProcessor(const ProgressProcessor&) = delete;
  ProgressProcessor& operator=(const ProgressProcessor&) = delete;

  Outcome process();

  // Consumes change events until the channel closes or a cycle fails; the
  // failure is published on `failures`.
  void start(std::shared_ptr<ChangeChannel> changes, std::shared_ptr<FailureChannel> failures);
  void stop();

  std::optional<double> last_percentage() const;
  std::uint64_t cycles() const;

private:
  struct State {
    std::optional<double> last_percentage;
    std::uint64_t cycles = 0;
  };

  void consume_loop();
  WatchFailure to_failure(const std::exception& e) const;

  Options options_;
  Display display_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex state_mutex_;
  State state_;

  std::shared_ptr<ChangeChannel> changes_;
  std::shared_ptr<FailureChannel> failures_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};
