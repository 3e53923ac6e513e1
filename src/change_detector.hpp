#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>

#include "watch_events.hpp"

class Logger;

// Polls one file's modification time and publishes a ChangeEvent whenever
// it differs from the last observed value. Stat failures are published on
// the failure channel and polling continues on the next tick.
class ChangeDetector {
public:
  struct Options {
    std::filesystem::path path;
    std::chrono::milliseconds interval{1000};
  };

  ChangeDetector(Options options,
                 std::shared_ptr<ChangeChannel> changes,
                 std::shared_ptr<FailureChannel> failures,
                 std::shared_ptr<Logger> logger);
  ~ChangeDetector();

  ChangeDetector(const ChangeDetector&) = delete;
  ChangeDetector& operator=(const ChangeDetector&) = delete;

  void start();
  // Closes both channels so that a blocked publish returns, then joins.
  void stop();

  std::uint64_t checks() const { return checks_.load(); }
  const std::filesystem::path& path() const { return options_.path; }

private:
  void check();
  void schedule_tick();

  Options options_;
  std::shared_ptr<ChangeChannel> changes_;
  std::shared_ptr<FailureChannel> failures_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> checks_{0};
  std::filesystem::file_time_type last_modified_{};
  std::uint64_t sequence_ = 0;
};
