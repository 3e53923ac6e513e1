#include "change_detector.hpp"

#include <system_error>
#include <utility>

#include "log.hpp"

ChangeDetector::ChangeDetector(Options options,
                               std::shared_ptr<ChangeChannel> changes,
                               std::shared_ptr<FailureChannel> failures,
                               std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    changes_(std::move(changes)),
    failures_(std::move(failures)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("detector")) {
  if(options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(1000);
  }
}

ChangeDetector::~ChangeDetector() {
  stop();
}

void ChangeDetector::start() {
  if(running_.exchange(true)) return;
  timer_ = std::make_unique<asio::steady_timer>(io_);
  asio::post(io_, [this](){ check(); });
  thread_ = std::thread([this](){
    io_.run();
  });
  logger_->debug("Polling {} every {} ms", options_.path.string(), options_.interval.count());
}

void ChangeDetector::stop() {
  const bool was_running = running_.exchange(false);
  if(changes_) changes_->close();
  if(failures_) failures_->close();
  if(!was_running) return;

  io_.stop();
  if(thread_.joinable()) {
    thread_.join();
  }
  timer_.reset();
  io_.restart();
}

void ChangeDetector::check() {
  if(!running_) return;
  ++checks_;

  std::error_code ec;
  auto modified = std::filesystem::last_write_time(options_.path, ec);
  if(ec) {
    logger_->debug("stat {} failed: {}", options_.path.string(), ec.message());
    WatchFailure failure;
    failure.kind = WatchFailure::Kind::StatFailure;
    failure.message = "stat " + options_.path.string() + ": " + ec.message();
    if(!failures_->send(std::move(failure))) return;
  } else if(modified != last_modified_) {
    // Remember the value from this stat, not a later one, so our own
    // rewrite is observed as exactly one further change.
    last_modified_ = modified;
    ChangeEvent event{options_.path, modified, ++sequence_};
    logger_->debug("{} changed (event {})", options_.path.string(), event.sequence);
    if(!changes_->send(std::move(event))) return;
  }

  schedule_tick();
}

void ChangeDetector::schedule_tick() {
  if(!running_ || !timer_) return;
  timer_->expires_after(options_.interval);
  timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    check();
  });
}
