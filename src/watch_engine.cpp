#include "watch_engine.hpp"

#include <stdexcept>
#include <utility>

#include "change_detector.hpp"
#include "progress_display.hpp"
#include "settings_manager.hpp"

WatchEngine::WatchEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("tickwatch")),
    display_logger_(std::make_shared<Logger>()) {}

WatchEngine::~WatchEngine() {
  stop();
}

void WatchEngine::start() {
  if(started_) return;

  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));

  checklist_ = options_.checklist.empty()
    ? std::filesystem::path(settings_->get<std::string>("checklist"))
    : options_.checklist;
  if(checklist_.empty()) {
    throw std::runtime_error("No checklist file configured");
  }

  const auto policy_name = settings_->get<std::string>("sub_entry_policy");
  auto policy = sub_entry_policy_from_string(policy_name);
  if(!policy) {
    logger_->error("Invalid sub_entry_policy '{}'", policy_name);
    throw std::runtime_error("Invalid sub_entry_policy");
  }

  int interval_ms = settings_->get<int>("poll_interval_ms");
  if(interval_ms <= 0) {
    logger_->error("Invalid poll_interval_ms '{}'", interval_ms);
    throw std::runtime_error("Invalid poll_interval_ms");
  }

  ProgressProcessor::Display display = options_.display;
  if(!display) {
    ProgressDisplay::Options display_options;
    display_options.clear_screen = settings_->get<bool>("clear_screen");
    display_options.precision = settings_->get<int>("precision");
    display_ = std::make_unique<ProgressDisplay>(display_logger_, display_options);
    display = [this](double percentage){ display_->show(percentage); };
  }

  changes_ = std::make_shared<ChangeChannel>();
  failures_ = std::make_shared<FailureChannel>();

  ProgressProcessor::Options processor_options;
  processor_options.path = checklist_;
  processor_options.sub_entry_policy = *policy;
  processor_ = std::make_unique<ProgressProcessor>(processor_options, std::move(display), logger_);

  ChangeDetector::Options detector_options;
  detector_options.path = checklist_;
  detector_options.interval = std::chrono::milliseconds(interval_ms);
  detector_ = std::make_unique<ChangeDetector>(detector_options, changes_, failures_, logger_);

  started_ = true;
  logger_->debug("Watching {} (sub_entry_policy={})", checklist_.string(), to_string(*policy));
  processor_->start(changes_, failures_);
  detector_->start();
}

std::optional<WatchFailure> WatchEngine::run() {
  if(!started_) start();
  auto failure = failures_->receive();
  if(failure) {
    logger_->debug("Stopping after {}", to_string(failure->kind));
  }
  return failure;
}

void WatchEngine::stop() {
  if(!started_.exchange(false)) return;

  if(changes_) changes_->close();
  if(failures_) failures_->close();
  if(detector_) detector_->stop();
  if(processor_) processor_->stop();
}

std::optional<double> WatchEngine::last_percentage() const {
  if(!processor_) return std::nullopt;
  return processor_->last_percentage();
}
