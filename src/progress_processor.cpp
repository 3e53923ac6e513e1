#include "progress_processor.hpp"

#include <utility>

#include "log.hpp"
#include "utils.hpp"

ProgressProcessor::ProgressProcessor(Options options, Display display, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    display_(std::move(display)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("processor")) {}

ProgressProcessor::~ProgressProcessor() {
  stop();
}

ProgressProcessor::Outcome ProgressProcessor::process() {
  std::string text;
  std::string error;
  if(!read_text_file(options_.path, text, error)) {
    throw ProcessingError(WatchFailure::Kind::ReadFailure, error);
  }

  Outcome outcome;
  outcome.digest = sha256_hex(text);

  ParseOptions parse_options;
  parse_options.sub_entry_policy = options_.sub_entry_policy;
  parse_options.logger = logger_.get();
  ChecklistTree tree = parse_checklist(text, parse_options);

  outcome.count = calculate_progress(tree);
  outcome.percentage = completion_percentage(outcome.count);
  if(outcome.count.total == 0) {
    logger_->debug("{} has no entries, reporting 0", options_.path.string());
  }

  if(display_) display_(outcome.percentage);

  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.cycles;
    logger_->debug("cycle {}: content {} ({} of {} done)",
                   state_.cycles, outcome.digest.substr(0, 12),
                   outcome.count.done, outcome.count.total);
    changed = !state_.last_percentage || *state_.last_percentage != outcome.percentage;
    if(changed) {
      state_.last_percentage = outcome.percentage;
    }
  }
  if(!changed) return outcome;

  const std::string canonical = serialize_checklist(tree);
  if(sha256_hex(canonical) == outcome.digest) {
    logger_->debug("{} is already canonical", options_.path.string());
    return outcome;
  }
  if(!write_text_file(options_.path, canonical, error)) {
    throw ProcessingError(WatchFailure::Kind::WriteFailure, error);
  }
  outcome.rewritten = true;
  logger_->debug("Rewrote {} in canonical form", options_.path.string());
  return outcome;
}

void ProgressProcessor::start(std::shared_ptr<ChangeChannel> changes,
                              std::shared_ptr<FailureChannel> failures) {
  if(running_.exchange(true)) return;
  changes_ = std::move(changes);
  failures_ = std::move(failures);
  thread_ = std::thread([this](){ consume_loop(); });
}

void ProgressProcessor::stop() {
  running_ = false;
  if(changes_) changes_->close();
  if(failures_) failures_->close();
  if(thread_.joinable()) {
    thread_.join();
  }
}

void ProgressProcessor::consume_loop() {
  while(running_) {
    auto event = changes_->receive();
    if(!event) break;
    try {
      process();
    } catch(const std::exception& e) {
      logger_->debug("cycle for event {} failed: {}", event->sequence, e.what());
      if(!failures_->send(to_failure(e))) {
        logger_->debug("failure channel closed, dropping: {}", e.what());
      }
      break;
    }
  }
}

WatchFailure ProgressProcessor::to_failure(const std::exception& e) const {
  WatchFailure failure;
  failure.message = e.what();
  if(auto* processing = dynamic_cast<const ProcessingError*>(&e)) {
    failure.kind = processing->kind();
  } else if(dynamic_cast<const ChecklistError*>(&e)) {
    failure.kind = WatchFailure::Kind::ParseFailure;
  } else {
    failure.kind = WatchFailure::Kind::ReadFailure;
  }
  return failure;
}

std::optional<double> ProgressProcessor::last_percentage() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.last_percentage;
}

std::uint64_t ProgressProcessor::cycles() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.cycles;
}
