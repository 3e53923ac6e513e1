#include "progress_display.hpp"

#include <algorithm>
#include <utility>

#include "log.hpp"

namespace {
constexpr const char* kClearScreen = "\033[H\033[J";
}

ProgressDisplay::ProgressDisplay(std::shared_ptr<Logger> logger, Options options)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>()),
    options_(options) {
  options_.precision = std::clamp(options_.precision, 0, 10);
}

std::string ProgressDisplay::format(double percentage) const {
  return fmt::format("progress: {:.{}f}", percentage, options_.precision);
}

void ProgressDisplay::show(double percentage) {
  logger_->print("{}{}", options_.clear_screen ? kClearScreen : "", format(percentage));
}
