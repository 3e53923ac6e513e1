#pragma once

#include <memory>
#include <string>

class Logger;

class ProgressDisplay {
public:
  struct Options {
    bool clear_screen = true;
    int precision = 2;
  };

  ProgressDisplay(std::shared_ptr<Logger> logger, Options options);

  void show(double percentage);
  std::string format(double percentage) const;

private:
  std::shared_ptr<Logger> logger_;
  Options options_;
};
