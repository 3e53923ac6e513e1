#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "tickwatch",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","checklist"},{"required",true}}
                    }));

  // Prints the problem and usage, then exits with status 1 on invalid input.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  // Same as parse() but reports the problem instead of exiting.
  bool try_parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
    bool required = false;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
