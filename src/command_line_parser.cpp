#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    out.required = entry.value("required", false);
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::string error;
  if(try_parse(argc, argv, settings, error)) return;
  print_err(nullptr, "{}", error);
  usage();
  std::exit(1);
}

bool CommandLineParser::try_parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // 1 = consumed, 0 = not an option, -1 = error
    auto handle_option = [&](const std::string& key_token, bool long_form) -> int {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          error = "Unknown option --" + key_token;
          return -1;
        }
        return 0; // treat as positional for short tokens
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option '" + key_token + "'";
          return -1;
        }
        value = args[++i];
      }
      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "Invalid value for option '" + key_token + "': " + set_error;
        return -1;
      }
      return 1;
    };

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      if(handle_option(token.substr(2), true) < 0) return false;
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      const int handled = handle_option(token.substr(1), false);
      if(handled < 0) return false;
      if(handled > 0) continue;
      // fall through to positional if alias unrecognised
    }

    if(positional_index >= positional_specs_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "Invalid value for " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }

  if(settings.help_requested()) return true;
  for(std::size_t idx = positional_index; idx < positional_specs_.size(); ++idx) {
    const auto& spec = positional_specs_[idx];
    if(spec.required && settings.get<std::string>(spec.key).empty()) {
      error = "Missing required argument <" + spec.key + ">";
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - prints checklist completion and keeps the file canonical", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += pos.required ? " <" + pos.key + ">" : " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{:<18} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
