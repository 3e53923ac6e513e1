#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "event_channel.hpp"

struct ChangeEvent {
  std::filesystem::path path;
  std::filesystem::file_time_type modified;
  std::uint64_t sequence = 0;
};

struct WatchFailure {
  enum class Kind { StatFailure, ReadFailure, ParseFailure, WriteFailure };

  Kind kind = Kind::StatFailure;
  std::string message;
};

inline const char* to_string(WatchFailure::Kind kind) {
  switch(kind) {
    case WatchFailure::Kind::StatFailure: return "stat failure";
    case WatchFailure::Kind::ReadFailure: return "read failure";
    case WatchFailure::Kind::ParseFailure: return "parse failure";
    case WatchFailure::Kind::WriteFailure: return "write failure";
  }
  return "failure";
}

using ChangeChannel = EventChannel<ChangeEvent>;
using FailureChannel = EventChannel<WatchFailure>;
