#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class Logger;

inline constexpr std::string_view kDoneMarker = "- [X]";
inline constexpr std::string_view kUndoneMarker = "- [ ]";

struct ChecklistEntry {
  bool done = false;
  std::string content;      // verbatim text after the marker
  std::unique_ptr<ChecklistEntry> sub; // at most one level deep

  ChecklistEntry() = default;
  ChecklistEntry(bool is_done, std::string text)
    : done(is_done), content(std::move(text)) {}
  ChecklistEntry(const ChecklistEntry& other);
  ChecklistEntry& operator=(const ChecklistEntry& other);
  ChecklistEntry(ChecklistEntry&&) = default;
  ChecklistEntry& operator=(ChecklistEntry&&) = default;

  bool has_sub() const { return sub != nullptr; }
};

using ChecklistTree = std::vector<ChecklistEntry>;

// What to do when a top-level entry receives a second indented line.
enum class SubEntryPolicy {
  Replace, // keep the last one
  Reject   // fail with DuplicateSubEntry
};

std::optional<SubEntryPolicy> sub_entry_policy_from_string(const std::string& value);
const char* to_string(SubEntryPolicy policy);

enum class ChecklistErrorKind {
  MalformedLine,
  OrphanSubEntry,
  DuplicateSubEntry
};

const char* to_string(ChecklistErrorKind kind);

class ChecklistError : public std::runtime_error {
public:
  ChecklistError(ChecklistErrorKind kind, std::size_t line, const std::string& detail);

  ChecklistErrorKind kind() const { return kind_; }
  std::size_t line() const { return line_; }

private:
  ChecklistErrorKind kind_;
  std::size_t line_;
};

struct ParseOptions {
  SubEntryPolicy sub_entry_policy = SubEntryPolicy::Replace;
  Logger* logger = nullptr;
};

// Throws ChecklistError with a 1-based line number.
ChecklistTree parse_checklist(const std::string& text, const ParseOptions& options = {});

// Canonical form: two spaces per nesting level, a blank line after each top-level block.
std::string serialize_checklist(const ChecklistTree& tree);

std::string_view marker_for(bool done);
