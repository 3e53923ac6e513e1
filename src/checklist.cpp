#include "checklist.hpp"

#include <sstream>

#include "log.hpp"

namespace {

struct ParsedLine {
  std::size_t indent = 0;
  bool done = false;
  std::string content;
};

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<ParsedLine> parse_line(const std::string& line) {
  ParsedLine parsed;
  while(parsed.indent < line.size() && line[parsed.indent] == ' ') {
    ++parsed.indent;
  }
  std::string_view rest(line);
  rest.remove_prefix(parsed.indent);
  if(starts_with(rest, kDoneMarker)) {
    parsed.done = true;
  } else if(starts_with(rest, kUndoneMarker)) {
    parsed.done = false;
  } else {
    return std::nullopt;
  }
  rest.remove_prefix(kDoneMarker.size());
  // A marker must be followed by at least one character.
  if(rest.empty()) return std::nullopt;
  parsed.content = std::string(rest);
  return parsed;
}

} // namespace

ChecklistEntry::ChecklistEntry(const ChecklistEntry& other)
  : done(other.done),
    content(other.content),
    sub(other.sub ? std::make_unique<ChecklistEntry>(*other.sub) : nullptr) {}

ChecklistEntry& ChecklistEntry::operator=(const ChecklistEntry& other) {
  if(this == &other) return *this;
  done = other.done;
  content = other.content;
  sub = other.sub ? std::make_unique<ChecklistEntry>(*other.sub) : nullptr;
  return *this;
}

std::optional<SubEntryPolicy> sub_entry_policy_from_string(const std::string& value) {
  if(value == "replace") return SubEntryPolicy::Replace;
  if(value == "reject") return SubEntryPolicy::Reject;
  return std::nullopt;
}

const char* to_string(SubEntryPolicy policy) {
  switch(policy) {
    case SubEntryPolicy::Replace: return "replace";
    case SubEntryPolicy::Reject: return "reject";
  }
  return "unknown";
}

const char* to_string(ChecklistErrorKind kind) {
  switch(kind) {
    case ChecklistErrorKind::MalformedLine: return "malformed line";
    case ChecklistErrorKind::OrphanSubEntry: return "sub entry without a parent";
    case ChecklistErrorKind::DuplicateSubEntry: return "second sub entry for one parent";
  }
  return "unknown checklist error";
}

ChecklistError::ChecklistError(ChecklistErrorKind kind, std::size_t line, const std::string& detail)
  : std::runtime_error(fmt::format("Failed to parse checklist: {} [LINE {}]{}",
                                   to_string(kind), line,
                                   detail.empty() ? std::string() : ": " + detail)),
    kind_(kind),
    line_(line) {}

std::string_view marker_for(bool done) {
  return done ? kDoneMarker : kUndoneMarker;
}

ChecklistTree parse_checklist(const std::string& text, const ParseOptions& options) {
  ChecklistTree tree;
  std::size_t sub_line_of_last_parent = 0;

  std::istringstream in(text);
  std::string line;
  std::size_t line_number = 0;
  while(std::getline(in, line)) {
    ++line_number;
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;

    auto parsed = parse_line(line);
    if(!parsed) {
      throw ChecklistError(ChecklistErrorKind::MalformedLine, line_number, line);
    }

    if(parsed->indent == 0) {
      tree.emplace_back(parsed->done, std::move(parsed->content));
      sub_line_of_last_parent = 0;
      continue;
    }

    if(tree.empty()) {
      throw ChecklistError(ChecklistErrorKind::OrphanSubEntry, line_number, line);
    }
    auto& parent = tree.back();
    if(parent.has_sub()) {
      if(options.sub_entry_policy == SubEntryPolicy::Reject) {
        throw ChecklistError(ChecklistErrorKind::DuplicateSubEntry, line_number,
                             fmt::format("parent already has a sub entry on line {}",
                                         sub_line_of_last_parent));
      }
      log_warn(options.logger, "Line {} replaces the sub entry from line {}",
               line_number, sub_line_of_last_parent);
    }
    parent.sub = std::make_unique<ChecklistEntry>(parsed->done, std::move(parsed->content));
    sub_line_of_last_parent = line_number;
  }
  log_debug(options.logger, "Parsed {} top level entries from {} lines", tree.size(), line_number);
  return tree;
}

std::string serialize_checklist(const ChecklistTree& tree) {
  std::string out;
  for(const auto& entry : tree) {
    std::size_t level = 0;
    for(const ChecklistEntry* node = &entry; node; node = node->sub.get()) {
      out.append(level, ' ');
      out += marker_for(node->done);
      out += node->content;
      out += '\n';
      level += 2;
    }
    out += '\n';
  }
  return out;
}
