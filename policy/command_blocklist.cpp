#include "policy/command_blocklist.hpp"

#include <algorithm>

#include "glog/logging.h"

namespace {

struct BuiltinPattern {
  const char* rule_id;
  const char* pattern;
  proto::Severity severity;
};

// Separators after which a new simple command starts.
#define CMD_START "(^|[;&|(`]|\\$\\(|\\s)"

const BuiltinPattern kBuiltinPatterns[] = {
    // rm with a recursive flag targeting the filesystem root.
    {"rm-rf-root",
     CMD_START "rm\\s+(-[^\\s]*\\s+)*-(-recursive|[a-zA-Z]*[rR][a-zA-Z]*)"
               "\\s+(-[^\\s]*\\s+)*/\\*?(\\s|;|&|\\||$)",
     proto::CRITICAL},
    {"fork-bomb",
     "([A-Za-z_]\\w*|:)\\s*\\(\\)\\s*\\{[^}]*\\|[^}]*&\\s*\\}\\s*;\\s*\\1",
     proto::CRITICAL},
    {"dd-zero-device", CMD_START "dd\\s[^;|&]*\\bif=/dev/zero",
     proto::HIGH},
    {"chmod-777-root",
     CMD_START "chmod\\s+(-[^\\s]*\\s+)*(0?777|a\\+rwx|o\\+w)\\s+/"
               "(\\s|;|&|\\||$)",
     proto::HIGH},
    {"sudo", CMD_START "sudo(\\s|$)", proto::HIGH},
    {"su", CMD_START "su(\\s+-|\\s*$|\\s+root\\b|\\s*[;&|])", proto::HIGH},
};

#undef CMD_START

// std::regex recurses once per character it consumes, so long commands are
// searched in overlapping windows. A match longer than kWindowOverlap may be
// missed when it crosses a window boundary.
const constexpr size_t kWindowSize = 4096;
const constexpr size_t kWindowOverlap = 512;

bool Search(const std::string& text, const std::regex& regex) {
  size_t begin = 0;
  while (true) {
    size_t end = std::min(text.size(), begin + kWindowSize);
    auto flags = std::regex_constants::match_default;
    // ^ and \b look at the characters around the window, not at its edges.
    if (begin > 0) flags |= std::regex_constants::match_prev_avail;
    if (end < text.size()) {
      flags |= std::regex_constants::match_not_eol |
               std::regex_constants::match_not_eow;
    }
    if (std::regex_search(text.begin() + begin, text.begin() + end, regex,
                          flags)) {
      return true;
    }
    if (end == text.size()) return false;
    begin = end - kWindowOverlap;
  }
}

}  // namespace

namespace policy {

CommandBlocklist::CommandBlocklist() {
  for (const BuiltinPattern& builtin : kBuiltinPatterns) {
    std::string error_msg;
    // Built-in patterns are known to compile.
    CHECK(Add(builtin.rule_id, builtin.pattern, builtin.severity, &error_msg))
        << error_msg;
  }
}

bool CommandBlocklist::Add(const std::string& rule_id,
                           const std::string& pattern,
                           proto::Severity severity, std::string* error_msg) {
  try {
    entries_.push_back(
        Entry{rule_id, severity,
              std::regex(pattern, std::regex::ECMAScript |
                                      std::regex::optimize)});
  } catch (const std::regex_error& e) {
    *error_msg = "invalid pattern " + rule_id + ": " + e.what();
    return false;
  }
  return true;
}

absl::optional<CommandBlocklist::Violation> CommandBlocklist::Check(
    const std::string& command) const {
  for (const Entry& entry : entries_) {
    if (Search(command, entry.regex)) {
      return Violation{entry.rule_id, entry.severity};
    }
  }
  return {};
}

}  // namespace policy
