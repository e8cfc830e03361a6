#ifndef POLICY_COMMAND_BLOCKLIST_HPP
#define POLICY_COMMAND_BLOCKLIST_HPP

#include <regex>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "proto/security_event.pb.h"

namespace policy {

// Patterns of shell commands that are never executed, regardless of policies
// and permissions.
class CommandBlocklist {
 public:
  struct Violation {
    std::string rule_id;
    proto::Severity severity;
  };

  // Creates a blocklist with the built-in patterns.
  CommandBlocklist();

  // Adds a pattern (ECMAScript syntax). Returns false and sets error_msg if
  // the pattern does not compile.
  bool Add(const std::string& rule_id, const std::string& pattern,
           proto::Severity severity, std::string* error_msg);

  // Returns the first pattern matching anywhere in command.
  absl::optional<Violation> Check(const std::string& command) const;

  size_t Size() const { return entries_.size(); }

 private:
  struct Entry {
    std::string rule_id;
    proto::Severity severity;
    std::regex regex;
  };
  std::vector<Entry> entries_;
};

}  // namespace policy

#endif
