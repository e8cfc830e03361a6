#include "policy/policy_engine.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <set>
#include <stdexcept>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"

namespace {

const char* const kDefaultPolicies = R"(
policies {
  name: "filesystem-access"
  description: "Controls file system access"
  enforcement: STRICT
  rules {
    id: "deny-system-dirs"
    type: DENY
    resource: "file:*"
    actions: "write"
    actions: "delete"
    conditions {
      key: "path"
      matches: "/etc/*"
      matches: "/usr/*"
      matches: "/bin/*"
      matches: "/sbin/*"
      matches: "/var/*"
    }
    severity: HIGH
  }
  rules {
    id: "allow-workspace"
    type: ALLOW
    resource: "file:workspace"
    actions: "read"
    actions: "write"
    actions: "create"
  }
}
policies {
  name: "network-access"
  description: "Controls network access for jobs"
  enforcement: STRICT
  rules {
    id: "deny-external-network"
    type: DENY
    resource: "network:*"
    actions: "connect"
    actions: "bind"
    conditions {
      key: "destination"
      not_in: "localhost"
      not_in: "127.0.0.1"
      not_in: "::1"
    }
    severity: HIGH
  }
  rules {
    id: "allow-localhost"
    type: ALLOW
    resource: "network:localhost"
    actions: "connect"
  }
}
policies {
  name: "resource-limits"
  description: "Enforces resource consumption limits"
  enforcement: STRICT
  rules {
    id: "max-timeout"
    type: DENY
    resource: "*"
    actions: "*"
    conditions {
      key: "timeout_millis"
      greater_than: 3600000
    }
    severity: MEDIUM
  }
}
)";

// Name under which blocklist matches are reported.
const char* const kProcessPolicy = "process-execution";

const std::set<std::string>& KnownCapabilities() {
  static const std::set<std::string>* capabilities = new std::set<std::string>{
      "process:execute", "file:read",     "file:write",
      "network",         "database:read", "database:write"};
  return *capabilities;
}

int64_t NowMillis() { return absl::ToUnixMillis(absl::Now()); }

proto::SecurityEvent MakeEvent(const std::string& job_id,
                               proto::SecurityEvent::Type type,
                               proto::Severity severity,
                               proto::SecurityEvent::Action action,
                               const std::string& rule_id,
                               const std::string& details) {
  proto::SecurityEvent event;
  event.set_timestamp_millis(NowMillis());
  event.set_job_id(job_id);
  event.set_type(type);
  event.set_severity(severity);
  event.set_action(action);
  event.set_rule_id(rule_id);
  event.set_details(details);
  return event;
}

// What a job does, as seen by the rules: a resource kind, the actions it
// performs on it and the values conditions are evaluated on. A job has one
// facet, except file jobs which have one per operation.
struct Facet {
  std::string kind;
  std::set<std::string> actions;
  std::map<std::string, std::string> values;
};

// Host part of a URL, without user info and port.
std::string DestinationHost(const std::string& url) {
  std::string rest = url;
  size_t scheme = rest.find("://");
  if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
  rest = rest.substr(0, rest.find_first_of("/?#"));
  size_t at = rest.rfind('@');
  if (at != std::string::npos) rest = rest.substr(at + 1);
  if (!rest.empty() && rest[0] == '[') {
    size_t end = rest.find(']');
    return end == std::string::npos ? rest.substr(1) : rest.substr(1, end - 1);
  }
  return rest.substr(0, rest.find(':'));
}

std::vector<Facet> FacetsOf(const proto::Job& job) {
  std::vector<Facet> facets;
  auto add = [&facets, &job](std::string kind, std::set<std::string> actions) {
    Facet facet;
    facet.kind = std::move(kind);
    facet.actions = std::move(actions);
    for (const auto& entry : job.metadata()) {
      facet.values[entry.first] = entry.second;
    }
    facet.values["timeout_millis"] = std::to_string(job.timeout_millis());
    if (!job.working_directory().empty()) {
      facet.values["path"] = util::File::Normalize(job.working_directory());
    }
    facets.push_back(std::move(facet));
    return &facets.back();
  };

  switch (job.body_case()) {
    case proto::Job::kShell: {
      Facet* facet = add("process", {"execute"});
      facet->values["command"] = job.shell().command();
      break;
    }
    case proto::Job::kScript: {
      Facet* facet = add("process", {"execute"});
      facet->values["command"] = job.script().content();
      facet->values["interpreter"] = job.script().interpreter();
      break;
    }
    case proto::Job::kFile:
      for (const proto::FileOperation& op : job.file().operations()) {
        std::set<std::string> actions = {"read"};
        if (op.op() == proto::FileOperation::WRITE) {
          actions = {"write", "create"};
        }
        Facet* facet = add("file", std::move(actions));
        facet->values["path"] = util::File::Normalize(op.path());
      }
      break;
    case proto::Job::kApi: {
      Facet* facet = add("network", {"connect", "request"});
      facet->values["url"] = job.api().url();
      facet->values["method"] = job.api().method();
      facet->values["destination"] = DestinationHost(job.api().url());
      break;
    }
    case proto::Job::kDatabase: {
      Facet* facet =
          add("database", {"query", job.database().write() ? "write" : "read"});
      facet->values["query"] = job.database().query();
      break;
    }
    case proto::Job::BODY_NOT_SET:
      break;
  }
  return facets;
}

bool ResourceMatches(const std::string& resource, const Facet& facet) {
  if (resource == "*") return true;
  std::string kind = resource.substr(0, resource.find(':'));
  return kind == "*" || kind == facet.kind;
}

bool ActionMatches(const proto::Rule& rule, const Facet& facet) {
  for (const std::string& action : rule.actions()) {
    if (action == "*" || facet.actions.count(action)) return true;
  }
  return false;
}

bool ConditionHolds(const proto::Condition& condition, const Facet& facet) {
  auto it = facet.values.find(condition.key());
  if (it == facet.values.end()) return false;
  const std::string& value = it->second;
  if (condition.matches_size() > 0) {
    bool matched = false;
    for (const std::string& pattern : condition.matches()) {
      if (fnmatch(pattern.c_str(), value.c_str(), 0) == 0) {
        matched = true;
        break;
      }
    }
    if (!matched) return false;
  }
  for (const std::string& excluded : condition.not_in()) {
    if (value == excluded) return false;
  }
  if (condition.has_greater_than()) {
    double number = 0;
    if (!absl::SimpleAtod(value, &number)) return false;
    if (!(number > condition.greater_than())) return false;
  }
  return true;
}

bool RuleMatches(const proto::Rule& rule, const Facet& facet) {
  for (const proto::Condition& condition : rule.conditions()) {
    if (!ConditionHolds(condition, facet)) return false;
  }
  return true;
}

proto::SecurityEvent::Action ActionFor(const proto::Policy& policy,
                                       proto::Severity severity) {
  if (policy.enforcement() == proto::Policy::AUDIT) {
    return proto::SecurityEvent::LOGGED;
  }
  if (policy.enforcement() == proto::Policy::PERMISSIVE &&
      severity < proto::HIGH) {
    return proto::SecurityEvent::LOGGED;
  }
  return proto::SecurityEvent::BLOCKED;
}

std::string Subject(const Facet& facet) {
  for (const char* key : {"command", "path", "url", "query"}) {
    auto it = facet.values.find(key);
    if (it != facet.values.end()) return it->second;
  }
  return "";
}

}  // namespace

namespace policy {

PolicyEngine::PolicyEngine(PolicyEngineOptions options)
    : options_(std::move(options)) {
  if (options_.load_default_policies) {
    proto::PolicySet defaults = DefaultPolicies();
    for (const proto::Policy& policy : defaults.policies()) {
      AddPolicy(policy);
    }
  }
}

proto::PolicySet PolicyEngine::DefaultPolicies() {
  proto::PolicySet policies;
  CHECK(google::protobuf::TextFormat::ParseFromString(kDefaultPolicies,
                                                      &policies));
  return policies;
}

ValidationResult PolicyEngine::ValidateJob(const proto::Job& job) {
  ValidationResult result;
  CheckPermissions(job, &result);
  EvaluatePolicies(job, &result);
  CheckBlocklist(job, &result);
  for (const proto::SecurityEvent& event : result.violations) {
    if (event.action() == proto::SecurityEvent::BLOCKED) result.allowed = false;
    RecordEvent(event);
  }
  if (!result.allowed) {
    LOG(WARNING) << "Job " << job.id() << " rejected with "
                 << result.violations.size() << " security events";
  }
  return result;
}

void PolicyEngine::CheckPermissions(const proto::Job& job,
                                    ValidationResult* result) const {
  std::set<std::string> granted(job.permissions().begin(),
                                job.permissions().end());
  for (const std::string& permission : granted) {
    if (KnownCapabilities().count(permission)) continue;
    result->violations.push_back(MakeEvent(
        job.id(), proto::SecurityEvent::SUSPICIOUS_ACTIVITY, proto::LOW,
        proto::SecurityEvent::LOGGED, "unknown-permission",
        "Unknown permission requested: " + permission));
  }

  std::set<std::string> required;
  switch (job.body_case()) {
    case proto::Job::kShell:
    case proto::Job::kScript:
      required.insert("process:execute");
      break;
    case proto::Job::kFile:
      for (const proto::FileOperation& op : job.file().operations()) {
        required.insert(op.op() == proto::FileOperation::WRITE ? "file:write"
                                                               : "file:read");
      }
      break;
    case proto::Job::kApi:
      required.insert("network");
      break;
    case proto::Job::kDatabase:
      required.insert(job.database().write() ? "database:write"
                                             : "database:read");
      break;
    case proto::Job::BODY_NOT_SET:
      break;
  }
  for (const std::string& permission : required) {
    if (granted.count(permission)) continue;
    result->violations.push_back(MakeEvent(
        job.id(), proto::SecurityEvent::PERMISSION_DENIED, proto::MEDIUM,
        proto::SecurityEvent::BLOCKED, "permission:" + permission,
        "Missing permission " + permission));
  }
}

void PolicyEngine::EvaluatePolicies(const proto::Job& job,
                                    ValidationResult* result) const {
  std::vector<Facet> facets = FacetsOf(job);
  absl::MutexLock lck(&policies_mutex_);
  for (const auto& entry : policies_) {
    const proto::Policy& policy = entry.second;
    for (const Facet& facet : facets) {
      bool applies = false;
      bool allowed = false;
      bool denied = false;
      for (const proto::Rule& rule : policy.rules()) {
        if (!ResourceMatches(rule.resource(), facet)) continue;
        if (!ActionMatches(rule, facet)) continue;
        applies = true;
        if (!RuleMatches(rule, facet)) continue;
        if (rule.type() == proto::Rule::ALLOW) {
          allowed = true;
          continue;
        }
        denied = true;
        result->violations.push_back(MakeEvent(
            job.id(), proto::SecurityEvent::POLICY_VIOLATION, rule.severity(),
            ActionFor(policy, rule.severity()), rule.id(),
            absl::StrCat("Policy ", policy.name(), " rule ", rule.id(),
                         " denied: ", rule.resource(), " ", Subject(facet))));
      }
      if (policy.default_action() == proto::Policy::DEFAULT_DENY && applies &&
          !allowed && !denied) {
        result->violations.push_back(MakeEvent(
            job.id(), proto::SecurityEvent::POLICY_VIOLATION, proto::MEDIUM,
            ActionFor(policy, proto::MEDIUM), "default-deny",
            absl::StrCat("Policy ", policy.name(), " has no rule allowing ",
                         facet.kind, " ", Subject(facet))));
      }
    }
  }
}

void PolicyEngine::CheckBlocklist(const proto::Job& job,
                                  ValidationResult* result) const {
  std::string command;
  absl::optional<CommandBlocklist::Violation> violation;
  if (job.has_shell()) {
    command = job.shell().command();
    violation = blocklist_.Check(command);
  } else if (job.has_script()) {
    command = job.script().content();
    violation = blocklist_.Check(command);
    if (!violation) {
      command = job.script().interpreter();
      violation = blocklist_.Check(command);
    }
  }
  if (!violation) return;
  result->violations.push_back(MakeEvent(
      job.id(), proto::SecurityEvent::POLICY_VIOLATION, violation->severity,
      proto::SecurityEvent::BLOCKED, violation->rule_id,
      absl::StrCat("Policy ", kProcessPolicy, " rule ", violation->rule_id,
                   " denied: ", command)));
}

absl::optional<proto::SecurityEvent> PolicyEngine::CheckCommand(
    const std::string& job_id, const std::string& command) {
  absl::optional<CommandBlocklist::Violation> violation =
      blocklist_.Check(command);
  if (!violation) return {};
  proto::SecurityEvent event = MakeEvent(
      job_id, proto::SecurityEvent::POLICY_VIOLATION, violation->severity,
      proto::SecurityEvent::BLOCKED, violation->rule_id,
      absl::StrCat("Command not allowed by rule ", violation->rule_id, ": ",
                   command));
  RecordEvent(event);
  return event;
}

void PolicyEngine::RecordEvent(proto::SecurityEvent event) {
  if (event.timestamp_millis() == 0) event.set_timestamp_millis(NowMillis());
  if (event.action() == proto::SecurityEvent::BLOCKED) {
    LOG(WARNING) << "Security event [" << proto::Severity_Name(event.severity())
                 << "] job " << event.job_id() << ": " << event.details();
  } else {
    VLOG(1) << "Security event [" << proto::Severity_Name(event.severity())
            << "] job " << event.job_id() << ": " << event.details();
  }
  absl::MutexLock lck(&events_mutex_);
  events_.push_back(std::move(event));
  if (options_.max_events != 0) {
    while (events_.size() > options_.max_events) events_.pop_front();
  }
}

std::vector<proto::SecurityEvent> PolicyEngine::GetSecurityEvents(
    size_t limit) const {
  absl::MutexLock lck(&events_mutex_);
  size_t count = limit == 0 ? events_.size() : std::min(limit, events_.size());
  return std::vector<proto::SecurityEvent>(events_.rbegin(),
                                           events_.rbegin() + count);
}

void PolicyEngine::ClearSecurityEvents() {
  absl::MutexLock lck(&events_mutex_);
  events_.clear();
}

void PolicyEngine::AddPolicy(const proto::Policy& policy) {
  if (policy.name().empty()) {
    throw std::invalid_argument("Policies need a name");
  }
  absl::MutexLock lck(&policies_mutex_);
  policies_[policy.name()] = policy;
}

bool PolicyEngine::RemovePolicy(const std::string& name) {
  absl::MutexLock lck(&policies_mutex_);
  return policies_.erase(name) > 0;
}

void PolicyEngine::LoadPolicies(const std::string& path) {
  std::string text = util::File::Read(path);
  proto::PolicySet policies;
  if (!google::protobuf::TextFormat::ParseFromString(text, &policies)) {
    throw std::runtime_error("Invalid policy file " + path);
  }
  for (const proto::Policy& policy : policies.policies()) {
    AddPolicy(policy);
    LOG(INFO) << "Loaded policy " << policy.name() << " from " << path;
  }
}

std::vector<proto::Policy> PolicyEngine::Policies() const {
  absl::MutexLock lck(&policies_mutex_);
  std::vector<proto::Policy> policies;
  for (const auto& entry : policies_) policies.push_back(entry.second);
  return policies;
}

}  // namespace policy
