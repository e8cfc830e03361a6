#ifndef POLICY_POLICY_ENGINE_HPP
#define POLICY_POLICY_ENGINE_HPP

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "policy/command_blocklist.hpp"
#include "proto/job.pb.h"
#include "proto/policy.pb.h"
#include "proto/security_event.pb.h"

namespace policy {

struct PolicyEngineOptions {
  // Maximum number of events kept in the audit trail; older events are
  // dropped first. 0 means unbounded.
  size_t max_events = 10000;
  bool load_default_policies = true;
};

struct ValidationResult {
  // False if at least one event has action BLOCKED.
  bool allowed = true;
  // Every event produced while validating, including the ones that were only
  // logged.
  std::vector<proto::SecurityEvent> violations;
};

// Decides whether a job may run. A job is checked, in order, against the
// capabilities it needs, every registered policy and the command blocklist.
// All the events produced are appended to the audit trail. Thread-safe.
class PolicyEngine {
 public:
  explicit PolicyEngine(PolicyEngineOptions options = PolicyEngineOptions());

  ValidationResult ValidateJob(const proto::Job& job);

  // Runs command through the blocklist alone. A match is recorded and
  // returned.
  absl::optional<proto::SecurityEvent> CheckCommand(const std::string& job_id,
                                                    const std::string& command);

  // Appends event to the audit trail, setting its timestamp if missing.
  void RecordEvent(proto::SecurityEvent event);

  // Returns the most recent limit events, newest first. 0 returns all of them.
  std::vector<proto::SecurityEvent> GetSecurityEvents(size_t limit = 0) const;
  void ClearSecurityEvents();

  // Registers policy, replacing any policy with the same name.
  void AddPolicy(const proto::Policy& policy);
  // Returns false if no policy has that name.
  bool RemovePolicy(const std::string& name);
  // Adds every policy of a text-format PolicySet file. Throws on errors.
  void LoadPolicies(const std::string& path);
  std::vector<proto::Policy> Policies() const;

  const CommandBlocklist& Blocklist() const { return blocklist_; }

  // filesystem-access, network-access and resource-limits.
  static proto::PolicySet DefaultPolicies();

  PolicyEngine(const PolicyEngine&) = delete;
  PolicyEngine& operator=(const PolicyEngine&) = delete;
  PolicyEngine(PolicyEngine&&) = delete;
  PolicyEngine& operator=(PolicyEngine&&) = delete;

 private:
  void CheckPermissions(const proto::Job& job, ValidationResult* result) const;
  void EvaluatePolicies(const proto::Job& job, ValidationResult* result) const;
  void CheckBlocklist(const proto::Job& job, ValidationResult* result) const;

  PolicyEngineOptions options_;
  CommandBlocklist blocklist_;

  mutable absl::Mutex policies_mutex_;
  std::map<std::string, proto::Policy> policies_
      ABSL_GUARDED_BY(policies_mutex_);

  mutable absl::Mutex events_mutex_;
  std::deque<proto::SecurityEvent> events_ ABSL_GUARDED_BY(events_mutex_);
};

}  // namespace policy

#endif
