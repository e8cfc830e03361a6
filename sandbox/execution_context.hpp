#ifndef SANDBOX_EXECUTION_CONTEXT_HPP
#define SANDBOX_EXECUTION_CONTEXT_HPP

#include <stdint.h>

#include <map>
#include <set>
#include <string>

#include "absl/time/time.h"

namespace sandbox {

struct ResourceLimits {
  // Share of one CPU.
  int32_t cpu_percent = 50;
  int64_t memory_mb = 512;
  int64_t disk_mb = 1024;
  bool network_enabled = false;
  int64_t timeout_millis = 300000;
};

// Per-execution state of a job. Built once by the executor before the sandbox
// is acquired and never modified afterwards.
struct ExecutionContext {
  std::string job_id;
  std::string sandbox_id;
  absl::Time start_time;
  std::map<std::string, std::string> environment;
  std::set<std::string> permissions;
  // Relative to the sandbox workspace.
  std::string working_directory;
  ResourceLimits limits;

  bool HasPermission(const std::string& permission) const {
    return permissions.count(permission) > 0;
  }
};

}  // namespace sandbox

#endif
