#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <string>

#include "gflags/gflags.h"

// Engine
DECLARE_int32(max_concurrent_jobs);
DECLARE_int64(default_timeout_ms);
DECLARE_int32(default_cpu_percent);
DECLARE_int64(default_memory_mb);
DECLARE_int64(default_disk_mb);
DECLARE_int32(max_history);
DECLARE_string(script_interpreter);

// Sandboxes
DECLARE_string(temp_directory);
DECLARE_string(sandbox_backend);
DECLARE_string(docker_image);
DECLARE_bool(keep_sandboxes);

// Policies
DECLARE_string(policy_file);
DECLARE_int32(max_security_events);

namespace util {

// Checks the ranges of the numeric flags. Returns false and sets error_msg on
// the first flag out of range.
bool ValidateFlags(std::string* error_msg);

}  // namespace util

#endif
