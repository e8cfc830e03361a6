#include "util/flags.hpp"

#include <stdint.h>

#include "absl/strings/str_cat.h"

DEFINE_int32(max_concurrent_jobs, 10,
             "Number of jobs that may execute at the same time");
DEFINE_int64(default_timeout_ms, 300000,
             "Wall time limit of jobs that do not specify one");
DEFINE_int32(default_cpu_percent, 50, "CPU share granted to each sandbox");
DEFINE_int64(default_memory_mb, 512, "Memory limit of each sandbox");
DEFINE_int64(default_disk_mb, 1024, "Disk quota of each sandbox");
DEFINE_int32(max_history, 1000, "Number of job results kept in the history");
DEFINE_string(script_interpreter, "/bin/sh",
              "Interpreter for script jobs that do not name one");

DEFINE_string(temp_directory, "/tmp/bruno",
              "Where the sandboxes should be created");
DEFINE_string(sandbox_backend, "auto",
              "Sandbox backend: auto, docker, process, vm or wasm");
DEFINE_string(docker_image, "alpine:latest",
              "Image used by the docker backend");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove sandbox directories after the jobs end");

DEFINE_string(policy_file, "",
              "Text-format PolicySet loaded on top of the default policies");
DEFINE_int32(max_security_events, 10000,
             "Number of security events kept in memory");

namespace util {

namespace {
bool CheckAtLeast(const char* name, int64_t value, int64_t min,
                  std::string* error_msg) {
  if (value >= min) return true;
  *error_msg = absl::StrCat("--", name, " must be at least ", min, ", got ",
                            value);
  return false;
}
}  // namespace

bool ValidateFlags(std::string* error_msg) {
  return CheckAtLeast("max_concurrent_jobs", FLAGS_max_concurrent_jobs, 1,
                      error_msg) &&
         CheckAtLeast("default_timeout_ms", FLAGS_default_timeout_ms, 1,
                      error_msg) &&
         CheckAtLeast("default_cpu_percent", FLAGS_default_cpu_percent, 1,
                      error_msg) &&
         CheckAtLeast("default_memory_mb", FLAGS_default_memory_mb, 1,
                      error_msg) &&
         CheckAtLeast("default_disk_mb", FLAGS_default_disk_mb, 1,
                      error_msg) &&
         CheckAtLeast("max_history", FLAGS_max_history, 0, error_msg) &&
         CheckAtLeast("max_security_events", FLAGS_max_security_events, 0,
                      error_msg);
}

}  // namespace util
