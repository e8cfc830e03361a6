#ifndef SANDBOX_SANDBOX_MANAGER_HPP
#define SANDBOX_SANDBOX_MANAGER_HPP

#include <stdint.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "sandbox/execution_context.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

struct SandboxManagerOptions {
  // Where the sandbox directories are created.
  std::string temp_directory = "/tmp/bruno";
  // "auto" picks the best usable backend; otherwise a backend name.
  std::string backend = "auto";
  std::string docker_image = "alpine:latest";
  // Leave the directories of destroyed sandboxes on disk.
  bool keep_sandboxes = false;
};

// Creates, tracks and destroys the sandboxes of running jobs. Thread-safe.
class SandboxManager {
 public:
  explicit SandboxManager(SandboxManagerOptions options = {});
  ~SandboxManager();

  // Creates the sandbox context.sandbox_id. The container backend is
  // preferred; if it is unavailable or fails to start, the process backend is
  // used instead. Throws if no backend can be set up or if the id is in use.
  std::shared_ptr<Sandbox> CreateSandbox(const ExecutionContext& context);

  // Kills anything running in the sandbox, tears the backend down and removes
  // its directory. Unknown ids are ignored, so destroying twice is harmless.
  // Teardown failures are logged.
  void DestroySandbox(const std::string& id);
  void DestroyAllSandboxes();

  // Returns false if the sandbox does not exist.
  bool CancelSandbox(const std::string& id);

  // Returns nullptr if the sandbox does not exist.
  std::shared_ptr<Sandbox> GetSandbox(const std::string& id) const;
  std::vector<std::string> ActiveSandboxes() const;

  int64_t NumCreated() const;
  int64_t NumDestroyed() const;

  const SandboxManagerOptions& Options() const { return options_; }

  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;
  SandboxManager(SandboxManager&&) = delete;
  SandboxManager& operator=(SandboxManager&&) = delete;

 private:
  std::vector<BackendType> Candidates() const;
  void Destroy(const std::shared_ptr<Sandbox>& sandbox);

  SandboxManagerOptions options_;
  mutable absl::Mutex mutex_;
  std::map<std::string, std::shared_ptr<Sandbox>> sandboxes_
      ABSL_GUARDED_BY(mutex_);
  int64_t num_created_ ABSL_GUARDED_BY(mutex_) = 0;
  int64_t num_destroyed_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace sandbox

#endif
