#include "sandbox/sandbox.hpp"

#include <algorithm>

#include "absl/time/clock.h"
#include "glog/logging.h"

namespace sandbox {

const char* BackendName(BackendType type) {
  switch (type) {
    case BackendType::DOCKER:
      return "docker";
    case BackendType::VM:
      return "vm";
    case BackendType::PROCESS:
      return "process";
    case BackendType::WASM:
      return "wasm";
  }
  return "unknown";
}

bool ParseBackendType(const std::string& name, BackendType* type) {
  for (BackendType candidate : {BackendType::DOCKER, BackendType::VM,
                                BackendType::PROCESS, BackendType::WASM}) {
    if (name == BackendName(candidate)) {
      *type = candidate;
      return true;
    }
  }
  return false;
}

Backend::store_t* Backend::Backends_() {
  static store_t* backends = new store_t;
  return backends;
}

void Backend::Register_(BackendType type, Backend::create_t create,
                        Backend::score_t score) {
  Backends_()->push_back(Entry{type, std::move(create), std::move(score)});
}

std::unique_ptr<Backend> Backend::Create(BackendType type) {
  for (const Entry& entry : *Backends_()) {
    if (entry.type != type) continue;
    if (entry.score() <= 0) return nullptr;
    return std::unique_ptr<Backend>(entry.create());
  }
  return nullptr;
}

std::vector<BackendType> Backend::Ranked() {
  std::vector<std::pair<int, BackendType>> scored;
  for (const Entry& entry : *Backends_()) {
    int score = entry.score();
    if (score > 0) scored.emplace_back(score, entry.type);
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const std::pair<int, BackendType>& a,
                      const std::pair<int, BackendType>& b) {
                     return a.first > b.first;
                   });
  std::vector<BackendType> ranked;
  for (const auto& entry : scored) ranked.push_back(entry.second);
  return ranked;
}

Sandbox::Sandbox(SandboxConfig config, std::unique_ptr<util::TempDir> root,
                 std::unique_ptr<Backend> backend)
    : config_(std::move(config)),
      root_(std::move(root)),
      backend_(std::move(backend)),
      created_at_(absl::Now()) {}

bool Sandbox::Execute(ExecutionOptions options, ExecutionInfo* info,
                      std::string* error_msg) {
  absl::MutexLock lck(&execute_mutex_);
  if (destroyed_) {
    *error_msg = "sandbox " + Id() + " was destroyed";
    return false;
  }
  if (cancelled_) {
    *error_msg = "sandbox " + Id() + " was cancelled";
    return false;
  }
  *info = ExecutionInfo();
  backend_->PrepareEnvironment(WorkDir(), &options.environment);
  return backend_->Execute(options, info, error_msg);
}

void Sandbox::Cancel() {
  if (cancelled_.exchange(true)) return;
  LOG(INFO) << "Cancelling sandbox " << Id();
  backend_->Kill();
}

}  // namespace sandbox
