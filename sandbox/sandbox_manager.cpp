#include "sandbox/sandbox_manager.hpp"

#include <stdexcept>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "sandbox/docker.hpp"
#include "sandbox/unix.hpp"

namespace sandbox {

namespace {
Backend::Register<Unix> unix_backend;
Backend::Register<Docker> docker_backend;
}  // namespace

SandboxManager::SandboxManager(SandboxManagerOptions options)
    : options_(std::move(options)) {
  util::File::MakeDirs(options_.temp_directory);
}

SandboxManager::~SandboxManager() { DestroyAllSandboxes(); }

std::vector<BackendType> SandboxManager::Candidates() const {
  if (options_.backend == "auto") return Backend::Ranked();
  BackendType type;
  if (!ParseBackendType(options_.backend, &type)) {
    throw std::invalid_argument("Unknown sandbox backend " + options_.backend);
  }
  if (type == BackendType::DOCKER) {
    return {BackendType::DOCKER, BackendType::PROCESS};
  }
  return {type};
}

std::shared_ptr<Sandbox> SandboxManager::CreateSandbox(
    const ExecutionContext& context) {
  const std::string& id = context.sandbox_id;
  if (id.empty()) throw std::invalid_argument("Empty sandbox id");
  {
    absl::MutexLock lck(&mutex_);
    if (sandboxes_.count(id)) {
      throw std::invalid_argument("Sandbox " + id + " already exists");
    }
  }

  SandboxConfig config;
  config.id = id;
  config.resources.cpu_percent = context.limits.cpu_percent;
  config.resources.memory_mb = context.limits.memory_mb;
  config.resources.disk_mb = context.limits.disk_mb;
  config.resources.network_enabled = context.limits.network_enabled;
  config.environment = context.environment;
  config.image = options_.docker_image;

  auto root = absl::make_unique<util::TempDir>(options_.temp_directory,
                                               "bruno-sandbox-");
  std::string work_dir = util::File::JoinPath(root->Path(), Sandbox::kBoxDir);
  util::File::MakeDirs(work_dir);

  std::unique_ptr<Backend> backend;
  std::string last_error = "no sandbox backend available";
  for (BackendType type : Candidates()) {
    std::unique_ptr<Backend> candidate = Backend::Create(type);
    if (!candidate) {
      last_error = std::string("backend ") + BackendName(type) +
                   " is not available";
      LOG(WARNING) << "Sandbox " << id << ": " << last_error;
      continue;
    }
    std::string error_msg;
    config.type = type;
    if (!candidate->Setup(config, work_dir, &error_msg)) {
      last_error = std::string(BackendName(type)) + ": " + error_msg;
      LOG(WARNING) << "Sandbox " << id << ": " << last_error;
      continue;
    }
    backend = std::move(candidate);
    break;
  }
  if (!backend) {
    throw std::runtime_error("Cannot create sandbox " + id + ": " +
                             last_error);
  }

  std::shared_ptr<Sandbox> sandbox(
      new Sandbox(config, std::move(root), std::move(backend)));
  {
    absl::MutexLock lck(&mutex_);
    if (sandboxes_.emplace(id, sandbox).second) {
      num_created_++;
      LOG(INFO) << "Created " << BackendName(config.type) << " sandbox " << id
                << " in " << sandbox->Root();
      return sandbox;
    }
  }
  std::string error_msg;
  if (!sandbox->backend_->Teardown(&error_msg)) {
    LOG(WARNING) << "Sandbox " << id << " teardown: " << error_msg;
  }
  throw std::invalid_argument("Sandbox " + id + " already exists");
}

void SandboxManager::Destroy(const std::shared_ptr<Sandbox>& sandbox) {
  sandbox->destroyed_ = true;
  sandbox->backend_->Kill();
  // Waits for a running execution to notice the kill.
  { absl::MutexLock lck(&sandbox->execute_mutex_); }

  std::string error_msg;
  if (!sandbox->backend_->Teardown(&error_msg)) {
    LOG(WARNING) << "Sandbox " << sandbox->Id() << " teardown: " << error_msg;
  }
  if (options_.keep_sandboxes) {
    LOG(INFO) << "Keeping sandbox directory " << sandbox->Root();
    sandbox->root_->Keep();
  } else {
    try {
      util::File::RemoveTree(sandbox->Root());
    } catch (const std::system_error& e) {
      LOG(WARNING) << "Sandbox " << sandbox->Id() << ": " << e.what();
    }
    sandbox->root_->Keep();
  }
  absl::MutexLock lck(&mutex_);
  num_destroyed_++;
}

void SandboxManager::DestroySandbox(const std::string& id) {
  std::shared_ptr<Sandbox> sandbox;
  {
    absl::MutexLock lck(&mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) return;
    sandbox = std::move(it->second);
    sandboxes_.erase(it);
  }
  Destroy(sandbox);
  VLOG(1) << "Destroyed sandbox " << id;
}

void SandboxManager::DestroyAllSandboxes() {
  std::map<std::string, std::shared_ptr<Sandbox>> sandboxes;
  {
    absl::MutexLock lck(&mutex_);
    sandboxes.swap(sandboxes_);
  }
  for (const auto& entry : sandboxes) Destroy(entry.second);
  if (!sandboxes.empty()) {
    LOG(INFO) << "Destroyed " << sandboxes.size() << " sandboxes";
  }
}

bool SandboxManager::CancelSandbox(const std::string& id) {
  std::shared_ptr<Sandbox> sandbox = GetSandbox(id);
  if (!sandbox) return false;
  sandbox->Cancel();
  return true;
}

std::shared_ptr<Sandbox> SandboxManager::GetSandbox(
    const std::string& id) const {
  absl::MutexLock lck(&mutex_);
  auto it = sandboxes_.find(id);
  if (it == sandboxes_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> SandboxManager::ActiveSandboxes() const {
  absl::MutexLock lck(&mutex_);
  std::vector<std::string> ids;
  for (const auto& entry : sandboxes_) ids.push_back(entry.first);
  return ids;
}

int64_t SandboxManager::NumCreated() const {
  absl::MutexLock lck(&mutex_);
  return num_created_;
}

int64_t SandboxManager::NumDestroyed() const {
  absl::MutexLock lck(&mutex_);
  return num_destroyed_;
}

}  // namespace sandbox
