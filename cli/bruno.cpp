#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "executor/executor.hpp"
#include "executor/shutdown_handler.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"
#include "policy/policy_engine.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(job_id, "", "id of the job, generated if empty");  // NOLINT
DEFINE_string(command, "", "command of a shell job");            // NOLINT
DEFINE_string(script_file, "",  // NOLINT
              "file with the content of a script job");
DEFINE_string(interpreter, "", "interpreter of a script job");  // NOLINT
DEFINE_string(file_op, "read",  // NOLINT
              "operation of a file job: read, write or exists");
DEFINE_string(path, "", "path of a file job, inside the workspace");  // NOLINT
DEFINE_string(content, "", "content written by a file job");  // NOLINT
DEFINE_string(url, "", "url of an api job");                  // NOLINT
DEFINE_string(method, "GET", "method of an api job");          // NOLINT
DEFINE_string(query, "", "query of a database job");           // NOLINT
DEFINE_bool(db_write, false, "the database job modifies data");  // NOLINT
DEFINE_string(permissions, "",  // NOLINT
              "comma separated capabilities of the job");
DEFINE_string(env, "",  // NOLINT
              "comma separated KEY=VALUE environment overrides");
DEFINE_int64(timeout_ms, 0, "timeout of the job, 0 for the default");  // NOLINT
DEFINE_string(working_directory, "",  // NOLINT
              "working directory inside the workspace");
DEFINE_bool(dry_run, false, "only validate the job");       // NOLINT
DEFINE_string(job_file, "", "text-format Job executed by run");  // NOLINT
DEFINE_int32(limit, 10, "number of security events shown");  // NOLINT

namespace {

const char* const kUsage =
    "Usage: bruno <command> [flags]\n"
    "Commands:\n"
    "  exec <shell|script|file|api|database>  execute a job built from flags\n"
    "  run --job_file=<file>                  execute a text-format Job\n"
    "  security [--limit=N]                   show security events\n"
    "  policies                               show the loaded policies\n"
    "  selftest                               run the self test";

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot convert to JSON: " + status.ToString());
  }
  return json;
}

// Builds a Job of the given type from the command-line flags. Throws
// std::invalid_argument on invalid flags.
proto::Job JobFromFlags(const std::string& type) {
  proto::Job job;
  job.set_id(FLAGS_job_id.empty()
                 ? absl::StrCat("cli-", absl::ToUnixMillis(absl::Now()))
                 : FLAGS_job_id);
  if (type == "shell") {
    if (FLAGS_command.empty()) {
      throw std::invalid_argument("--command is required");
    }
    job.mutable_shell()->set_command(FLAGS_command);
  } else if (type == "script") {
    if (FLAGS_script_file.empty()) {
      throw std::invalid_argument("--script_file is required");
    }
    job.mutable_script()->set_content(util::File::Read(FLAGS_script_file));
    job.mutable_script()->set_interpreter(FLAGS_interpreter);
  } else if (type == "file") {
    proto::FileOperation::Op op;
    if (!proto::FileOperation::Op_Parse(absl::AsciiStrToUpper(FLAGS_file_op),
                                        &op)) {
      throw std::invalid_argument("Unknown file operation " + FLAGS_file_op);
    }
    proto::FileOperation* operation = job.mutable_file()->add_operations();
    operation->set_op(op);
    operation->set_path(FLAGS_path);
    operation->set_content(FLAGS_content);
  } else if (type == "api") {
    job.mutable_api()->set_url(FLAGS_url);
    job.mutable_api()->set_method(FLAGS_method);
  } else if (type == "database") {
    job.mutable_database()->set_query(FLAGS_query);
    job.mutable_database()->set_write(FLAGS_db_write);
  } else {
    throw std::invalid_argument("Unknown job type " + type);
  }
  for (absl::string_view permission :
       absl::StrSplit(FLAGS_permissions, ',', absl::SkipWhitespace())) {
    job.add_permissions(std::string(permission));
  }
  for (absl::string_view var :
       absl::StrSplit(FLAGS_env, ',', absl::SkipWhitespace())) {
    std::pair<std::string, std::string> kv =
        absl::StrSplit(var, absl::MaxSplits('=', 1));
    if (kv.first.empty()) {
      throw std::invalid_argument("Invalid environment variable " +
                                  std::string(var));
    }
    (*job.mutable_environment())[kv.first] = kv.second;
  }
  job.set_timeout_millis(FLAGS_timeout_ms);
  job.set_working_directory(FLAGS_working_directory);
  return job;
}

proto::Job JobFromFile(const std::string& path) {
  proto::Job job;
  if (!google::protobuf::TextFormat::ParseFromString(util::File::Read(path),
                                                     &job)) {
    throw std::invalid_argument("Invalid job file " + path);
  }
  return job;
}

// The engine, configured from the flags.
class Engine {
 public:
  Engine() {
    policy::PolicyEngineOptions policy_options;
    policy_options.max_events = FLAGS_max_security_events;
    policy_ = absl::make_unique<policy::PolicyEngine>(policy_options);
    if (!FLAGS_policy_file.empty()) policy_->LoadPolicies(FLAGS_policy_file);

    sandbox::SandboxManagerOptions sandbox_options;
    sandbox_options.temp_directory = FLAGS_temp_directory;
    sandbox_options.backend = FLAGS_sandbox_backend;
    sandbox_options.docker_image = FLAGS_docker_image;
    sandbox_options.keep_sandboxes = FLAGS_keep_sandboxes;
    sandboxes_ = absl::make_unique<sandbox::SandboxManager>(sandbox_options);

    executor::ExecutorOptions options;
    options.max_concurrent_jobs = FLAGS_max_concurrent_jobs;
    options.default_timeout_millis = FLAGS_default_timeout_ms;
    options.default_cpu_percent = FLAGS_default_cpu_percent;
    options.default_memory_mb = FLAGS_default_memory_mb;
    options.default_disk_mb = FLAGS_default_disk_mb;
    options.max_history = FLAGS_max_history;
    options.script_interpreter = FLAGS_script_interpreter;
    executor_ = absl::make_unique<executor::Executor>(options, policy_.get(),
                                                      sandboxes_.get());
  }

  policy::PolicyEngine* GetPolicy() { return policy_.get(); }
  executor::Executor* GetExecutor() { return executor_.get(); }

 private:
  std::unique_ptr<policy::PolicyEngine> policy_;
  std::unique_ptr<sandbox::SandboxManager> sandboxes_;
  std::unique_ptr<executor::Executor> executor_;
};

int Execute(Engine* engine, const proto::Job& job) {
  if (FLAGS_dry_run) {
    policy::ValidationResult validation = engine->GetPolicy()->ValidateJob(job);
    proto::Result result;
    result.set_job_id(job.id());
    if (!validation.allowed) {
      result.set_status(proto::Result::FAILURE);
      result.set_error_kind(proto::Result::POLICY_VIOLATION);
      result.set_error("Security policy violation");
    }
    for (const proto::SecurityEvent& event : validation.violations) {
      *result.add_security_events() = event;
    }
    std::cout << ToJson(result) << std::endl;
    return validation.allowed ? 0 : 1;
  }
  proto::Result result = engine->GetExecutor()->Execute(job);
  std::cout << ToJson(result) << std::endl;
  return result.status() == proto::Result::SUCCESS ? 0 : 1;
}

int Security(Engine* engine) {
  if (FLAGS_limit < 0) {
    std::cerr << "--limit must not be negative" << std::endl;
    return 2;
  }
  std::vector<proto::SecurityEvent> events =
      engine->GetPolicy()->GetSecurityEvents(FLAGS_limit);
  if (events.empty()) std::cerr << "No security events recorded" << std::endl;
  for (const proto::SecurityEvent& event : events) {
    std::cout << ToJson(event) << std::endl;
  }
  return 0;
}

int Policies(Engine* engine) {
  proto::PolicySet policies;
  for (const proto::Policy& policy : engine->GetPolicy()->Policies()) {
    *policies.add_policies() = policy;
  }
  std::cout << ToJson(policies) << std::endl;
  std::cout << engine->GetPolicy()->Blocklist().Size()
            << " blocked command patterns" << std::endl;
  return 0;
}

int SelfTest(Engine* engine) {
  struct Case {
    const char* name;
    proto::Job job;
    bool should_fail = false;
  };
  std::vector<Case> cases(3);
  cases[0].name = "Basic echo command";
  cases[0].job.set_id("selftest-echo");
  cases[0].job.mutable_shell()->set_command("echo \"Bruno test\"");
  cases[0].job.add_permissions("process:execute");
  cases[1].name = "File write";
  cases[1].job.set_id("selftest-file");
  cases[1].job.add_permissions("file:write");
  proto::FileOperation* write = cases[1].job.mutable_file()->add_operations();
  write->set_op(proto::FileOperation::WRITE);
  write->set_path("test.txt");
  write->set_content("Bruno file test");
  cases[2].name = "Dangerous command";
  cases[2].job.set_id("selftest-security");
  cases[2].job.mutable_shell()->set_command("rm -rf /");
  cases[2].job.add_permissions("process:execute");
  cases[2].should_fail = true;

  int failures = 0;
  for (const Case& test : cases) {
    proto::Result result = engine->GetExecutor()->Execute(test.job);
    bool failed = result.status() != proto::Result::SUCCESS;
    if (failed == test.should_fail) {
      std::cout << "PASS " << test.name << std::endl;
    } else {
      std::cout << "FAIL " << test.name << ": "
                << (failed ? result.error() : "expected a failure")
                << std::endl;
      failures++;
    }
  }
  return failures == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (argc < 2) {
    std::cerr << kUsage << std::endl;
    return 2;
  }
  std::string error_msg;
  if (!util::ValidateFlags(&error_msg)) {
    std::cerr << error_msg << std::endl;
    return 2;
  }
  std::string command = argv[1];

  std::unique_ptr<Engine> engine;
  try {
    engine = absl::make_unique<Engine>();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
  // Must exist before any thread is started.
  executor::ShutdownHandler shutdown(
      [&engine](int) { engine->GetExecutor()->Shutdown(); });

  try {
    if (command == "exec") {
      if (argc < 3) {
        std::cerr << "exec needs a job type" << std::endl;
        return 2;
      }
      return Execute(engine.get(), JobFromFlags(argv[2]));
    }
    if (command == "run") {
      if (FLAGS_job_file.empty()) {
        std::cerr << "run needs --job_file" << std::endl;
        return 2;
      }
      return Execute(engine.get(), JobFromFile(FLAGS_job_file));
    }
    if (command == "security") return Security(engine.get());
    if (command == "policies") return Policies(engine.get());
    if (command == "selftest") return SelfTest(engine.get());
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::runtime_error& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
  std::cerr << "Unknown command " << command << "\n" << kUsage << std::endl;
  return 2;
}
