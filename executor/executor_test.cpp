#include "executor/executor.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using executor::Executor;
using executor::ExecutorOptions;

const std::string test_tmpdir = "/tmp/bruno_testdir";

class MockApiTransport : public executor::ApiTransport {
 public:
  MOCK_METHOD(bool, Call,
              (const proto::ApiJob& request, std::string* response,
               std::string* error_msg),
              (override));
};

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_ = absl::make_unique<util::TempDir>(test_tmpdir);
    sandbox::SandboxManagerOptions sandbox_options;
    sandbox_options.temp_directory = tmp_->Path();
    sandbox_options.backend = "process";
    sandboxes_ = absl::make_unique<sandbox::SandboxManager>(sandbox_options);
    policy_ = absl::make_unique<policy::PolicyEngine>();
    Reset(ExecutorOptions());
  }

  void Reset(ExecutorOptions options) {
    executor_.reset();
    executor_ = absl::make_unique<Executor>(options, policy_.get(),
                                            sandboxes_.get());
  }

  static proto::Job Shell(const std::string& id, const std::string& command,
                          int64_t timeout_millis = 0) {
    proto::Job job;
    job.set_id(id);
    job.mutable_shell()->set_command(command);
    job.add_permissions("process:execute");
    job.set_timeout_millis(timeout_millis);
    return job;
  }

  std::unique_ptr<util::TempDir> tmp_;
  std::unique_ptr<sandbox::SandboxManager> sandboxes_;
  std::unique_ptr<policy::PolicyEngine> policy_;
  std::unique_ptr<Executor> executor_;
};

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestShell) {
  proto::Result result = executor_->Execute(
      Shell("hello", "echo \"$BRUNO_JOB_ID $USER $BRUNO_SECURITY\""));
  EXPECT_EQ(result.status(), proto::Result::SUCCESS) << result.error();
  EXPECT_EQ(result.job_id(), "hello");
  EXPECT_EQ(result.stdout(), "hello bruno enforced\n");
  EXPECT_THAT(result.sandbox_id(), ::testing::StartsWith("hello-"));
  EXPECT_GT(result.finished_at_millis(), 0);
  // The sandbox is gone once the job is done.
  EXPECT_THAT(sandboxes_->ActiveSandboxes(), IsEmpty());
  EXPECT_EQ(sandboxes_->NumCreated(), 1);
  EXPECT_EQ(sandboxes_->NumDestroyed(), 1);
  EXPECT_THAT(executor_->GetActiveJobs(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestJobEnvironmentOverrides) {
  proto::Job job = Shell("env", "echo \"$USER $BRUNO_JOB_ID\"");
  (*job.mutable_environment())["USER"] = "someone";
  (*job.mutable_environment())["BRUNO_JOB_ID"] = "spoofed";
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.stdout(), "someone env\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestPolicyViolationCreatesNoSandbox) {
  proto::Result result = executor_->Execute(Shell("evil", "rm -rf /"));
  EXPECT_EQ(result.status(), proto::Result::FAILURE);
  EXPECT_EQ(result.error_kind(), proto::Result::POLICY_VIOLATION);
  EXPECT_THAT(result.error(), HasSubstr("Security policy violation"));
  EXPECT_EQ(sandboxes_->NumCreated(), 0);
  ASSERT_GE(result.security_events_size(), 1);
  bool high = false;
  for (const proto::SecurityEvent& event : executor_->GetSecurityEvents()) {
    if (event.job_id() == "evil" && event.severity() >= proto::HIGH) {
      high = true;
    }
  }
  EXPECT_TRUE(high);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestMissingPermission) {
  proto::Job job = Shell("noperm", "true");
  job.clear_permissions();
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.error_kind(), proto::Result::POLICY_VIOLATION);
  EXPECT_EQ(sandboxes_->NumCreated(), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestInvalidJobs) {
  EXPECT_EQ(executor_->Execute(Shell("", "true")).error_kind(),
            proto::Result::INVALID_JOB);
  proto::Job empty;
  empty.set_id("empty");
  EXPECT_EQ(executor_->Execute(empty).error_kind(),
            proto::Result::UNSUPPORTED_JOB_TYPE);
  EXPECT_EQ(sandboxes_->NumCreated(), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestFileWriteThenRead) {
  proto::Job job;
  job.set_id("files");
  job.add_permissions("file:read");
  job.add_permissions("file:write");
  proto::FileOperation* write = job.mutable_file()->add_operations();
  write->set_op(proto::FileOperation::WRITE);
  write->set_path("notes/a.txt");
  write->set_content(std::string("line\n\0binary", 12));
  proto::FileOperation* read = job.mutable_file()->add_operations();
  read->set_op(proto::FileOperation::READ);
  read->set_path("notes/a.txt");
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.status(), proto::Result::SUCCESS) << result.error();
  EXPECT_EQ(result.output(), std::string("line\n\0binary", 12));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestPathTraversal) {
  proto::Job job;
  job.set_id("traversal");
  job.add_permissions("file:read");
  proto::FileOperation* read = job.mutable_file()->add_operations();
  read->set_op(proto::FileOperation::READ);
  read->set_path("../../../etc/passwd");
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.status(), proto::Result::FAILURE);
  EXPECT_EQ(result.error_kind(), proto::Result::PATH_TRAVERSAL);
  EXPECT_THAT(result.error(), HasSubstr("Path traversal"));
  EXPECT_EQ(result.output(), "");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestTimeout) {
  auto start = std::chrono::steady_clock::now();
  proto::Result result = executor_->Execute(Shell("slow", "sleep 10", 100));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(result.status(), proto::Result::TIMEOUT);
  EXPECT_THAT(result.error(), HasSubstr("timeout"));
  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  EXPECT_LE(elapsed, std::chrono::milliseconds(300));
  EXPECT_EQ(sandboxes_->NumDestroyed(), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestDangerousInterpreter) {
  proto::Job job;
  job.set_id("interp");
  job.add_permissions("process:execute");
  job.mutable_script()->set_content("true");
  job.mutable_script()->set_interpreter(
      "echo BLOCKLIST; sudo echo pwned; true");
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.status(), proto::Result::FAILURE);
  EXPECT_EQ(result.error_kind(), proto::Result::POLICY_VIOLATION);
  EXPECT_EQ(result.stdout(), "");
  EXPECT_EQ(sandboxes_->NumCreated(), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestLongCommand) {
  std::string payload;
  while (payload.size() < 100000) payload += "word ";
  proto::Result result =
      executor_->Execute(Shell("long", "wc -c <<EOF\n" + payload + "\nEOF"));
  EXPECT_EQ(result.status(), proto::Result::SUCCESS) << result.error();
  EXPECT_THAT(result.stdout(), HasSubstr("100001"));

  while (payload.size() < (1 << 20)) payload += "word ";
  proto::Job job;
  job.set_id("long-script");
  job.add_permissions("process:execute");
  job.mutable_script()->set_content("# " + payload + "\necho done\n");
  result = executor_->Execute(job);
  EXPECT_EQ(result.status(), proto::Result::SUCCESS) << result.error();
  EXPECT_EQ(result.stdout(), "done\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestUnexpectedException) {
  MockApiTransport api;
  executor_.reset();
  executor_ = absl::make_unique<Executor>(ExecutorOptions(), policy_.get(),
                                          sandboxes_.get(), &api);
  EXPECT_CALL(api, Call(_, _, _))
      .WillOnce(::testing::Throw(std::logic_error("transport broke")));
  proto::Job job;
  job.set_id("api");
  job.add_permissions("network");
  job.mutable_api()->set_url("http://localhost:8080/health");
  proto::Result result = executor_->Execute(job);
  EXPECT_EQ(result.status(), proto::Result::FAILURE);
  EXPECT_EQ(result.error_kind(), proto::Result::RUNTIME_FAILURE);
  EXPECT_THAT(result.error(), HasSubstr("transport broke"));
  EXPECT_EQ(sandboxes_->NumDestroyed(), 1);
  EXPECT_THAT(executor_->GetActiveJobs(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestConcurrencyLimit) {
  ExecutorOptions options;
  options.max_concurrent_jobs = 2;
  Reset(options);
  std::vector<proto::Result> results(3);
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; i++) {
    threads.emplace_back([this, i, &results]() {
      results[i] =
          executor_->Execute(Shell("job" + std::to_string(i), "sleep 1"));
    });
  }
  for (std::thread& thread : threads) thread.join();
  int rejected = 0;
  for (const proto::Result& result : results) {
    if (result.error_kind() == proto::Result::CONCURRENCY_LIMIT) {
      EXPECT_THAT(result.error(), HasSubstr("too many concurrent jobs"));
      rejected++;
    } else {
      EXPECT_EQ(result.status(), proto::Result::SUCCESS) << result.error();
    }
  }
  EXPECT_EQ(rejected, 1);
  EXPECT_EQ(sandboxes_->NumCreated(), 2);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestSetMaxConcurrentJobs) {
  executor_->SetMaxConcurrentJobs(0);
  EXPECT_EQ(executor_->MaxConcurrentJobs(), 0);
  EXPECT_EQ(executor_->Execute(Shell("a", "true")).error_kind(),
            proto::Result::CONCURRENCY_LIMIT);
  executor_->SetMaxConcurrentJobs(1);
  EXPECT_EQ(executor_->Execute(Shell("a", "true")).status(),
            proto::Result::SUCCESS);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestCancel) {
  EXPECT_FALSE(executor_->Cancel("sleeper"));
  proto::Result result;
  std::thread runner([this, &result]() {
    result = executor_->Execute(Shell("sleeper", "sleep 10"));
  });
  while (executor_->GetActiveJobs().empty()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_THAT(executor_->GetActiveJobs(), ElementsAre("sleeper"));
  EXPECT_TRUE(executor_->Cancel("sleeper"));
  runner.join();
  EXPECT_EQ(result.status(), proto::Result::CANCELLED);
  EXPECT_THAT(sandboxes_->ActiveSandboxes(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestHistory) {
  executor_->Execute(Shell("first", "true"));
  executor_->Execute(Shell("second", "exit 1"));
  absl::optional<proto::Result> first = executor_->GetJobHistory("first");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->status(), proto::Result::SUCCESS);
  EXPECT_FALSE(executor_->GetJobHistory("third").has_value());
  std::vector<proto::Result> history = executor_->GetJobHistory();
  ASSERT_EQ(history.size(), 2);
  EXPECT_EQ(history[0].job_id(), "first");
  EXPECT_EQ(history[1].job_id(), "second");
  EXPECT_EQ(history[1].error_kind(), proto::Result::NONZERO_EXIT);
  executor_->ClearJobHistory();
  EXPECT_THAT(executor_->GetJobHistory(), IsEmpty());
  EXPECT_FALSE(executor_->GetJobHistory("first").has_value());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestHistoryLimit) {
  ExecutorOptions options;
  options.max_history = 2;
  Reset(options);
  for (const char* id : {"a", "b", "c"}) executor_->Execute(Shell(id, "true"));
  std::vector<proto::Result> history = executor_->GetJobHistory();
  ASSERT_EQ(history.size(), 2);
  EXPECT_EQ(history[0].job_id(), "b");
  EXPECT_EQ(history[1].job_id(), "c");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestOnlyOwnEventsAttached) {
  executor_->Execute(Shell("bad", "sudo ls"));
  proto::Result result = executor_->Execute(Shell("good", "true"));
  EXPECT_EQ(result.security_events_size(), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestLifecycleEvents) {
  executor::EventQueue events;
  executor_->Execute(Shell("ok", "true"), &events);
  executor_->Execute(Shell("ko", "exit 2"), &events);
  executor_->Execute(Shell("rejected", "rm -rf /"), &events);
  events.Stop();
  std::vector<std::string> received;
  while (absl::optional<proto::Event> event = events.Dequeue()) {
    received.push_back(event->job_id() + " " +
                       proto::Event::Type_Name(event->type()));
  }
  EXPECT_THAT(received, ElementsAre("ok STARTED", "ok COMPLETED",
                                    "ko STARTED", "ko FAILED",
                                    "rejected FAILED"));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestShutdown) {
  executor_->Shutdown();
  EXPECT_FALSE(executor_->IsRunning());
  executor_->Shutdown();
  proto::Result result = executor_->Execute(Shell("late", "true"));
  EXPECT_EQ(result.status(), proto::Result::CANCELLED);
  EXPECT_EQ(sandboxes_->NumCreated(), 0);
  executor_->Start();
  EXPECT_EQ(executor_->Execute(Shell("late", "true")).status(),
            proto::Result::SUCCESS);
}

}  // namespace
