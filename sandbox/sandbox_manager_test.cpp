#include "sandbox/sandbox_manager.hpp"

#include <memory>
#include <stdexcept>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/bruno_testdir";

class SandboxManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_ = absl::make_unique<util::TempDir>(test_tmpdir);
    options_.temp_directory = tmp_->Path();
    options_.backend = "process";
  }

  ExecutionContext Context(const std::string& id) {
    ExecutionContext context;
    context.job_id = "job-" + id;
    context.sandbox_id = id;
    return context;
  }

  std::unique_ptr<util::TempDir> tmp_;
  SandboxManagerOptions options_;
};

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestCreateAndDestroy) {
  SandboxManager manager(options_);
  std::shared_ptr<Sandbox> sandbox = manager.CreateSandbox(Context("sb1"));
  ASSERT_NE(sandbox, nullptr);
  EXPECT_EQ(sandbox->Id(), "sb1");
  EXPECT_EQ(sandbox->Type(), BackendType::PROCESS);
  EXPECT_TRUE(util::File::Exists(sandbox->WorkDir()));
  EXPECT_EQ(util::File::BaseDir(sandbox->Root()), tmp_->Path());
  EXPECT_THAT(manager.ActiveSandboxes(), ElementsAre("sb1"));
  EXPECT_EQ(manager.GetSandbox("sb1"), sandbox);

  std::string root = sandbox->Root();
  manager.DestroySandbox("sb1");
  EXPECT_FALSE(util::File::Exists(root));
  EXPECT_THAT(manager.ActiveSandboxes(), IsEmpty());
  EXPECT_EQ(manager.GetSandbox("sb1"), nullptr);

  // Destroying twice is harmless.
  manager.DestroySandbox("sb1");
  EXPECT_EQ(manager.NumCreated(), 1);
  EXPECT_EQ(manager.NumDestroyed(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestExecute) {
  SandboxManager manager(options_);
  std::shared_ptr<Sandbox> sandbox = manager.CreateSandbox(Context("sb"));
  ExecutionOptions options(sandbox->WorkDir(), "/bin/sh");
  options.args = {"-c", "echo \"$HOME\" > home.txt"};
  options.environment["HOME"] = "/workspace";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg)) << error_msg;
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::Read(
                util::File::JoinPath(sandbox->WorkDir(), "home.txt")),
            sandbox->WorkDir() + "\n");
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestDuplicateId) {
  SandboxManager manager(options_);
  manager.CreateSandbox(Context("sb"));
  EXPECT_THROW(manager.CreateSandbox(Context("sb")), std::invalid_argument);
  EXPECT_THROW(manager.CreateSandbox(Context("")), std::invalid_argument);
  EXPECT_EQ(manager.NumCreated(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestUnknownBackend) {
  options_.backend = "chroot";
  SandboxManager manager(options_);
  EXPECT_THROW(manager.CreateSandbox(Context("sb")), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestUnavailableBackend) {
  options_.backend = "vm";
  SandboxManager manager(options_);
  EXPECT_THROW(manager.CreateSandbox(Context("sb")), std::runtime_error);
  EXPECT_THAT(manager.ActiveSandboxes(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestCancel) {
  SandboxManager manager(options_);
  std::shared_ptr<Sandbox> sandbox = manager.CreateSandbox(Context("sb"));
  EXPECT_FALSE(manager.CancelSandbox("other"));
  EXPECT_TRUE(manager.CancelSandbox("sb"));
  EXPECT_TRUE(sandbox->Cancelled());
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(
      ExecutionOptions(sandbox->WorkDir(), "/bin/true"), &info, &error_msg));
  EXPECT_EQ(error_msg, "sandbox sb was cancelled");
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestExecuteAfterDestroy) {
  SandboxManager manager(options_);
  std::shared_ptr<Sandbox> sandbox = manager.CreateSandbox(Context("sb"));
  manager.DestroySandbox("sb");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(ExecutionOptions("/", "/bin/true"), &info,
                                &error_msg));
  EXPECT_EQ(error_msg, "sandbox sb was destroyed");
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestDestroyAll) {
  std::string root;
  {
    SandboxManager manager(options_);
    manager.CreateSandbox(Context("a"));
    root = manager.CreateSandbox(Context("b"))->Root();
    manager.DestroyAllSandboxes();
    EXPECT_THAT(manager.ActiveSandboxes(), IsEmpty());
    EXPECT_EQ(manager.NumDestroyed(), 2);
    manager.CreateSandbox(Context("c"));
  }
  EXPECT_FALSE(util::File::Exists(root));
}

// NOLINTNEXTLINE
TEST_F(SandboxManagerTest, TestKeepSandboxes) {
  options_.keep_sandboxes = true;
  SandboxManager manager(options_);
  std::string root = manager.CreateSandbox(Context("sb"))->Root();
  manager.DestroySandbox("sb");
  EXPECT_TRUE(util::File::Exists(root));
}

}  // namespace
