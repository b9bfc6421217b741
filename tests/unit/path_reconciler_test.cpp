#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "devready/platform/search_path.hpp"
#include "devready/probe/tool_probe.hpp"
#include "devready/reconcile/path_reconciler.hpp"
#include "tests/common/fake_platform.hpp"

namespace devready::reconcile {
namespace {

class PathReconcilerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Git is installed in X but neither X nor anything else resolves it.
    platform_.search_path = "C:\\Windows";
    platform_.AddFile("X", "git");
    store_.value = "C:\\Windows;C:\\Tools";
  }

  auto RunReconcile(const std::string& directory) -> ReconciliationOutcome {
    return Reconcile(
        directory, probe_, store_, platform_,
        ReconcileOptions{.delimiter = ';', .ignore_case = true});
  }

  test::FakePlatform platform_;
  test::FakePathStore store_;
  probe::ToolProbe probe_{
      .name = "Git",
      .path_command = "git",
      .executable = "git",
      .known_install_dirs = {"X"},
      .install_url = "https://git-scm.com/downloads",
  };
};

TEST_F(PathReconcilerTest, AppendsDirectoryAndVerifies) {
  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<AppliedAndVerified>(outcome));
  EXPECT_EQ(
      std::get<AppliedAndVerified>(outcome).new_path_value,
      "C:\\Windows;C:\\Tools;X");
  EXPECT_EQ(store_.value, "C:\\Windows;C:\\Tools;X");
  EXPECT_EQ(platform_.search_path, "C:\\Windows;X");
  EXPECT_EQ(store_.writes, 1);
}

TEST_F(PathReconcilerTest, SecondRunIsAlreadyPresent) {
  auto first = RunReconcile("X");
  auto second = RunReconcile("X");

  EXPECT_TRUE(std::holds_alternative<AppliedAndVerified>(first));
  EXPECT_TRUE(std::holds_alternative<AlreadyPresent>(second));
  EXPECT_EQ(platform::CountSegment(store_.value, "X", ';'), 1U);
  EXPECT_EQ(store_.writes, 1);
}

TEST_F(PathReconcilerTest, PreservesExistingSegmentsInOrder) {
  store_.value = " A ;B;;c:\\x\\y";

  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<AppliedAndVerified>(outcome));
  auto before = platform::SplitSearchPath(" A ;B;;c:\\x\\y", ';');
  auto after = platform::SplitSearchPath(store_.value, ';');
  ASSERT_EQ(after.size(), before.size() + 1);
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(after[i], before[i]);
  }
  EXPECT_EQ(after.back(), "X");
}

TEST_F(PathReconcilerTest, EmptyStoredValueGetsNoLeadingDelimiter) {
  store_.value = "";

  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<AppliedAndVerified>(outcome));
  EXPECT_EQ(store_.value, "X");
}

TEST_F(PathReconcilerTest, ExistingSegmentIsAlreadyPresent) {
  store_.value = "A;B";

  auto outcome = RunReconcile("B");

  EXPECT_TRUE(std::holds_alternative<AlreadyPresent>(outcome));
  EXPECT_EQ(store_.value, "A;B");
  EXPECT_EQ(store_.writes, 0);
}

TEST_F(PathReconcilerTest, MembershipIgnoresCaseAndSurroundingSpace) {
  store_.value = "A; c:\\program files\\git\\cmd ;B";

  auto outcome = RunReconcile("C:\\Program Files\\Git\\cmd");

  EXPECT_TRUE(std::holds_alternative<AlreadyPresent>(outcome));
  EXPECT_EQ(store_.value, "A; c:\\program files\\git\\cmd ;B");
}

TEST_F(PathReconcilerTest, PosixMembershipIsCaseSensitive) {
  platform_.delimiter = ':';
  platform_.search_path = "/usr/bin";
  platform_.AddFile("/opt/git/bin", "git");
  store_.value = "/usr/bin:/Opt/Git/bin";

  auto outcome = Reconcile(
      "/opt/git/bin", probe_, store_, platform_,
      ReconcileOptions{.delimiter = ':', .ignore_case = false});

  ASSERT_TRUE(std::holds_alternative<AppliedAndVerified>(outcome));
  EXPECT_EQ(store_.value, "/usr/bin:/Opt/Git/bin:/opt/git/bin");
  EXPECT_EQ(platform_.search_path, "/usr/bin:/opt/git/bin");
}

TEST_F(PathReconcilerTest, DirectoryContainingDelimiterIsRefused) {
  store_.value = "A;B";
  platform_.AddFile("C:\\Users\\a;b\\Git\\cmd", "git");

  auto first = RunReconcile("C:\\Users\\a;b\\Git\\cmd");
  auto second = RunReconcile("C:\\Users\\a;b\\Git\\cmd");

  ASSERT_TRUE(std::holds_alternative<Failed>(first));
  EXPECT_NE(
      std::get<Failed>(first).reason.find("separator"), std::string::npos);
  EXPECT_TRUE(std::holds_alternative<Failed>(second));
  EXPECT_EQ(store_.value, "A;B");
  EXPECT_EQ(store_.writes, 0);
  EXPECT_EQ(platform_.search_path, "C:\\Windows");
}

TEST_F(PathReconcilerTest, WriteFailureLeavesValueUnchanged) {
  store_.fail_write = true;
  const std::string before = store_.value;

  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
  EXPECT_NE(
      std::get<Failed>(outcome).reason.find("access denied"),
      std::string::npos);
  EXPECT_EQ(store_.value, before);
  // The process path is only touched after a successful write.
  EXPECT_EQ(platform_.search_path, "C:\\Windows");
}

TEST_F(PathReconcilerTest, ReadFailureIsFailed) {
  store_.fail_read = true;

  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
  EXPECT_NE(
      std::get<Failed>(outcome).reason.find("store unavailable"),
      std::string::npos);
  EXPECT_EQ(store_.writes, 0);
}

TEST_F(PathReconcilerTest, UnresolvableAfterWriteIsUnverified) {
  platform_.fail_set_search_path = true;

  auto outcome = RunReconcile("X");

  EXPECT_TRUE(std::holds_alternative<AppliedButUnverified>(outcome));
  EXPECT_EQ(store_.value, "C:\\Windows;C:\\Tools;X");
}

TEST_F(PathReconcilerTest, ConcurrentEditIsNotLost) {
  // Another writer appends Z between our read and our write.
  store_.external_edits.push_back("C:\\Windows;C:\\Tools;Z");

  auto outcome = RunReconcile("X");

  ASSERT_TRUE(std::holds_alternative<AppliedAndVerified>(outcome));
  EXPECT_EQ(store_.value, "C:\\Windows;C:\\Tools;Z;X");
  EXPECT_EQ(store_.writes, 1);
}

TEST_F(PathReconcilerTest, ConcurrentEditAddingDirectoryIsAlreadyPresent) {
  store_.external_edits.push_back("C:\\Windows;C:\\Tools;X");

  auto outcome = RunReconcile("X");

  EXPECT_TRUE(std::holds_alternative<AlreadyPresent>(outcome));
  EXPECT_EQ(store_.writes, 0);
}

TEST_F(PathReconcilerTest, ValueThatKeepsChangingFails) {
  for (int i = 0; i < 10; ++i) {
    store_.external_edits.push_back("C:\\Windows;edit" + std::to_string(i));
  }

  auto outcome = Reconcile(
      "X", probe_, store_, platform_,
      ReconcileOptions{
          .delimiter = ';', .ignore_case = true, .max_attempts = 2});

  ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
  EXPECT_EQ(store_.writes, 0);
}

}  // namespace
}  // namespace devready::reconcile
