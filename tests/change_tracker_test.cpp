#include "looprunner/git/change_tracker.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace looprunner;

TEST(ChangeTrackerTest, ParsePorcelain_ReadsModifiedUntrackedAndRenamed) {
  auto files = parse_porcelain(" M src/a.ts\n?? new.txt\nR  old.ts -> new.ts\n");

  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0], "src/a.ts");
  EXPECT_EQ(files[1], "new.txt");
  EXPECT_EQ(files[2], "new.ts");
}

TEST(ChangeTrackerTest, ParsePorcelain_UnquotesPathsAndSkipsBlankLines) {
  auto files = parse_porcelain("?? \"with space.ts\"\r\n\n M b.ts");

  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0], "with space.ts");
  EXPECT_EQ(files[1], "b.ts");
}

TEST(ChangeTrackerTest, ChangedPaths_DetectsNewChangedAndReverted) {
  Checkpoint before;
  before.dirty["same.ts"] = PathFingerprint{.exists = true, .size = 1};
  before.dirty["edited.ts"] = PathFingerprint{.exists = true, .size = 1};
  before.dirty["reverted.ts"] = PathFingerprint{.exists = true, .size = 1};

  Checkpoint after;
  after.dirty["same.ts"] = PathFingerprint{.exists = true, .size = 1};
  after.dirty["edited.ts"] = PathFingerprint{.exists = true, .size = 2};
  after.dirty["added.ts"] = PathFingerprint{.exists = true, .size = 1};

  auto changed = changed_paths(before, after);

  EXPECT_EQ(changed, (std::vector<std::string>{"added.ts", "edited.ts",
                                               "reverted.ts"}));
}

TEST(ChangeTrackerTest, NullTracker_ReportsNothing) {
  auto tracker = create_null_tracker();

  auto baseline = tracker->capture_baseline();
  ASSERT_TRUE(baseline.has_value());
  EXPECT_TRUE(baseline->empty());

  auto cp = tracker->checkpoint();
  ASSERT_TRUE(cp.has_value());
  auto diff = tracker->diff_since(*cp);
  ASSERT_TRUE(diff.has_value());
  EXPECT_TRUE(diff->empty());

  auto committed = tracker->commit({"a.ts"}, "msg");
  ASSERT_TRUE(committed.has_value());
  EXPECT_FALSE(committed->has_value());
  EXPECT_FALSE(tracker->create_branch("task_1").has_value());
}

TEST(ChangeTrackerTest, IsGitRepository_PlainDirectory_IsFalse) {
  test::TempDir dir;

  EXPECT_FALSE(is_git_repository(dir.path().string()));
}
