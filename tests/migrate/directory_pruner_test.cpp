#include "cloudmove/events/events.hpp"
#include "cloudmove/migrate/directory_pruner.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cloudmove::events::DirectoryPrunedEvent;
using cloudmove::events::EventBus;
using cloudmove::events::PruneFailedEvent;
using cloudmove::migrate::DirectoryPruner;
using cloudmove::migrate::is_strictly_within;
using cloudmove::migrate::path_depth;
using cloudmove::migrate::PruneRequest;
using cloudmove::test_support::create_temp_dir;
using cloudmove::test_support::write_file;

namespace {

class DirectoryPrunerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = create_temp_dir("cloudmove_pruner_test");
        root = base / "source";
        fs::create_directories(root);
        bus.subscribe<DirectoryPrunedEvent>([this](const DirectoryPrunedEvent& e) { pruned.push_back(e.path); });
        bus.subscribe<PruneFailedEvent>([this](const PruneFailedEvent& e) { failed.push_back(e.path); });
    }

    void TearDown() override {
        fs::remove_all(base);
    }

    fs::path base;
    fs::path root;
    EventBus bus;
    std::vector<fs::path> pruned;
    std::vector<fs::path> failed;
};

} // namespace

TEST(PathHelpersTest, DepthCountsElements) {
    EXPECT_EQ(path_depth("/a/b/c"), path_depth("/a/b") + 1);
    EXPECT_EQ(path_depth("/a/b/"), path_depth("/a/b"));
    EXPECT_EQ(path_depth("/a/./b/../b"), path_depth("/a/b"));
}

TEST(PathHelpersTest, StrictlyWithin) {
    EXPECT_TRUE(is_strictly_within("/data/src/a", "/data/src"));
    EXPECT_TRUE(is_strictly_within("/data/src/a/b", "/data/src/"));
    EXPECT_FALSE(is_strictly_within("/data/src", "/data/src"));
    EXPECT_FALSE(is_strictly_within("/data/src2/a", "/data/src"));
    EXPECT_FALSE(is_strictly_within("/data", "/data/src"));
}

TEST_F(DirectoryPrunerTest, RemovesEmptyChainUpToButNotRoot) {
    const fs::path leaf = root / "a" / "b" / "c";
    fs::create_directories(leaf);

    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, leaf);

    EXPECT_EQ(report.removed, 3u);
    EXPECT_EQ(report.failures, 0u);
    EXPECT_FALSE(fs::exists(root / "a"));
    EXPECT_TRUE(fs::exists(root));
    EXPECT_TRUE(failed.empty());
}

TEST_F(DirectoryPrunerTest, RetainsAnySubtreeWithAnEntry) {
    fs::create_directories(root / "a" / "empty1" / "deeper");
    fs::create_directories(root / "a" / "empty2");
    write_file(root / "a" / "keep" / "inner" / "file.txt", "x");

    DirectoryPruner pruner(bus);
    pruner.prune(root, root / "a");

    EXPECT_FALSE(fs::exists(root / "a" / "empty1"));
    EXPECT_FALSE(fs::exists(root / "a" / "empty2"));
    EXPECT_TRUE(fs::exists(root / "a" / "keep" / "inner" / "file.txt"));
    EXPECT_TRUE(fs::exists(root / "a"));
}

TEST_F(DirectoryPrunerTest, DeepestFirstByDepthNotName) {
    // "z" sorts after "a/b/c/d" lexically but is shallower
    fs::create_directories(root / "a" / "b" / "c" / "d");
    fs::create_directories(root / "z");

    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, root);

    EXPECT_EQ(report.removed, 5u);
    ASSERT_EQ(pruned.size(), 5u);
    for (std::size_t i = 1; i < pruned.size(); ++i) {
        EXPECT_GE(path_depth(pruned[i - 1]), path_depth(pruned[i]));
    }
    EXPECT_EQ(pruned.front(), root / "a" / "b" / "c" / "d");
    EXPECT_TRUE(fs::exists(root));
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(DirectoryPrunerTest, ScopeEqualToRootNeverRemovesRoot) {
    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, root);

    EXPECT_EQ(report.removed, 0u);
    EXPECT_TRUE(fs::exists(root));
}

TEST_F(DirectoryPrunerTest, VanishedScopeIsNoOp) {
    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, root / "gone" / "deeper");

    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(report.failures, 0u);
    EXPECT_TRUE(pruned.empty());
    EXPECT_TRUE(failed.empty());
}

TEST_F(DirectoryPrunerTest, ScopeOutsideRootIsRefused) {
    const fs::path outside = base / "elsewhere" / "empty";
    fs::create_directories(outside);

    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, outside);

    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(report.failures, 1u);
    EXPECT_TRUE(fs::exists(outside));
    ASSERT_EQ(failed.size(), 1u);
}

TEST_F(DirectoryPrunerTest, AncestorWalkStopsAtNonEmptyAncestor) {
    fs::create_directories(root / "a" / "b" / "c");
    write_file(root / "a" / "sibling.txt", "x");

    DirectoryPruner pruner(bus);
    pruner.prune(root, root / "a" / "b" / "c");

    EXPECT_FALSE(fs::exists(root / "a" / "b"));
    EXPECT_TRUE(fs::exists(root / "a" / "sibling.txt"));
}

TEST_F(DirectoryPrunerTest, UnicodeNamesAreHandled) {
    const fs::path emoji = root / u8"фото" / u8"👩‍👩‍👧‍👦 family";
    const fs::path kept = root / u8"日本語" / u8"été";
    fs::create_directories(emoji);
    write_file(kept / u8"señal.txt", "x");

    DirectoryPruner pruner(bus);
    pruner.prune(root, root);

    EXPECT_FALSE(fs::exists(root / u8"фото"));
    EXPECT_TRUE(fs::exists(kept / u8"señal.txt"));
    EXPECT_TRUE(failed.empty());
}

TEST_F(DirectoryPrunerTest, RootItselfIsNeverTouchedEvenWhenEmpty) {
    fs::create_directories(root / "only");

    DirectoryPruner pruner(bus);
    pruner.prune(PruneRequest{root, root / "only"});

    EXPECT_FALSE(fs::exists(root / "only"));
    EXPECT_TRUE(fs::exists(root));
    EXPECT_TRUE(fs::exists(base));
}

TEST_F(DirectoryPrunerTest, SymlinkScopeIsNotFollowed) {
    const fs::path outside = base / "outside";
    fs::create_directories(outside / "keepme" / "deep");
    fs::create_directory_symlink(outside, root / "link");

    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, root / "link");

    EXPECT_EQ(report.removed, 0u);
    EXPECT_TRUE(fs::exists(outside / "keepme" / "deep"));
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(root / "link")));
    EXPECT_TRUE(pruned.empty());
}

TEST_F(DirectoryPrunerTest, ScopeBelowSymlinkedParentIsNotFollowed) {
    const fs::path outside = base / "outside";
    fs::create_directories(outside / "keepme" / "deep");
    fs::create_directories(root / "real");
    fs::create_directory_symlink(outside, root / "real" / "link");

    DirectoryPruner pruner(bus);
    const auto report = pruner.prune(root, root / "real" / "link" / "keepme");

    EXPECT_EQ(report.removed, 0u);
    EXPECT_TRUE(fs::exists(outside / "keepme" / "deep"));
    EXPECT_TRUE(fs::exists(root / "real"));
    EXPECT_TRUE(pruned.empty());
}

TEST_F(DirectoryPrunerTest, SymlinkInsideScopeIsLeftInPlace) {
    const fs::path outside = base / "outside";
    fs::create_directories(outside / "empty");
    fs::create_directories(root / "a" / "gone");
    fs::create_directory_symlink(outside, root / "a" / "link");

    DirectoryPruner pruner(bus);
    pruner.prune(root, root / "a");

    EXPECT_FALSE(fs::exists(root / "a" / "gone"));
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(root / "a" / "link")));
    EXPECT_TRUE(fs::exists(outside / "empty"));
    EXPECT_TRUE(fs::exists(root / "a"));
}
