#include "cloudmove/core/cancellation.hpp"
#include "cloudmove/events/events.hpp"
#include "cloudmove/migrate/orchestrator.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using cloudmove::CancellationToken;
using cloudmove::ErrorCode;
using cloudmove::events::CancellationObservedEvent;
using cloudmove::events::CopyFailedEvent;
using cloudmove::events::EventBus;
using cloudmove::events::FileCopiedEvent;
using cloudmove::events::SourceDeleteFailedEvent;
using cloudmove::events::TransferStartedEvent;
using cloudmove::migrate::apply_cap;
using cloudmove::migrate::collect_source_files;
using cloudmove::migrate::DirectoryPruner;
using cloudmove::migrate::MaxFiles;
using cloudmove::migrate::OrchestratorSettings;
using cloudmove::migrate::StabilityMonitor;
using cloudmove::migrate::StabilitySettings;
using cloudmove::migrate::StatusClassifier;
using cloudmove::migrate::TransferOrchestrator;
using cloudmove::test_support::create_temp_dir;
using cloudmove::test_support::FakeClock;
using cloudmove::test_support::read_file;
using cloudmove::test_support::ScriptedProbe;
using cloudmove::test_support::write_file;

namespace {

constexpr const char* kDone = "Always available on this device";

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = create_temp_dir("cloudmove_orchestrator_test");
        source = base / "source";
        destination = base / "cloud";
        fs::create_directories(source);
        fs::create_directories(destination);

        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            started.push_back(e.task.source_path);
        });
        bus.subscribe<CopyFailedEvent>([this](const CopyFailedEvent& e) {
            copy_failures.push_back(e.task.source_path);
        });
    }

    void TearDown() override {
        fs::remove_all(base);
    }

    TransferOrchestrator make_orchestrator(bool prune = true, bool whole_tree = false) {
        monitor = std::make_unique<StabilityMonitor>(probe, classifier, StabilitySettings{5s, 60s, 2},
                                                     bus, clock.clock());
        pruner = std::make_unique<DirectoryPruner>(bus);

        OrchestratorSettings settings;
        settings.source_root = source;
        settings.destination_root = destination;
        settings.prune_empty_directories = prune;
        settings.prune_whole_tree = whole_tree;
        return TransferOrchestrator(settings, *monitor, *pruner, token, bus, clock.clock());
    }

    fs::path base;
    fs::path source;
    fs::path destination;
    EventBus bus;
    FakeClock clock;
    ScriptedProbe probe;
    StatusClassifier classifier = StatusClassifier::with_defaults();
    CancellationToken token;
    std::unique_ptr<StabilityMonitor> monitor;
    std::unique_ptr<DirectoryPruner> pruner;
    std::vector<fs::path> started;
    std::vector<fs::path> copy_failures;
};

} // namespace

TEST_F(TransferOrchestratorTest, MovesFilesAfterConfirmedSync) {
    write_file(source / "a.txt", "alpha");
    write_file(source / "nested" / "deeper" / "b.bin", std::string("\0\x01\x02 binary", 10));
    probe.push_statuses({kDone});

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_EQ(summary.planned, 2u);
    EXPECT_EQ(summary.attempted, 2u);
    EXPECT_EQ(summary.deleted, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(summary.cancelled);

    EXPECT_FALSE(fs::exists(source / "a.txt"));
    EXPECT_FALSE(fs::exists(source / "nested"));
    EXPECT_TRUE(fs::exists(source));
    EXPECT_EQ(read_file(destination / "a.txt"), "alpha");
    EXPECT_EQ(read_file(destination / "nested" / "deeper" / "b.bin"), std::string("\0\x01\x02 binary", 10));
}

TEST_F(TransferOrchestratorTest, TimeoutPreservesSource) {
    write_file(source / "slow.txt", "slow");
    probe.push_statuses({"Syncing"});

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_EQ(summary.preserved, 1u);
    EXPECT_EQ(summary.deleted, 0u);
    EXPECT_EQ(read_file(source / "slow.txt"), "slow");
    EXPECT_EQ(read_file(destination / "slow.txt"), "slow");
}

TEST_F(TransferOrchestratorTest, CopyFailureContinuesWithNextFile) {
    write_file(source / "blocked" / "x.txt", "x");
    write_file(source / "ok.txt", "ok");
    // A regular file where the destination directory must go
    write_file(destination / "blocked", "not a directory");
    probe.push_statuses({kDone});

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_EQ(summary.attempted, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.deleted, 1u);
    ASSERT_EQ(copy_failures.size(), 1u);
    EXPECT_EQ(copy_failures.front(), source / "blocked" / "x.txt");
    EXPECT_TRUE(fs::exists(source / "blocked" / "x.txt"));
    EXPECT_FALSE(fs::exists(source / "ok.txt"));
}

TEST_F(TransferOrchestratorTest, SourceVanishingBeforeDeleteIsDeleteFailure) {
    write_file(source / "a.txt", "a");
    probe.push_statuses({kDone});
    int delete_failures = 0;
    bus.subscribe<FileCopiedEvent>([](const FileCopiedEvent& e) { fs::remove(e.task.source_path); });
    bus.subscribe<SourceDeleteFailedEvent>([&](const SourceDeleteFailedEvent& e) {
        EXPECT_EQ(e.error.code, ErrorCode::DeleteFailed);
        delete_failures++;
    });

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(delete_failures, 1);
    EXPECT_TRUE(fs::exists(destination / "a.txt"));
}

TEST_F(TransferOrchestratorTest, CancellationBeforeRunStartsNothing) {
    write_file(source / "a.txt", "a");
    write_file(source / "b.txt", "b");
    token.request();
    std::size_t remaining = 0;
    bus.subscribe<CancellationObservedEvent>([&](const CancellationObservedEvent& e) {
        remaining = e.files_remaining;
    });

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.attempted, 0u);
    EXPECT_EQ(remaining, 2u);
    EXPECT_TRUE(started.empty());
    EXPECT_TRUE(fs::is_empty(destination));
}

TEST_F(TransferOrchestratorTest, CancellationDuringFileLetsItFinish) {
    write_file(source / "a.txt", "a");
    write_file(source / "b.txt", "b");
    write_file(source / "c.txt", "c");
    probe.push_statuses({kDone});
    bus.subscribe<FileCopiedEvent>([this](const FileCopiedEvent&) { token.request(); });

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.attempted, 1u);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_FALSE(fs::exists(source / "a.txt"));
    EXPECT_TRUE(fs::exists(source / "b.txt"));
    EXPECT_TRUE(fs::exists(source / "c.txt"));
}

TEST_F(TransferOrchestratorTest, CapLimitsToFirstFilesInPathOrder) {
    for (int i = 9; i >= 0; --i) {
        write_file(source / ("file" + std::to_string(i) + ".txt"), "data");
    }
    probe.push_statuses({kDone});

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{3});

    EXPECT_EQ(summary.planned, 3u);
    EXPECT_EQ(summary.attempted, 3u);
    ASSERT_EQ(started.size(), 3u);
    EXPECT_EQ(started[0], source / "file0.txt");
    EXPECT_EQ(started[1], source / "file1.txt");
    EXPECT_EQ(started[2], source / "file2.txt");
    EXPECT_TRUE(fs::exists(source / "file3.txt"));
}

TEST_F(TransferOrchestratorTest, AllAttemptsEveryFile) {
    for (int i = 0; i < 10; ++i) {
        write_file(source / ("file" + std::to_string(i) + ".txt"), "data");
    }
    probe.push_statuses({kDone});

    auto orchestrator = make_orchestrator();
    const auto summary = orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_EQ(summary.attempted, 10u);
    EXPECT_EQ(summary.deleted, 10u);
}

TEST_F(TransferOrchestratorTest, PruningDisabledKeepsEmptyParents) {
    write_file(source / "dir" / "a.txt", "a");
    probe.push_statuses({kDone});

    auto orchestrator = make_orchestrator(false);
    orchestrator.run(collect_source_files(source), MaxFiles{});

    EXPECT_FALSE(fs::exists(source / "dir" / "a.txt"));
    EXPECT_TRUE(fs::exists(source / "dir"));
}

TEST_F(TransferOrchestratorTest, WholeTreePruningReachesUnrelatedEmptyDirs) {
    write_file(source / "dir" / "a.txt", "a");
    fs::create_directories(source / "unrelated" / "empty");
    probe.push_statuses({kDone});

    auto parent_only = make_orchestrator(true, false);
    parent_only.run(collect_source_files(source), MaxFiles{});
    EXPECT_FALSE(fs::exists(source / "dir"));
    EXPECT_TRUE(fs::exists(source / "unrelated" / "empty"));

    write_file(source / "dir2" / "b.txt", "b");
    auto whole_tree = make_orchestrator(true, true);
    whole_tree.run(collect_source_files(source), MaxFiles{});
    EXPECT_FALSE(fs::exists(source / "unrelated"));
    EXPECT_TRUE(fs::exists(source));
}

TEST_F(TransferOrchestratorTest, DestinationIsReRootedRelativePath) {
    auto orchestrator = make_orchestrator();

    auto inside = orchestrator.destination_for(source / "x" / "y.txt");
    ASSERT_TRUE(inside.is_ok());
    EXPECT_EQ(inside.value(), destination / "x" / "y.txt");

    auto outside = orchestrator.destination_for(base / "other" / "y.txt");
    ASSERT_TRUE(outside.is_error());
    EXPECT_EQ(outside.error().code, ErrorCode::InvalidArgument);
}

TEST(CollectSourceFilesTest, SortedRegularFilesWithoutSymlinks) {
    const auto dir = create_temp_dir("cloudmove_collect_test");
    write_file(dir / "b.txt", "b");
    write_file(dir / "a" / "z.txt", "z");
    write_file(dir / "A.txt", "A");
    fs::create_directories(dir / "empty");
    fs::create_symlink(dir / "b.txt", dir / "link.txt");

    const auto files = collect_source_files(dir);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], dir / "A.txt");
    EXPECT_EQ(files[1], dir / "a" / "z.txt");
    EXPECT_EQ(files[2], dir / "b.txt");
    fs::remove_all(dir);
}

TEST(CollectSourceFilesTest, ApplyCap) {
    const std::vector<fs::path> files{"/a", "/b", "/c"};
    EXPECT_EQ(apply_cap(files, MaxFiles{}).size(), 3u);
    EXPECT_EQ(apply_cap(files, MaxFiles{2}).size(), 2u);
    EXPECT_EQ(apply_cap(files, MaxFiles{10}).size(), 3u);
}
