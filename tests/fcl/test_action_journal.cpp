#include <gtest/gtest.h>
#include <fcl/journal/action_journal.hpp>
#include <fcl/storage/record_log.hpp>

#include <filesystem>
#include <fstream>

using namespace fcl;
namespace fs = std::filesystem;

class ActionJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("fcl_journal_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        journal_path_ = test_dir_ / "db" / "actions.journal";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<ActionJournal> open_journal(size_t max_entries = 0) {
        auto result = ActionJournal::open(journal_path_, logger_, max_entries);
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result.value());
    }

    static std::vector<ActionId> ids(const std::vector<ActionEntry>& entries) {
        std::vector<ActionId> out;
        for (const auto& entry : entries) {
            out.push_back(entry.id);
        }
        return out;
    }

    NullLogger logger_;
    fs::path test_dir_;
    fs::path journal_path_;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(ActionJournalTest, OpenCreatesEmptyJournal) {
    auto journal = open_journal();
    EXPECT_TRUE(journal->empty());
    EXPECT_TRUE(fs::exists(journal_path_));
    EXPECT_TRUE(journal->most_recent(std::nullopt).empty());
}

TEST_F(ActionJournalTest, AppendAssignsIncreasingIds) {
    auto journal = open_journal();

    auto a = journal->append(ActionKind::MOVE, "/src/a", fs::path("/dst/a"));
    auto b = journal->append(ActionKind::RENAME, "/src/b", fs::path("/src/b2"));
    auto c = journal->append(ActionKind::DELETE, "/src/c", std::nullopt);
    ASSERT_TRUE(a.ok() && b.ok() && c.ok());

    EXPECT_NE(a.value(), INVALID_ACTION_ID);
    EXPECT_LT(a.value(), b.value());
    EXPECT_LT(b.value(), c.value());
    EXPECT_EQ(journal->size(), 3u);
}

TEST_F(ActionJournalTest, MostRecentIsNewestFirst) {
    auto journal = open_journal();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/s" + std::to_string(i), fs::path("/d")).ok());
    }

    auto all = journal->most_recent(std::nullopt);
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(ids(all), (std::vector<ActionId>{5, 4, 3, 2, 1}));
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_GE(all[i - 1].created_at, all[i].created_at);
    }

    auto two = journal->most_recent(2);
    EXPECT_EQ(ids(two), (std::vector<ActionId>{5, 4}));

    // history() is the same view and does not consume anything
    EXPECT_EQ(ids(journal->history(3)), (std::vector<ActionId>{5, 4, 3}));
    EXPECT_EQ(journal->size(), 5u);
}

TEST_F(ActionJournalTest, EntryFieldsRoundTrip) {
    {
        auto journal = open_journal();
        ASSERT_TRUE(journal->append(ActionKind::RENAME, "/tmp/old name.txt",
                                    fs::path("/tmp/new name.txt"), "batch=7").ok());
        ASSERT_TRUE(journal->append(ActionKind::DELETE, "/tmp/junk.tmp", std::nullopt).ok());
    }

    auto journal = open_journal();
    auto entries = journal->most_recent(std::nullopt);
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].kind, ActionKind::DELETE);
    EXPECT_EQ(entries[0].source, fs::path("/tmp/junk.tmp"));
    EXPECT_FALSE(entries[0].destination.has_value());

    EXPECT_EQ(entries[1].kind, ActionKind::RENAME);
    EXPECT_EQ(entries[1].source, fs::path("/tmp/old name.txt"));
    ASSERT_TRUE(entries[1].destination.has_value());
    EXPECT_EQ(*entries[1].destination, fs::path("/tmp/new name.txt"));
    EXPECT_EQ(entries[1].metadata, "batch=7");
}

TEST_F(ActionJournalTest, RemoveDeletesOnlyGivenEntries) {
    auto journal = open_journal();
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/s", fs::path("/d")).ok());
    }

    ASSERT_TRUE(journal->remove({2, 4, 99}).ok());
    EXPECT_EQ(ids(journal->most_recent(std::nullopt)), (std::vector<ActionId>{3, 1}));

    // Unknown ids only
    ASSERT_TRUE(journal->remove({42}).ok());
    EXPECT_EQ(journal->size(), 2u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(ActionJournalTest, SurvivesReopen) {
    {
        auto journal = open_journal();
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/a", fs::path("/b")).ok());
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/c", fs::path("/d")).ok());
        ASSERT_TRUE(journal->remove({1}).ok());
    }

    auto journal = open_journal();
    ASSERT_EQ(journal->size(), 1u);
    EXPECT_EQ(journal->most_recent(1)[0].id, 2u);

    auto next = journal->append(ActionKind::MOVE, "/e", fs::path("/f"));
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next.value(), 3u);
}

TEST_F(ActionJournalTest, IdsAreNotReusedAfterCompaction) {
    {
        auto journal = open_journal();
        std::vector<ActionId> all;
        for (int i = 0; i < 100; ++i) {
            auto id = journal->append(ActionKind::MOVE, "/s", fs::path("/d"));
            ASSERT_TRUE(id.ok());
            all.push_back(id.value());
        }
        ASSERT_TRUE(journal->remove(all).ok());
        EXPECT_TRUE(journal->empty());
    }

    auto journal = open_journal();
    EXPECT_TRUE(journal->empty());
    auto id = journal->append(ActionKind::MOVE, "/s", fs::path("/d"));
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(id.value(), 101u);
}

TEST_F(ActionJournalTest, ExplicitCompactionKeepsLiveEntries) {
    auto journal = open_journal();
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/s" + std::to_string(i), fs::path("/d")).ok());
    }
    ASSERT_TRUE(journal->remove({1, 2, 3, 4, 5, 6, 7}).ok());

    auto before = fs::file_size(journal_path_);
    ASSERT_TRUE(journal->compact().ok());
    EXPECT_LT(fs::file_size(journal_path_), before);

    journal.reset();
    journal = open_journal();
    EXPECT_EQ(ids(journal->most_recent(std::nullopt)), (std::vector<ActionId>{10, 9, 8}));
}

TEST_F(ActionJournalTest, TornTailIsDiscarded) {
    {
        auto journal = open_journal();
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/a", fs::path("/b")).ok());
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/c", fs::path("/d")).ok());
    }
    auto intact_size = fs::file_size(journal_path_);

    // Half-written frame: header claims 64 bytes, only 3 follow
    {
        std::ofstream out(journal_path_, std::ios::binary | std::ios::app);
        const char torn[] = {0x40, 0x00, 0x00, 0x00, 0x11, 0x22, 0x33, 0x44, 'a', 'b', 'c'};
        out.write(torn, sizeof(torn));
    }

    auto journal = open_journal();
    EXPECT_EQ(journal->size(), 2u);
    EXPECT_EQ(fs::file_size(journal_path_), intact_size);

    ASSERT_TRUE(journal->append(ActionKind::DELETE, "/e", std::nullopt).ok());
    journal.reset();

    journal = open_journal();
    EXPECT_EQ(journal->size(), 3u);
}

TEST_F(ActionJournalTest, ForeignFileIsCorruption) {
    fs::create_directories(journal_path_.parent_path());
    {
        std::ofstream out(journal_path_);
        out << "this is not a journal";
    }

    auto result = ActionJournal::open(journal_path_, logger_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::CORRUPTION);
}

// ============================================================================
// History limit
// ============================================================================

TEST_F(ActionJournalTest, HistoryLimitDropsOldest) {
    auto journal = open_journal(3);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/s", fs::path("/d")).ok());
    }

    EXPECT_EQ(journal->size(), 3u);
    EXPECT_EQ(ids(journal->most_recent(std::nullopt)), (std::vector<ActionId>{5, 4, 3}));

    journal.reset();
    journal = open_journal(3);
    EXPECT_EQ(ids(journal->most_recent(std::nullopt)), (std::vector<ActionId>{5, 4, 3}));
}

TEST_F(ActionJournalTest, ZeroLimitIsUnbounded) {
    auto journal = open_journal(0);
    for (int i = 0; i < 60; ++i) {
        ASSERT_TRUE(journal->append(ActionKind::MOVE, "/s", fs::path("/d")).ok());
    }
    EXPECT_EQ(journal->size(), 60u);
}

// ============================================================================
// RecordLog
// ============================================================================

TEST_F(ActionJournalTest, RecordLogReplaysInOrder) {
    fs::path path = test_dir_ / "plain.log";
    {
        auto log = RecordLog::open(path);
        ASSERT_TRUE(log.ok()) << log.error().to_string();
        ASSERT_TRUE(log.value()->append("first").ok());
        ASSERT_TRUE(log.value()->append(std::string("sec\0nd", 6)).ok());
        ASSERT_TRUE(log.value()->append("").ok());
    }

    auto log = RecordLog::open(path);
    ASSERT_TRUE(log.ok());
    std::vector<std::string> seen;
    auto stats = log.value()->replay([&seen](const std::string& payload) {
        seen.push_back(payload);
    });
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats.value().records, 3u);
    EXPECT_EQ(stats.value().truncated_bytes, 0u);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "first");
    EXPECT_EQ(seen[1], std::string("sec\0nd", 6));
    EXPECT_EQ(seen[2], "");
}

TEST_F(ActionJournalTest, RecordLogStopsAtChecksumMismatch) {
    fs::path path = test_dir_ / "flipped.log";
    {
        auto log = RecordLog::open(path);
        ASSERT_TRUE(log.ok());
        ASSERT_TRUE(log.value()->append("keep").ok());
        ASSERT_TRUE(log.value()->append("damaged").ok());
    }

    // Flip the last payload byte of the second record
    {
        std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(-1, std::ios::end);
        file.put('X');
    }

    auto log = RecordLog::open(path);
    ASSERT_TRUE(log.ok());
    std::vector<std::string> seen;
    auto stats = log.value()->replay([&seen](const std::string& payload) {
        seen.push_back(payload);
    });
    ASSERT_TRUE(stats.ok());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "keep");
    EXPECT_EQ(stats.value().truncated_bytes, 8u + 7u);
}
