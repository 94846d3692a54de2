#include "storage/page_store.hpp"

#include "common/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace pagekv::storage {

// ── Fixture ──────────────────────────────────────────────────────────────────

class PageStoreTest : public ::testing::Test {
protected:
    static constexpr uint32_t kPageSize = 512;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("pagekv_page_store_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "test.db";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    // Apply and fold the result into index_, the way the engine does.
    std::error_code apply(PageStore& store, uint64_t seq, const Operation& op,
                          ApplyResult* out = nullptr) {
        ApplyResult result;
        auto ec = store.apply(seq, op, index_, result);
        if (!ec && result.applied) {
            if (result.present) {
                index_.upsert(op_key(op), result.entry);
            } else {
                index_.erase(op_key(op));
            }
        }
        if (out) *out = result;
        return ec;
    }

    std::string value_of(const PageStore& store, const std::string& key) {
        const IndexEntry* e = index_.find(key);
        if (!e) return "<absent>";
        std::string value;
        auto ec = store.read_value(*e, key, value);
        if (ec) return "<" + ec.message() + ">";
        return value;
    }

    void flip_byte(off_t pos) {
        int fd = ::open(path_.c_str(), O_RDWR);
        ASSERT_GE(fd, 0);
        uint8_t byte = 0;
        ASSERT_EQ(::pread(fd, &byte, 1, pos), 1);
        byte ^= 0x01;
        ASSERT_EQ(::pwrite(fd, &byte, 1, pos), 1);
        ::close(fd);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
    KeyIndex index_;
};

// ── Open ─────────────────────────────────────────────────────────────────────

TEST_F(PageStoreTest, OpenCreatesEmptyFile) {
    PageStore store(path_, kPageSize);
    auto ec = store.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(store.is_open());
    EXPECT_TRUE(std::filesystem::exists(path_));
    EXPECT_EQ(store.page_count(), 0u);
    EXPECT_EQ(store.max_applied_seq(), 0u);
}

TEST_F(PageStoreTest, OperationsOnClosedStoreFail) {
    PageStore store(path_, kPageSize);
    Page page(0, kPageSize);
    EXPECT_EQ(store.read_page(0, page), make_error_code(Errc::not_open));
    EXPECT_EQ(store.write_page(page), make_error_code(Errc::not_open));

    ApplyResult result;
    EXPECT_EQ(store.apply(1, PutOp{"k", "v"}, index_, result),
              make_error_code(Errc::not_open));
}

// ── apply() ──────────────────────────────────────────────────────────────────

TEST_F(PageStoreTest, PutPlacesEntryOnNewPage) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ApplyResult result;
    ASSERT_FALSE(apply(store, 1, PutOp{"key1", "value1"}, &result));
    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.present);
    EXPECT_EQ(result.entry.page_id, 0u);
    EXPECT_EQ(result.entry.slot, 0u);
    EXPECT_EQ(result.entry.sequence, 1u);
    EXPECT_FALSE(result.entry.tombstone);

    EXPECT_EQ(store.page_count(), 1u);
    EXPECT_EQ(std::filesystem::file_size(path_), kPageSize);
    EXPECT_EQ(store.max_applied_seq(), 1u);
    EXPECT_EQ(value_of(store, "key1"), "value1");
}

TEST_F(PageStoreTest, OverwriteInPlace) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 1, PutOp{"a", "1"}));
    ApplyResult result;
    ASSERT_FALSE(apply(store, 2, PutOp{"a", "2"}, &result));
    EXPECT_TRUE(result.applied);
    EXPECT_EQ(result.entry.page_id, 0u);
    EXPECT_EQ(result.entry.slot, 0u);
    EXPECT_EQ(value_of(store, "a"), "2");

    Page page(0, kPageSize);
    ASSERT_FALSE(store.read_page(0, page));
    EXPECT_EQ(page.last_applied_seq(), 2u);
    EXPECT_EQ(page.live_count(), 1u);
}

TEST_F(PageStoreTest, DeleteWritesTombstone) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 1, PutOp{"a", "1"}));
    ApplyResult result;
    ASSERT_FALSE(apply(store, 2, DeleteOp{"a"}, &result));
    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.present);
    EXPECT_TRUE(result.entry.tombstone);

    Page page(0, kPageSize);
    ASSERT_FALSE(store.read_page(0, page));
    ASSERT_NE(page.entry(0), nullptr);
    EXPECT_TRUE(page.entry(0)->tombstone);
    EXPECT_TRUE(page.entry(0)->value.empty());
    EXPECT_EQ(page.entry(0)->sequence, 2u);
}

TEST_F(PageStoreTest, DeleteOfUnknownKeyWritesNothing) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ApplyResult result;
    ASSERT_FALSE(apply(store, 1, DeleteOp{"ghost"}, &result));
    EXPECT_FALSE(result.applied);
    EXPECT_FALSE(result.present);
    EXPECT_EQ(store.page_count(), 0u);
    EXPECT_EQ(std::filesystem::file_size(path_), 0u);
}

TEST_F(PageStoreTest, OversizedEntryRejected) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    EXPECT_FALSE(store.fits(1, kPageSize));
    EXPECT_TRUE(store.fits(1, max_entry_size(kPageSize) - kEntryHeaderSize - 1));

    ApplyResult result;
    auto ec = apply(store, 1, PutOp{"k", std::string(kPageSize, 'x')}, &result);
    EXPECT_EQ(ec, make_error_code(Errc::entry_too_large));
    EXPECT_FALSE(result.applied);
    EXPECT_EQ(store.page_count(), 0u);
}

TEST_F(PageStoreTest, AlreadyReflectedRecordIsSkipped) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 5, PutOp{"k", "new"}));

    // Replaying the same or an older record changes nothing.
    for (uint64_t seq : {5u, 3u}) {
        ApplyResult result;
        ASSERT_FALSE(apply(store, seq, PutOp{"k", "old"}, &result));
        EXPECT_FALSE(result.applied) << "seq " << seq;
        EXPECT_TRUE(result.present);
        EXPECT_EQ(result.entry.sequence, 5u);
    }
    EXPECT_EQ(value_of(store, "k"), "new");
}

// ── Allocation ───────────────────────────────────────────────────────────────

TEST_F(PageStoreTest, FullPageSpillsToNewPage) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    // 13 + 1 + 400 bytes + slot: leaves 80 bytes free on page 0.
    ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(400, 'a')}));
    ApplyResult result;
    ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(100, 'b')}, &result));
    EXPECT_EQ(result.entry.page_id, 1u);
    EXPECT_EQ(store.page_count(), 2u);
    EXPECT_EQ(std::filesystem::file_size(path_), 2 * kPageSize);
}

TEST_F(PageStoreTest, BestFitChoosesTightestPage) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(400, 'a')}));  // page 0: 80 free
    ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(100, 'b')}));  // page 1: 380 free

    ApplyResult result;
    ASSERT_FALSE(apply(store, 3, PutOp{"c", std::string(50, 'c')}, &result));
    EXPECT_EQ(result.entry.page_id, 0u);
    EXPECT_EQ(store.page_count(), 2u);
}

TEST_F(PageStoreTest, GrowingOverwriteMovesEntry) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(400, 'a')}));  // page 0
    ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(100, 'b')}));  // page 1
    ASSERT_FALSE(apply(store, 3, PutOp{"c", std::string(50, 'c')}));   // page 0, 12 free

    ApplyResult result;
    ASSERT_FALSE(apply(store, 4, PutOp{"c", std::string(100, 'C')}, &result));
    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.present);
    EXPECT_EQ(result.entry.page_id, 1u);
    EXPECT_EQ(value_of(store, "c"), std::string(100, 'C'));

    Page old_page(0, kPageSize);
    ASSERT_FALSE(store.read_page(0, old_page));
    EXPECT_FALSE(old_page.find("c").has_value());
    EXPECT_EQ(old_page.last_applied_seq(), 4u);
}

TEST_F(PageStoreTest, VacatedSpaceIsReused) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());

    ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(200, 'a')}));
    ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(200, 'b')}));
    ASSERT_EQ(store.page_count(), 1u);

    // "a" grows past what page 0 can hold and moves to page 1.
    ASSERT_FALSE(apply(store, 3, PutOp{"a", std::string(300, 'A')}));
    ASSERT_EQ(store.page_count(), 2u);

    // Its old room on page 0 takes the next small entry.
    ApplyResult result;
    ASSERT_FALSE(apply(store, 4, PutOp{"d", std::string(170, 'd')}, &result));
    EXPECT_EQ(result.entry.page_id, 0u);
    EXPECT_EQ(result.entry.slot, 0u);
}

// ── Reopen ───────────────────────────────────────────────────────────────────

TEST_F(PageStoreTest, ReopenRebuildsStateFromPages) {
    {
        PageStore store(path_, kPageSize);
        ASSERT_FALSE(store.open());
        ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(400, 'a')}));
        ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(100, 'b')}));
        ASSERT_FALSE(apply(store, 7, PutOp{"c", "c"}));
    }

    PageStore store(path_, kPageSize);
    std::vector<PageId> seen;
    ASSERT_FALSE(store.open([&](const Page& page) { seen.push_back(page.id()); }));
    EXPECT_EQ(seen, (std::vector<PageId>{0, 1}));
    EXPECT_EQ(store.page_count(), 2u);
    EXPECT_EQ(store.max_applied_seq(), 7u);

    std::size_t live = 0;
    for (PageId id = 0; id < store.page_count(); ++id) {
        Page page(id, kPageSize);
        ASSERT_FALSE(store.read_page(id, page));
        live += page.live_count();
    }
    EXPECT_EQ(live, 3u);
}

TEST_F(PageStoreTest, PartialTrailingPageIsIgnoredThenOverwritten) {
    {
        PageStore store(path_, kPageSize);
        ASSERT_FALSE(store.open());
        ASSERT_FALSE(apply(store, 1, PutOp{"a", std::string(400, 'a')}));
    }
    // Crash while a second page was being appended.
    std::filesystem::resize_file(path_, kPageSize + 100);

    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());
    EXPECT_EQ(store.page_count(), 1u);

    ApplyResult result;
    ASSERT_FALSE(apply(store, 2, PutOp{"b", std::string(300, 'b')}, &result));
    EXPECT_EQ(result.entry.page_id, 1u);
    EXPECT_EQ(std::filesystem::file_size(path_), 2 * kPageSize);
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(PageStoreTest, BitFlipDetectedOnRead) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());
    ASSERT_FALSE(apply(store, 1, PutOp{"key", "value"}));

    flip_byte(kPageSize - 3);

    Page page(0, kPageSize);
    EXPECT_TRUE(is_corruption(store.read_page(0, page)));
    EXPECT_EQ(value_of(store, "key"), "<" + make_error_code(Errc::corruption).message() + ">");
}

TEST_F(PageStoreTest, BitFlipFailsOpen) {
    {
        PageStore store(path_, kPageSize);
        ASSERT_FALSE(store.open());
        ASSERT_FALSE(apply(store, 1, PutOp{"key", "value"}));
    }
    flip_byte(6);  // inside last_applied_seq

    PageStore store(path_, kPageSize);
    EXPECT_TRUE(is_corruption(store.open()));
    EXPECT_FALSE(store.is_open());
}

TEST_F(PageStoreTest, ReadMissingPageIsShortRead) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());
    Page page(0, kPageSize);
    EXPECT_EQ(store.read_page(3, page), make_error_code(Errc::short_read));
}

TEST_F(PageStoreTest, ReadValueRejectsMismatchedKey) {
    PageStore store(path_, kPageSize);
    ASSERT_FALSE(store.open());
    ASSERT_FALSE(apply(store, 1, PutOp{"key", "value"}));

    std::string value;
    IndexEntry wrong{.page_id = 0, .slot = 0, .sequence = 1};
    EXPECT_TRUE(is_corruption(store.read_value(wrong, "other", value)));
}

} // namespace pagekv::storage
