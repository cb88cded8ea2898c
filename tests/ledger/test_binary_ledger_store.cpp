#include <gtest/gtest.h>
#include "ledger/binary_ledger_store.h"
#include "ledger/ledger_format.h"
#include "ledger/ledger_reader.h"
#include "core/records.h"
#include "core/types.h"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

namespace matchbook {
namespace test {

static LedgerOrder makeLedgerOrder(const std::string& id, Side side, PriceTicks price,
                                   Quantity qty, Quantity original, OrderStatus status) {
    LedgerOrder o;
    o.id = id;
    o.side = side;
    o.price = price;
    o.quantity = qty;
    o.original_quantity = original;
    o.status = status;
    o.created_ns = 100;
    o.updated_ns = 100;
    return o;
}

static LedgerCycle makeCycle(uint64_t n) {
    LedgerCycle c;
    c.cycle = n;
    c.ts_ns = 1000 + n;
    c.entries.push_back(makePutEntry(makeLedgerOrder("o" + std::to_string(n), Side::BUY,
                                                     50000, 10, 10, OrderStatus::OPEN)));
    return c;
}

class BinaryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = testing::TempDir() + "test_ledger_store_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".mbl";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(BinaryLedgerStoreTest, NewFileHasHeaderOnly) {
    {
        BinaryLedgerStore store(path_);
        EXPECT_TRUE(store.isOpen());
        EXPECT_EQ(store.committedBytes(), sizeof(LedgerFileHeader));
    }

    std::FILE* f = std::fopen(path_.c_str(), "rb");
    ASSERT_NE(f, nullptr);
    LedgerFileHeader hdr{};
    ASSERT_EQ(std::fread(&hdr, sizeof(hdr), 1, f), 1u);
    std::fclose(f);

    EXPECT_TRUE(validateMagic(hdr));
    EXPECT_EQ(hdr.version_major, kLedgerVersionMajor);
    EXPECT_EQ(hdr.price_scale, kPriceScale);
    EXPECT_EQ(std::filesystem::file_size(path_), sizeof(LedgerFileHeader));
}

TEST_F(BinaryLedgerStoreTest, CommitLayoutIsHeaderPayloadTrailer) {
    {
        BinaryLedgerStore store(path_);
        store.commit(makeCycle(1));
        EXPECT_EQ(store.commitsWritten(), 1u);
    }

    std::FILE* f = std::fopen(path_.c_str(), "rb");
    ASSERT_NE(f, nullptr);
    std::fseek(f, sizeof(LedgerFileHeader), SEEK_SET);
    CommitHeader chdr{};
    ASSERT_EQ(std::fread(&chdr, sizeof(chdr), 1, f), 1u);
    EXPECT_EQ(chdr.cycle, 1u);
    EXPECT_EQ(chdr.ts_ns, 1001u);
    EXPECT_EQ(chdr.record_count, 1u);
    EXPECT_GT(chdr.compressed_size, 0u);

    std::fseek(f, static_cast<long>(chdr.compressed_size), SEEK_CUR);
    CommitTrailer trailer{};
    ASSERT_EQ(std::fread(&trailer, sizeof(trailer), 1, f), 1u);
    std::fclose(f);

    EXPECT_TRUE(validateTrailer(trailer, chdr));
    EXPECT_EQ(std::filesystem::file_size(path_),
              sizeof(LedgerFileHeader) + sizeof(CommitHeader) + chdr.compressed_size +
                  sizeof(CommitTrailer));
}

TEST_F(BinaryLedgerStoreTest, ReopenAppendsAfterExistingCommits) {
    {
        BinaryLedgerStore store(path_);
        store.commit(makeCycle(1));
        store.commit(makeCycle(2));
    }
    {
        BinaryLedgerStore store(path_);
        store.commit(makeCycle(3));
    }

    LedgerReader reader(path_);
    ASSERT_EQ(reader.commitCount(), 3u);
    EXPECT_EQ(reader.cycles()[0].cycle, 1u);
    EXPECT_EQ(reader.cycles()[2].cycle, 3u);
    EXPECT_EQ(reader.cycles()[2].entries[0].order.id, "o3");
    EXPECT_FALSE(reader.hasTornTail());
}

TEST_F(BinaryLedgerStoreTest, ReopenTruncatesTornTail) {
    uint64_t good_end = 0;
    {
        BinaryLedgerStore store(path_);
        store.commit(makeCycle(1));
        good_end = store.committedBytes();
    }

    // Simulate a crash half way through the next commit.
    {
        std::FILE* f = std::fopen(path_.c_str(), "ab");
        ASSERT_NE(f, nullptr);
        CommitHeader partial{};
        partial.compressed_size = 500;
        partial.uncompressed_size = 900;
        partial.record_count = 3;
        partial.cycle = 2;
        std::fwrite(&partial, sizeof(partial), 1, f);
        const char junk[40] = {1, 2, 3};
        std::fwrite(junk, 1, sizeof(junk), f);
        std::fclose(f);
    }
    EXPECT_GT(std::filesystem::file_size(path_), good_end);

    {
        BinaryLedgerStore store(path_);
        EXPECT_EQ(store.committedBytes(), good_end);
        EXPECT_EQ(std::filesystem::file_size(path_), good_end);
        store.commit(makeCycle(2));
    }

    LedgerReader reader(path_);
    ASSERT_EQ(reader.commitCount(), 2u);
    EXPECT_EQ(reader.cycles()[1].entries[0].order.id, "o2");
    EXPECT_FALSE(reader.hasTornTail());
}

TEST_F(BinaryLedgerStoreTest, RecreatesFileWithIncompleteHeader) {
    {
        std::FILE* f = std::fopen(path_.c_str(), "wb");
        ASSERT_NE(f, nullptr);
        std::fwrite(kLedgerMagic, 1, 5, f);
        std::fclose(f);
    }

    {
        BinaryLedgerStore store(path_);
        EXPECT_EQ(store.committedBytes(), sizeof(LedgerFileHeader));
        store.commit(makeCycle(1));
    }

    LedgerReader reader(path_);
    EXPECT_TRUE(validateMagic(reader.header()));
    ASSERT_EQ(reader.commitCount(), 1u);
    EXPECT_EQ(reader.cycles()[0].entries[0].order.id, "o1");
}

TEST_F(BinaryLedgerStoreTest, RejectsForeignFile) {
    {
        std::FILE* f = std::fopen(path_.c_str(), "wb");
        ASSERT_NE(f, nullptr);
        const char junk[64] = "definitely not a ledger file";
        std::fwrite(junk, 1, sizeof(junk), f);
        std::fclose(f);
    }
    EXPECT_THROW(BinaryLedgerStore store(path_), std::runtime_error);
}

TEST_F(BinaryLedgerStoreTest, CommitAfterCloseThrows) {
    BinaryLedgerStore store(path_);
    store.close();
    store.close();
    EXPECT_FALSE(store.isOpen());
    EXPECT_THROW(store.commit(makeCycle(1)), std::runtime_error);
}

TEST_F(BinaryLedgerStoreTest, UnwritableDirectoryThrows) {
    EXPECT_THROW(BinaryLedgerStore store(testing::TempDir() + "no_such_dir_mb/x.mbl"),
                 std::runtime_error);
}

}  // namespace test
}  // namespace matchbook
