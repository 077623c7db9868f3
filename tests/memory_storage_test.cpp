#include "common/errors.hpp"
#include "storage/memory_storage.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace pdict {

// ── Fixture ───────────────────────────────────────────────────────────────────

class MemoryStorageTest : public ::testing::Test {
protected:
    // Collect every key visible through a fresh cursor.
    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        for (auto c = storage_.cursor(); c->valid(); c->next()) {
            out.emplace_back(c->key());
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    MemoryStorage storage_;
};

// ── get() ─────────────────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, GetReturnsNulloptForMissingKey) {
    EXPECT_FALSE(storage_.get("nonexistent").has_value());
}

TEST_F(MemoryStorageTest, GetReturnsNulloptOnEmptyStore) {
    EXPECT_FALSE(storage_.get("").has_value());
}

// ── put() / get() ─────────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, PutAndGetReturnsStoredValue) {
    storage_.put("key1", "value1");
    auto result = storage_.get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");
}

TEST_F(MemoryStorageTest, PutOverwritesExistingKey) {
    storage_.put("key", "first");
    storage_.put("key", "second");
    EXPECT_EQ(*storage_.get("key"), "second");
}

TEST_F(MemoryStorageTest, PutHandlesEmptyKeyAndValue) {
    storage_.put("", "");
    auto result = storage_.get("");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "");
}

TEST_F(MemoryStorageTest, PutHandlesBinaryValue) {
    const std::string blob("a\0b\xff", 4);
    storage_.put("bin", blob);
    EXPECT_EQ(*storage_.get("bin"), blob);
}

TEST_F(MemoryStorageTest, ContainsTracksPutAndDel) {
    EXPECT_FALSE(storage_.contains("k"));
    storage_.put("k", "v");
    EXPECT_TRUE(storage_.contains("k"));
    storage_.del("k");
    EXPECT_FALSE(storage_.contains("k"));
}

// ── del() ─────────────────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, DelReturnsTrueForExistingKey) {
    storage_.put("key", "value");
    EXPECT_TRUE(storage_.del("key"));
}

TEST_F(MemoryStorageTest, DelIdempotentOnMissingKey) {
    storage_.put("key", "value");
    EXPECT_TRUE(storage_.del("key"));
    EXPECT_FALSE(storage_.del("key"));
    EXPECT_EQ(storage_.size(), 0u);
}

// ── cursor() ──────────────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, CursorIsInvalidWhenEmpty) {
    EXPECT_FALSE(storage_.cursor()->valid());
}

TEST_F(MemoryStorageTest, CursorVisitsAllPairs) {
    storage_.put("alpha", "1");
    storage_.put("beta", "2");
    storage_.put("gamma", "3");

    EXPECT_EQ(keys(), (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST_F(MemoryStorageTest, CursorIsUnaffectedByLaterWrites) {
    storage_.put("key", "original");
    auto c = storage_.cursor();

    storage_.put("key", "modified");
    storage_.put("other", "x");

    ASSERT_TRUE(c->valid());
    EXPECT_EQ(c->value(), "original");
    c->next();
    EXPECT_FALSE(c->valid());
}

// ── size() / clear() ──────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, SizeTracksPutAndDel) {
    storage_.put("a", "1");
    storage_.put("b", "2");
    storage_.put("b", "3");
    EXPECT_EQ(storage_.size(), 2u);
    storage_.del("a");
    EXPECT_EQ(storage_.size(), 1u);
}

TEST_F(MemoryStorageTest, ClearRemovesAllEntries) {
    storage_.put("a", "1");
    storage_.put("b", "2");
    storage_.clear();
    EXPECT_EQ(storage_.size(), 0u);
    EXPECT_FALSE(storage_.get("a").has_value());
}

// ── close() ───────────────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, CloseIsIdempotentAndRejectsLaterCalls) {
    storage_.put("a", "1");
    storage_.close();
    EXPECT_NO_THROW(storage_.close());
    EXPECT_FALSE(storage_.is_open());

    EXPECT_THROW((void)storage_.get("a"), ClosedError);
    EXPECT_THROW(storage_.put("a", "2"), ClosedError);
    EXPECT_THROW((void)storage_.cursor(), ClosedError);
}

// ── Concurrent access ─────────────────────────────────────────────────────────

TEST_F(MemoryStorageTest, ConcurrentWritersNoDataLoss) {
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> writers;
    writers.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                storage_.put("t" + std::to_string(t) + "_k" + std::to_string(i),
                             std::to_string(i));
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(storage_.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// Readers never see a torn value while one writer keeps overwriting.
TEST_F(MemoryStorageTest, ConcurrentReadersAndOneWriter) {
    storage_.put("shared", std::string(64, 'a'));

    std::atomic<bool> stop{false};
    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            storage_.put("shared", std::string(64, i % 2 ? 'b' : 'a'));
        }
        stop = true;
    });

    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop) {
                auto v = storage_.get("shared");
                if (!v || v->size() != 64 ||
                    v->find_first_not_of(v->front()) != std::string::npos) {
                    ++torn;
                }
            }
        });
    }

    writer.join();
    for (auto& r : readers) r.join();
    EXPECT_EQ(torn.load(), 0);
}

} // namespace pdict
