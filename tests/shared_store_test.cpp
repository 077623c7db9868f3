#include "common/errors.hpp"
#include "storage/memory_storage.hpp"
#include "storage/shared_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace pdict {

namespace fs = std::filesystem;

using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

class SharedStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = fs::temp_directory_path() / ("pdict_shared_store_test_" +
            std::to_string(std::hash<std::thread::id>{}(
                std::this_thread::get_id())) +
            "_" + std::to_string(counter_++));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(db_path_, ec);
    }

    fs::path db_path_;
    static inline int counter_ = 0;
};

// ── Handle sharing ────────────────────────────────────────────────────────────

TEST_F(SharedStoreTest, SamePathSharesOneHandle) {
    auto a = SharedStore::open(db_path_);
    auto b = SharedStore::open(db_path_ / ".");
    EXPECT_EQ(a.get(), b.get());

    a->engine().put("k", "v");
    EXPECT_EQ(*b->engine().get("k"), "v");
}

TEST_F(SharedStoreTest, ReopenAfterLastOwnerReleasesHandle) {
    {
        auto a = SharedStore::open(db_path_);
        a->engine().put("k", "v");
    }
    auto b = SharedStore::open(db_path_);
    EXPECT_EQ(*b->engine().get("k"), "v");
}

TEST_F(SharedStoreTest, ReopenWhileAnotherThreadReleasesLastOwner) {
    for (int round = 0; round < 20; ++round) {
        auto owner = SharedStore::open(db_path_);
        owner->engine().put("round", std::to_string(round));

        std::promise<void> go;
        std::shared_future<void> started = go.get_future().share();
        std::thread releaser([owner = std::move(owner), started]() mutable {
            started.wait();
            owner.reset();
        });

        go.set_value();
        std::shared_ptr<SharedStore> reopened;
        EXPECT_NO_THROW(reopened = SharedStore::open(db_path_)) << "round " << round;
        releaser.join();

        ASSERT_TRUE(reopened);
        EXPECT_EQ(reopened->engine().get("round"), std::to_string(round));
    }
}

TEST_F(SharedStoreTest, MemoryStoresAreNeverShared) {
    StoreOptions options;
    options.engine = Engine::Memory;
    auto a = SharedStore::open("mem", options);
    auto b = SharedStore::open("mem", options);
    EXPECT_NE(a.get(), b.get());
}

TEST_F(SharedStoreTest, WrapRejectsNullEngine) {
    EXPECT_THROW((void)SharedStore::wrap(nullptr), std::invalid_argument);
}

// ── Cursors ───────────────────────────────────────────────────────────────────

TEST_F(SharedStoreTest, CursorKeepsStoreAlive) {
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>());
    store->engine().put("a", "1");

    auto cursor = store->cursor();
    std::weak_ptr<SharedStore> weak = store;
    store.reset();

    EXPECT_FALSE(weak.expired());
    ASSERT_TRUE(cursor->valid());
    EXPECT_EQ(cursor->key(), "a");

    cursor.reset();
    EXPECT_TRUE(weak.expired());
}

// ── Locking ───────────────────────────────────────────────────────────────────

TEST_F(SharedStoreTest, SerializedReadsTakeTheGlobalLock) {
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>());
    EXPECT_EQ(store->lock_read("k").held(), 1u);
    EXPECT_EQ(store->lock_write("k").held(), 1u);
    EXPECT_EQ(store->lock_all().held(), 1u);
}

TEST_F(SharedStoreTest, EngineNativeReadsTakeNoLock) {
    StoreOptions options;
    options.isolation = Isolation::EngineNative;
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>(), options);

    EXPECT_EQ(store->lock_read("k").held(), 0u);
    EXPECT_EQ(store->lock_write("k").held(), 1u);
    EXPECT_EQ(store->lock_all().held(), SharedStore::kLockStripes);
}

TEST_F(SharedStoreTest, LockTimeoutRaisesStorageError) {
    StoreOptions options;
    options.lock_timeout = 50ms;
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>(), options);

    auto held = store->lock_write("k");

    auto result = std::async(std::launch::async, [&] {
        try {
            (void)store->lock_write("k");
        } catch (const StorageError& e) {
            return e.code();
        }
        return StorageError::Code::Unknown;
    });
    EXPECT_EQ(result.get(), StorageError::Code::LockTimeout);
}

TEST_F(SharedStoreTest, EngineNativeWritersOnDifferentStripesRunInParallel) {
    StoreOptions options;
    options.isolation    = Isolation::EngineNative;
    options.lock_timeout = 50ms;
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>(), options);

    // Find two keys on different stripes.
    std::string other;
    auto first = store->lock_write("k0");
    for (int i = 1; i < 1000 && other.empty(); ++i) {
        auto candidate = "k" + std::to_string(i);
        auto ok = std::async(std::launch::async, [&] {
            try {
                (void)store->lock_write(candidate);
                return true;
            } catch (const StorageError&) {
                return false;
            }
        });
        if (ok.get()) {
            other = candidate;
        }
    }
    EXPECT_FALSE(other.empty());
}

TEST_F(SharedStoreTest, ZeroTimeoutWaitsForTheLock) {
    StoreOptions options;
    options.lock_timeout = 0ms;
    auto store = SharedStore::wrap(std::make_unique<MemoryStorage>(), options);

    std::atomic<bool> acquired{false};
    std::thread waiter;
    {
        auto held = store->lock_write("k");
        waiter = std::thread([&] {
            auto lock = store->lock_write("k");
            acquired = true;
        });
        std::this_thread::sleep_for(100ms);
        EXPECT_FALSE(acquired.load());
    }
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

} // namespace pdict
