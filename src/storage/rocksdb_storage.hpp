#pragma once

#include "storage/storage_engine.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace pdict {

// ── RocksDBStorage ──────────────────────────────────────────────────────────
//
// Persistent key-value storage backed by RocksDB.
//
// Thread safety is delegated to RocksDB itself: DB::Get/Put/Delete and
// iterators are safe for concurrent use from multiple threads. A shared_mutex
// only keeps close() from tearing the DB down under a running call.
//
// The database directory (and any missing parent) is created on construction.
// Every non-OK rocksdb::Status is rethrown as StorageError.

class RocksDBStorage final : public StorageEngine {
public:
    // Opens (or creates) a RocksDB database at `db_path`.
    // `sync_writes` fsyncs the WAL on every put/del/clear.
    // Throws StorageError if the database cannot be opened.
    explicit RocksDBStorage(const std::filesystem::path& db_path,
                            bool sync_writes = false);

    ~RocksDBStorage() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBStorage(const RocksDBStorage&)            = delete;
    RocksDBStorage& operator=(const RocksDBStorage&) = delete;
    RocksDBStorage(RocksDBStorage&&)                 = delete;
    RocksDBStorage& operator=(RocksDBStorage&&)      = delete;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const override;
    void put(std::string_view key, std::string_view value) override;
    bool del(std::string_view key) override;
    [[nodiscard]] bool contains(std::string_view key) const override;
    [[nodiscard]] std::size_t size() const override;
    void clear() override;
    [[nodiscard]] std::unique_ptr<Cursor> cursor() const override;
    void flush() override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override { return "rocksdb"; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    bool sync_writes_;
    mutable std::shared_mutex mutex_;
    std::unique_ptr<rocksdb::DB> db_;
};

} // namespace pdict
