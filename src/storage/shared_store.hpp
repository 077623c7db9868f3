#pragma once

#include "storage/storage_engine.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pdict {

// ── Store options ─────────────────────────────────────────────────────────────

enum class Engine : uint8_t {
    RocksDB = 0,
    Memory  = 1,
};

// How concurrent callers are serialised on one SharedStore.
//   Serialized   – one mutex guards every engine call (default).
//   EngineNative – reads go straight to the (thread-safe) engine; mutations
//                  take a striped per-key lock so read-modify-write stays
//                  atomic per key while different keys run in parallel.
enum class Isolation : uint8_t {
    Serialized   = 0,
    EngineNative = 1,
};

[[nodiscard]] std::string_view to_string(Engine engine) noexcept;
[[nodiscard]] std::string_view to_string(Isolation isolation) noexcept;

struct StoreOptions {
    Engine    engine    = Engine::RocksDB;
    Isolation isolation = Isolation::Serialized;

    // How long a caller waits for a lock before StorageError(LockTimeout).
    // Zero waits forever.
    std::chrono::milliseconds lock_timeout{10'000};

    // fsync the RocksDB WAL on every write.
    bool sync_writes = false;
};

// ── StoreLock ─────────────────────────────────────────────────────────────────
// Move-only RAII bundle of the locks one operation holds. May hold none
// (reads under EngineNative).

class StoreLock {
public:
    StoreLock() = default;

    StoreLock(StoreLock&&) noexcept            = default;
    StoreLock& operator=(StoreLock&&) noexcept = default;
    StoreLock(const StoreLock&)                = delete;
    StoreLock& operator=(const StoreLock&)     = delete;

    void adopt(std::unique_lock<std::timed_mutex> lock) { locks_.push_back(std::move(lock)); }

    [[nodiscard]] std::size_t held() const noexcept { return locks_.size(); }

private:
    std::vector<std::unique_lock<std::timed_mutex>> locks_;
};

// ── SharedStore ───────────────────────────────────────────────────────────────
//
// The one engine handle shared by every PersistentDict on the same database,
// together with the locking discipline that protects it.
//
// open() keeps a process-wide registry keyed by canonical path, so two
// dictionaries opened on the same RocksDB path share one handle (RocksDB
// refuses a second open of the same directory). The engine is closed when the
// last owner (dictionary or cursor) releases it.

class SharedStore : public std::enable_shared_from_this<SharedStore> {
    struct Private {};

public:
    static constexpr std::size_t kLockStripes = 64;

    // Open the store at `path`, or return the live handle already open on it.
    // Memory stores are never shared; `path` only names them in logs.
    // Throws StorageError if the engine cannot be opened.
    [[nodiscard]] static std::shared_ptr<SharedStore> open(
        const std::filesystem::path& path, const StoreOptions& options = {});

    // Adopt an already-open engine. Not registered for sharing by path.
    [[nodiscard]] static std::shared_ptr<SharedStore> wrap(
        std::unique_ptr<StorageEngine> engine, const StoreOptions& options = {},
        std::string name = "custom");

    SharedStore(Private, std::unique_ptr<StorageEngine> engine,
                StoreOptions options, std::string name);
    ~SharedStore();

    SharedStore(const SharedStore&)            = delete;
    SharedStore& operator=(const SharedStore&) = delete;

    // Lock for a single read of `key`.
    [[nodiscard]] StoreLock lock_read(std::string_view key) const;

    // Lock for a (read-modify-)write of `key`.
    [[nodiscard]] StoreLock lock_write(std::string_view key) const;

    // Lock excluding every other reader and writer that takes a write lock.
    [[nodiscard]] StoreLock lock_all() const;

    [[nodiscard]] StorageEngine& engine() noexcept { return *engine_; }
    [[nodiscard]] const StorageEngine& engine() const noexcept { return *engine_; }

    // Engine cursor that keeps this store alive until it is destroyed.
    [[nodiscard]] std::unique_ptr<Cursor> cursor() const;

    void flush();

    [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    [[nodiscard]] std::unique_lock<std::timed_mutex> acquire(
        std::timed_mutex& mutex, std::string_view what) const;

    [[nodiscard]] std::timed_mutex& stripe_for(std::string_view key) const;

    std::unique_ptr<StorageEngine> engine_;
    StoreOptions options_;
    std::string name_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::timed_mutex global_mutex_;
    mutable std::array<std::timed_mutex, kLockStripes> stripes_;
};

} // namespace pdict
