#pragma once

#include "codec/codec_pipeline.hpp"
#include "codec/value.hpp"
#include "entry/entry.hpp"
#include "storage/shared_store.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace pdict {

// ── DictOptions ───────────────────────────────────────────────────────────────

struct DictOptions {
    Engine    engine    = Engine::RocksDB;
    Isolation isolation = Isolation::Serialized;
    std::chrono::milliseconds lock_timeout{10'000};
    bool sync_writes = false;

    // zlib level used when `compressor` is null.
    int compress_level = ZlibCompressor::kDefaultLevel;

    // Codec stage overrides; null selects ProtobufSerializer / ZlibCompressor.
    std::shared_ptr<const Serializer> serializer;
    std::shared_ptr<const Compressor> compressor;

    [[nodiscard]] StoreOptions store_options() const;
    [[nodiscard]] CodecPipeline pipeline() const;
};

// ── CursorRange ───────────────────────────────────────────────────────────────
//
// Lazy single-pass view over the dictionary. Every begin() opens a fresh
// engine cursor, so a range can be walked again. Iteration takes no dictionary
// lock: concurrent writers may or may not be observed (weakly consistent),
// but each element is a complete Entry.

template <typename T>
class CursorRange {
public:
    using Opener    = std::function<std::unique_ptr<Cursor>()>;
    using Projector = std::function<T(std::string_view key, std::string_view blob)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        iterator() = default;

        iterator(std::shared_ptr<Cursor> cursor, std::shared_ptr<const Projector> project)
            : cursor_(std::move(cursor))
            , project_(std::move(project))
        {
            load();
        }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            cursor_->next();
            load();
            return *this;
        }

        void operator++(int) { ++*this; }

        // Only exhausted iterators compare equal to end().
        friend bool operator==(const iterator& lhs, const iterator& rhs) {
            return lhs.cursor_ == rhs.cursor_;
        }

    private:
        void load() {
            if (!cursor_->valid()) {
                cursor_.reset();
                return;
            }
            current_ = (*project_)(cursor_->key(), cursor_->value());
        }

        std::shared_ptr<Cursor> cursor_;
        std::shared_ptr<const Projector> project_;
        T current_{};
    };

    CursorRange(Opener open, Projector project)
        : open_(std::move(open))
        , project_(std::make_shared<const Projector>(std::move(project)))
    {}

    [[nodiscard]] iterator begin() const { return iterator(open_(), project_); }
    [[nodiscard]] iterator end() const { return iterator{}; }

private:
    Opener open_;
    std::shared_ptr<const Projector> project_;
};

using KeyRange   = CursorRange<std::string>;
using ValueRange = CursorRange<Value>;
using ItemRange  = CursorRange<std::pair<std::string, Entry>>;

// ── PersistentDict ────────────────────────────────────────────────────────────
//
// Dictionary of Key -> Entry persisted in an embedded store.
//
// Thread-safe: one instance may be used from any number of threads. get, set,
// meta, del and contains are each atomic with respect to one another on the
// same key; concurrent set()s on one key resolve last-writer-wins.
//
// Errors:
//   - a missing key is never an error for get/get_value/contains/del;
//   - at() and meta(key) throw KeyNotFoundError for a missing key;
//   - undecodable stored entries throw CorruptionError or SerializationError;
//   - engine failures and lock timeouts throw StorageError;
//   - every call except close() throws ClosedError once closed.
//
// States: Open (after construction) -> Closed (after close(), terminal).

class PersistentDict {
public:
    // Open (or create) the store at `path`. Another PersistentDict already open
    // on the same RocksDB path shares its engine handle.
    explicit PersistentDict(const std::filesystem::path& path, DictOptions options = {});

    // Use an explicitly shared store. The isolation of `store` wins over
    // options.isolation.
    PersistentDict(std::shared_ptr<SharedStore> store, DictOptions options = {});

    ~PersistentDict();

    PersistentDict(const PersistentDict&)            = delete;
    PersistentDict& operator=(const PersistentDict&) = delete;

    // ── Lookup ────────────────────────────────────────────────────────────

    [[nodiscard]] bool contains(std::string_view key) const;

    [[nodiscard]] std::optional<Entry> get(std::string_view key) const;
    [[nodiscard]] Entry get(std::string_view key, Entry fallback) const;

    [[nodiscard]] std::optional<Value> get_value(std::string_view key) const;
    [[nodiscard]] Value get_value(std::string_view key, Value fallback) const;

    // Value of `key`; throws KeyNotFoundError if absent.
    [[nodiscard]] Value at(std::string_view key) const;

    // ── Mutation ──────────────────────────────────────────────────────────

    // Upsert. A new key gets empty metadata; an existing key keeps its
    // metadata and created_at and gets a fresh updated_at.
    void set(std::string_view key, Value value);

    // Metadata of `key`; throws KeyNotFoundError if absent.
    [[nodiscard]] Value meta(std::string_view key) const;

    // Replace only the metadata of `key`. Value and timestamps are kept.
    // Returns false (and writes nothing) if the key is absent.
    bool meta(std::string_view key, Value metadata);

    // Remove `key`. Returns whether it existed; a missing key is a no-op.
    bool del(std::string_view key);

    // Remove every entry.
    void clear();

    // Copy every entry of `other` (value, metadata and timestamps). Keys
    // already present are kept unless `overwrite`. Returns entries copied.
    std::size_t merge(const PersistentDict& other, bool overwrite = false);

    // ── Iteration ─────────────────────────────────────────────────────────

    [[nodiscard]] KeyRange keys() const;
    [[nodiscard]] ValueRange values() const;
    [[nodiscard]] ItemRange items() const;

    [[nodiscard]] std::size_t size() const;

    // ── Lifecycle ─────────────────────────────────────────────────────────

    // New dictionary on the same store handle with the same options.
    [[nodiscard]] std::unique_ptr<PersistentDict> share() const;

    // Flush and release the store handle. Idempotent.
    void close();
    [[nodiscard]] bool is_closed() const;

    // The shared store; throws ClosedError once closed.
    [[nodiscard]] std::shared_ptr<SharedStore> store() const;

    [[nodiscard]] const DictOptions& options() const noexcept { return options_; }

private:
    // Open/closed state, shared with the ranges handed out by keys()/items()
    // so they observe close().
    struct State {
        mutable std::shared_mutex mutex;
        std::shared_ptr<SharedStore> store;   // null once closed
    };

    [[nodiscard]] static std::shared_ptr<SharedStore> acquire(const State& state);
    [[nodiscard]] std::shared_ptr<SharedStore> acquire() const { return acquire(*state_); }
    [[nodiscard]] CursorRange<std::string>::Opener opener() const;

    DictOptions options_;
    EntryCodec codec_;
    std::shared_ptr<State> state_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pdict
