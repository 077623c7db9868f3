#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pdict {

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// Forward-only cursor over an engine's key/value pairs, positioned on the
// first pair when created. key()/value() are only meaningful while valid();
// the views they return stay valid until the next call to next().

class Cursor {
public:
    virtual ~Cursor() = default;

    [[nodiscard]] virtual bool valid() const = 0;
    virtual void next() = 0;

    [[nodiscard]] virtual std::string_view key() const = 0;
    [[nodiscard]] virtual std::string_view value() const = 0;
};

// ── StorageEngine ────────────────────────────────────────────────────────────
//
// Byte-string key-value backend underneath the dictionary.
//
// Implementations must be thread-safe per handle: concurrent calls from many
// threads are allowed and every single call is atomic. Anything composed of
// several calls (read-modify-write) is serialised one level up by SharedStore.
//
// Error contract:
//   - a missing key is not an error: get() returns std::nullopt, del()
//     returns false;
//   - engine failures throw StorageError with the native status as cause();
//   - every call after close() throws ClosedError; close() is idempotent.

class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) const = 0;

    // Inserts or overwrites `key` with `value`.
    virtual void put(std::string_view key, std::string_view value) = 0;

    // Removes `key`.  Returns true if the key existed, false otherwise.
    virtual bool del(std::string_view key) = 0;

    [[nodiscard]] virtual bool contains(std::string_view key) const = 0;

    // Returns the number of stored key-value pairs.
    [[nodiscard]] virtual std::size_t size() const = 0;

    // Removes all entries atomically.
    virtual void clear() = 0;

    // Lazy cursor over all pairs. Order is engine-defined.
    [[nodiscard]] virtual std::unique_ptr<Cursor> cursor() const = 0;

    // Makes completed writes durable.
    virtual void flush() = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    // Short engine name for logs ("rocksdb", "memory").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace pdict
