#pragma once

#include "storage/storage_engine.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pdict {

// Thread-safe, non-persistent engine backed by std::unordered_map.
//
// Concurrency model:
//   - get() / contains() / size() / cursor() acquire a shared (read) lock.
//   - put() / del() / clear() / close() acquire an exclusive (write) lock.
//   Multiple concurrent readers are allowed; writers are exclusive.
//
// cursor() copies the map under the read lock; later writes are not seen by
// an existing cursor.
class MemoryStorage final : public StorageEngine {
public:
    MemoryStorage() = default;

    // Not copyable – copies of a live store would silently race.
    MemoryStorage(const MemoryStorage&)            = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

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
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

private:
    void require_open() const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> map_;
    bool closed_ = false;
};

} // namespace pdict
