#include "storage/memory_storage.hpp"

#include "common/errors.hpp"

#include <mutex>
#include <utility>
#include <vector>

namespace pdict {

namespace {

class SnapshotCursor final : public Cursor {
public:
    explicit SnapshotCursor(std::vector<std::pair<std::string, std::string>> pairs)
        : pairs_(std::move(pairs))
    {}

    [[nodiscard]] bool valid() const override { return pos_ < pairs_.size(); }
    void next() override { ++pos_; }

    [[nodiscard]] std::string_view key() const override { return pairs_[pos_].first; }
    [[nodiscard]] std::string_view value() const override { return pairs_[pos_].second; }

private:
    std::vector<std::pair<std::string, std::string>> pairs_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

void MemoryStorage::require_open() const {
    if (closed_) {
        throw ClosedError("Memory storage is closed");
    }
}

std::optional<std::string> MemoryStorage::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    require_open();
    // std::unordered_map supports heterogeneous lookup via find(string_view)
    // only with a transparent hash; a local string keeps it simple.
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::put(std::string_view key, std::string_view value) {
    std::unique_lock lock(mutex_);
    require_open();
    map_.insert_or_assign(std::string(key), std::string(value));
}

bool MemoryStorage::del(std::string_view key) {
    std::unique_lock lock(mutex_);
    require_open();
    return map_.erase(std::string(key)) > 0;
}

bool MemoryStorage::contains(std::string_view key) const {
    std::shared_lock lock(mutex_);
    require_open();
    return map_.contains(std::string(key));
}

std::size_t MemoryStorage::size() const {
    std::shared_lock lock(mutex_);
    require_open();
    return map_.size();
}

void MemoryStorage::clear() {
    std::unique_lock lock(mutex_);
    require_open();
    map_.clear();
}

std::unique_ptr<Cursor> MemoryStorage::cursor() const {
    std::shared_lock lock(mutex_);
    require_open();
    return std::make_unique<SnapshotCursor>(
        std::vector<std::pair<std::string, std::string>>(map_.begin(), map_.end()));
}

void MemoryStorage::flush() {
    std::shared_lock lock(mutex_);
    require_open();
}

void MemoryStorage::close() {
    std::unique_lock lock(mutex_);
    closed_ = true;
    map_.clear();
}

bool MemoryStorage::is_open() const noexcept {
    std::shared_lock lock(mutex_);
    return !closed_;
}

} // namespace pdict
