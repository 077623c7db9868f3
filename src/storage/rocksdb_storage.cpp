#include "storage/rocksdb_storage.hpp"

#include "common/errors.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <mutex>

namespace pdict {

namespace {

StorageError::Code code_of(const rocksdb::Status& status) {
    // NoSpace is an IOError subcode, test it first.
    if (status.IsNoSpace())         return StorageError::Code::NoSpace;
    if (status.IsIOError())         return StorageError::Code::Io;
    if (status.IsCorruption())      return StorageError::Code::Corruption;
    if (status.IsBusy() || status.IsTryAgain()) return StorageError::Code::Busy;
    if (status.IsTimedOut())        return StorageError::Code::LockTimeout;
    if (status.IsInvalidArgument() || status.IsNotSupported()) {
        return StorageError::Code::InvalidArgument;
    }
    return StorageError::Code::Unknown;
}

[[noreturn]] void throw_status(const rocksdb::Status& status, std::string_view what) {
    spdlog::error("RocksDB {} failed: {}", what, status.ToString());
    throw StorageError(code_of(status), fmt::format("RocksDB {} failed", what),
                       status.ToString());
}

rocksdb::Slice to_slice(std::string_view sv) {
    return rocksdb::Slice{sv.data(), sv.size()};
}

// ── RocksDBCursor ────────────────────────────────────────────────────────────
// Iterators see an implicit snapshot taken at creation.

class RocksDBCursor final : public Cursor {
public:
    explicit RocksDBCursor(rocksdb::Iterator* it)
        : it_(it)
    {
        it_->SeekToFirst();
        check();
    }

    [[nodiscard]] bool valid() const override { return it_->Valid(); }

    void next() override {
        it_->Next();
        check();
    }

    [[nodiscard]] std::string_view key() const override {
        const auto k = it_->key();
        return {k.data(), k.size()};
    }

    [[nodiscard]] std::string_view value() const override {
        const auto v = it_->value();
        return {v.data(), v.size()};
    }

private:
    void check() const {
        if (!it_->Valid() && !it_->status().ok()) {
            throw_status(it_->status(), "iteration");
        }
    }

    std::unique_ptr<rocksdb::Iterator> it_;
};

} // anonymous namespace

RocksDBStorage::RocksDBStorage(const std::filesystem::path& db_path, bool sync_writes)
    : path_(db_path)
    , sync_writes_(sync_writes)
{
    // RocksDB creates the last path component only.
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StorageError(StorageError::Code::Io,
                               "Failed to create parent directory of " + path_.string(),
                               ec.message());
        }
    }

    rocksdb::Options options;
    options.create_if_missing = true;

    // Optimise for small-to-medium working sets typical of a cache.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, path_.string(), &raw_db);
    if (!status.ok()) {
        throw StorageError(code_of(status), "Failed to open RocksDB at " + path_.string(),
                           status.ToString());
    }
    db_.reset(raw_db);
    spdlog::info("RocksDB opened at {}", path_.string());
}

RocksDBStorage::~RocksDBStorage() {
    try {
        close();
    } catch (const Error& e) {
        spdlog::error("RocksDB close on destruction failed: {}", e.what());
    }
}

std::optional<std::string> RocksDBStorage::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions{}, to_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw_status(status, "Get");
    }
    return value;
}

void RocksDBStorage::put(std::string_view key, std::string_view value) {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = sync_writes_;
    auto status = db_->Put(write_options, to_slice(key), to_slice(value));
    if (!status.ok()) {
        throw_status(status, "Put");
    }
}

bool RocksDBStorage::del(std::string_view key) {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    // RocksDB Delete succeeds on a missing key; check existence first.
    std::string existing;
    auto get_status = db_->Get(rocksdb::ReadOptions{}, to_slice(key), &existing);
    if (get_status.IsNotFound()) {
        return false;
    }
    if (!get_status.ok()) {
        throw_status(get_status, "Get");
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = sync_writes_;
    auto status = db_->Delete(write_options, to_slice(key));
    if (!status.ok()) {
        throw_status(status, "Delete");
    }
    return true;
}

bool RocksDBStorage::contains(std::string_view key) const {
    return get(key).has_value();
}

std::size_t RocksDBStorage::size() const {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    std::size_t count = 0;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    if (!it->status().ok()) {
        throw_status(it->status(), "iteration");
    }
    return count;
}

void RocksDBStorage::clear() {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    // Delete all keys via a WriteBatch.
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        batch.Delete(it->key());
    }
    if (!it->status().ok()) {
        throw_status(it->status(), "iteration");
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = sync_writes_;
    auto status = db_->Write(write_options, &batch);
    if (!status.ok()) {
        throw_status(status, "clear");
    }
}

std::unique_ptr<Cursor> RocksDBStorage::cursor() const {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }
    return std::make_unique<RocksDBCursor>(db_->NewIterator(rocksdb::ReadOptions{}));
}

void RocksDBStorage::flush() {
    std::shared_lock lock(mutex_);
    if (!db_) {
        throw ClosedError("RocksDB storage is closed");
    }

    auto status = db_->FlushWAL(/*sync=*/true);
    if (!status.ok()) {
        throw_status(status, "FlushWAL");
    }
}

void RocksDBStorage::close() {
    std::unique_lock lock(mutex_);
    if (!db_) {
        return;
    }

    spdlog::info("Closing RocksDB at {}", path_.string());
    auto status = db_->Close();
    db_.reset();
    if (!status.ok()) {
        throw_status(status, "Close");
    }
}

bool RocksDBStorage::is_open() const noexcept {
    std::shared_lock lock(mutex_);
    return db_ != nullptr;
}

} // namespace pdict
