#include "storage/shared_store.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "storage/memory_storage.hpp"
#include "storage/rocksdb_storage.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace pdict {

namespace {

// ── Process-wide registry of open RocksDB stores ──────────────────────────────

// An entry stays registered until its engine has closed, so open() can tell
// a live store from one still releasing its files.
struct Registry {
    std::mutex mutex;
    std::condition_variable closed;
    std::unordered_map<std::string, std::weak_ptr<SharedStore>> stores;
};

Registry& registry() {
    static Registry r;
    return r;
}

std::string registry_key(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(std::filesystem::absolute(path), ec);
    if (ec) {
        return std::filesystem::absolute(path).lexically_normal().string();
    }
    return canonical.string();
}

std::string store_name(const std::filesystem::path& path) {
    auto name = path.filename().string();
    return name.empty() ? path.string() : name;
}

// ── PinnedCursor ─────────────────────────────────────────────────────────────
// Owns a reference to the store so the engine outlives the cursor.

class PinnedCursor final : public Cursor {
public:
    PinnedCursor(std::shared_ptr<const SharedStore> store, std::unique_ptr<Cursor> inner)
        : store_(std::move(store))
        , inner_(std::move(inner))
    {}

    [[nodiscard]] bool valid() const override { return inner_->valid(); }
    void next() override { inner_->next(); }
    [[nodiscard]] std::string_view key() const override { return inner_->key(); }
    [[nodiscard]] std::string_view value() const override { return inner_->value(); }

private:
    // Declared first: destroyed after inner_.
    std::shared_ptr<const SharedStore> store_;
    std::unique_ptr<Cursor> inner_;
};

} // anonymous namespace

std::string_view to_string(Engine engine) noexcept {
    switch (engine) {
        case Engine::RocksDB: return "rocksdb";
        case Engine::Memory:  return "memory";
    }
    return "unknown";
}

std::string_view to_string(Isolation isolation) noexcept {
    switch (isolation) {
        case Isolation::Serialized:   return "serialized";
        case Isolation::EngineNative: return "engine-native";
    }
    return "unknown";
}

// ── SharedStore::open / wrap ─────────────────────────────────────────────────

std::shared_ptr<SharedStore> SharedStore::open(const std::filesystem::path& path,
                                               const StoreOptions& options) {
    if (options.engine == Engine::Memory) {
        return wrap(std::make_unique<MemoryStorage>(), options, store_name(path));
    }

    auto& reg = registry();
    const std::string key = registry_key(path);

    std::unique_lock lock(reg.mutex);

    for (;;) {
        auto it = reg.stores.find(key);
        if (it == reg.stores.end()) {
            break;
        }
        if (auto existing = it->second.lock()) {
            if (existing->options().isolation != options.isolation) {
                existing->logger()->warn(
                    "Store already open with isolation={}, ignoring requested {}",
                    to_string(existing->options().isolation),
                    to_string(options.isolation));
            }
            existing->logger()->debug("Sharing open store handle for {}", key);
            return existing;
        }
        // Last owner gone, engine still closing.
        reg.closed.wait(lock);
    }

    auto engine = std::make_unique<RocksDBStorage>(path, options.sync_writes);
    std::shared_ptr<SharedStore> store(
        new SharedStore(Private{}, std::move(engine), options, store_name(path)),
        [key](SharedStore* expiring) {
            delete expiring;
            auto& r = registry();
            {
                std::lock_guard relock(r.mutex);
                if (auto it = r.stores.find(key);
                    it != r.stores.end() && it->second.expired()) {
                    r.stores.erase(it);
                }
            }
            r.closed.notify_all();
        });
    reg.stores.emplace(key, store);
    return store;
}

std::shared_ptr<SharedStore> SharedStore::wrap(std::unique_ptr<StorageEngine> engine,
                                               const StoreOptions& options,
                                               std::string name) {
    if (!engine) {
        throw std::invalid_argument("SharedStore::wrap: engine must not be null");
    }
    return std::make_shared<SharedStore>(Private{}, std::move(engine), options,
                                         std::move(name));
}

SharedStore::SharedStore(Private, std::unique_ptr<StorageEngine> engine,
                         StoreOptions options, std::string name)
    : engine_(std::move(engine))
    , options_(options)
    , name_(std::move(name))
    , logger_(make_store_logger(name_))
{
    logger_->info("Opened {} store '{}' (isolation={}, lock_timeout={}ms)",
                  engine_->name(), name_, to_string(options_.isolation),
                  options_.lock_timeout.count());
}

SharedStore::~SharedStore() {
    try {
        engine_->close();
        logger_->info("Closed {} store '{}'", engine_->name(), name_);
    } catch (const Error& e) {
        logger_->error("Closing store '{}' failed: {}", name_, e.what());
    }
}

// ── Locking ──────────────────────────────────────────────────────────────────

std::unique_lock<std::timed_mutex> SharedStore::acquire(std::timed_mutex& mutex,
                                                        std::string_view what) const {
    if (options_.lock_timeout.count() == 0) {
        return std::unique_lock(mutex);
    }

    std::unique_lock lock(mutex, std::defer_lock);
    if (!lock.try_lock_for(options_.lock_timeout)) {
        logger_->warn("Timed out after {}ms waiting for {} lock",
                      options_.lock_timeout.count(), what);
        throw StorageError(
            StorageError::Code::LockTimeout,
            fmt::format("Timed out waiting for {} lock on store '{}'", what, name_),
            fmt::format("waited {}ms", options_.lock_timeout.count()));
    }
    return lock;
}

std::timed_mutex& SharedStore::stripe_for(std::string_view key) const {
    return stripes_[std::hash<std::string_view>{}(key) % kLockStripes];
}

StoreLock SharedStore::lock_read(std::string_view /*key*/) const {
    StoreLock lock;
    // EngineNative: every single engine call is already atomic.
    if (options_.isolation == Isolation::Serialized) {
        lock.adopt(acquire(global_mutex_, "store"));
    }
    return lock;
}

StoreLock SharedStore::lock_write(std::string_view key) const {
    StoreLock lock;
    if (options_.isolation == Isolation::Serialized) {
        lock.adopt(acquire(global_mutex_, "store"));
    } else {
        lock.adopt(acquire(stripe_for(key), "key"));
    }
    return lock;
}

StoreLock SharedStore::lock_all() const {
    StoreLock lock;
    if (options_.isolation == Isolation::Serialized) {
        lock.adopt(acquire(global_mutex_, "store"));
        return lock;
    }
    // Fixed index order; single-key writers hold at most one stripe.
    for (auto& stripe : stripes_) {
        lock.adopt(acquire(stripe, "key"));
    }
    return lock;
}

// ── Engine access ────────────────────────────────────────────────────────────

std::unique_ptr<Cursor> SharedStore::cursor() const {
    return std::make_unique<PinnedCursor>(shared_from_this(), engine_->cursor());
}

void SharedStore::flush() {
    auto lock = lock_all();
    engine_->flush();
    logger_->debug("Flushed store '{}'", name_);
}

} // namespace pdict
