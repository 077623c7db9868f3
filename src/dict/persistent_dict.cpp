#include "dict/persistent_dict.hpp"

#include "common/errors.hpp"

#include <mutex>
#include <stdexcept>

namespace pdict {

// ── DictOptions ───────────────────────────────────────────────────────────────

StoreOptions DictOptions::store_options() const {
    StoreOptions out;
    out.engine       = engine;
    out.isolation    = isolation;
    out.lock_timeout = lock_timeout;
    out.sync_writes  = sync_writes;
    return out;
}

CodecPipeline DictOptions::pipeline() const {
    auto comp = compressor;
    if (!comp) {
        comp = std::make_shared<ZlibCompressor>(compress_level);
    }
    return CodecPipeline(serializer, std::move(comp));
}

// ── Construction ─────────────────────────────────────────────────────────────

PersistentDict::PersistentDict(const std::filesystem::path& path, DictOptions options)
    : PersistentDict(SharedStore::open(path, options.store_options()), options)
{}

PersistentDict::PersistentDict(std::shared_ptr<SharedStore> store, DictOptions options)
    : options_(std::move(options))
    , codec_(options_.pipeline())
    , state_(std::make_shared<State>())
{
    if (!store) {
        throw std::invalid_argument("PersistentDict: store must not be null");
    }
    logger_ = store->logger();
    state_->store = std::move(store);
    logger_->debug("Dictionary opened (serializer={}, compressor={})",
                   codec_.pipeline().serializer().name(),
                   codec_.pipeline().compressor().name());
}

PersistentDict::~PersistentDict() {
    try {
        close();
    } catch (const Error& e) {
        logger_->error("Closing dictionary failed: {}", e.what());
    }
}

std::shared_ptr<SharedStore> PersistentDict::acquire(const State& state) {
    std::shared_lock lock(state.mutex);
    if (!state.store) {
        throw ClosedError();
    }
    return state.store;
}

// ── Lookup ───────────────────────────────────────────────────────────────────

bool PersistentDict::contains(std::string_view key) const {
    auto store = acquire();
    auto lock = store->lock_read(key);
    return store->engine().contains(key);
}

std::optional<Entry> PersistentDict::get(std::string_view key) const {
    auto store = acquire();

    std::optional<std::string> blob;
    {
        auto lock = store->lock_read(key);
        blob = store->engine().get(key);
    }
    if (!blob) {
        return std::nullopt;
    }

    try {
        return codec_.decode(*blob);
    } catch (const CorruptionError& e) {
        logger_->error("Stored entry '{}' is corrupt: {}", key, e.what());
        throw;
    } catch (const SerializationError& e) {
        logger_->error("Stored entry '{}' cannot be decoded: {}", key, e.what());
        throw;
    }
}

Entry PersistentDict::get(std::string_view key, Entry fallback) const {
    if (auto entry = get(key)) {
        return std::move(*entry);
    }
    return fallback;
}

std::optional<Value> PersistentDict::get_value(std::string_view key) const {
    if (auto entry = get(key)) {
        return std::move(entry->value);
    }
    return std::nullopt;
}

Value PersistentDict::get_value(std::string_view key, Value fallback) const {
    if (auto entry = get(key)) {
        return std::move(entry->value);
    }
    return fallback;
}

Value PersistentDict::at(std::string_view key) const {
    if (auto entry = get(key)) {
        return std::move(entry->value);
    }
    throw KeyNotFoundError(key);
}

// ── Mutation ─────────────────────────────────────────────────────────────────

void PersistentDict::set(std::string_view key, Value value) {
    auto store = acquire();
    auto lock = store->lock_write(key);

    auto& engine = store->engine();
    const auto at_time = now();

    Entry entry;
    if (auto existing = engine.get(key)) {
        entry = with_value(codec_.decode(*existing), std::move(value), at_time);
    } else {
        entry = new_entry(std::move(value), at_time);
    }

    engine.put(key, codec_.encode(entry));
    logger_->trace("SET {}", key);
}

Value PersistentDict::meta(std::string_view key) const {
    auto entry = get(key);
    if (!entry) {
        throw KeyNotFoundError(key);
    }
    return std::move(entry->metadata);
}

bool PersistentDict::meta(std::string_view key, Value metadata) {
    auto store = acquire();
    auto lock = store->lock_write(key);

    auto& engine = store->engine();
    auto existing = engine.get(key);
    if (!existing) {
        logger_->debug("META {} ignored: key not found", key);
        return false;
    }

    auto entry = with_metadata(codec_.decode(*existing), std::move(metadata));
    engine.put(key, codec_.encode(entry));
    logger_->trace("META {}", key);
    return true;
}

bool PersistentDict::del(std::string_view key) {
    auto store = acquire();
    auto lock = store->lock_write(key);
    const bool removed = store->engine().del(key);
    logger_->trace("DEL {} ({})", key, removed ? "removed" : "absent");
    return removed;
}

void PersistentDict::clear() {
    auto store = acquire();
    auto lock = store->lock_all();
    store->engine().clear();
    logger_->info("Cleared store '{}'", store->name());
}

std::size_t PersistentDict::merge(const PersistentDict& other, bool overwrite) {
    auto store = acquire();
    auto& engine = store->engine();

    std::size_t copied = 0;
    for (const auto& [key, entry] : other.items()) {
        auto lock = store->lock_write(key);
        if (!overwrite && engine.contains(key)) {
            continue;
        }
        engine.put(key, codec_.encode(entry));
        ++copied;
    }

    logger_->info("Merged {} entries (overwrite={})", copied, overwrite);
    return copied;
}

// ── Iteration ────────────────────────────────────────────────────────────────

CursorRange<std::string>::Opener PersistentDict::opener() const {
    // Checked again on every begin(), so a range taken before close() fails.
    return [state = state_]() { return acquire(*state)->cursor(); };
}

KeyRange PersistentDict::keys() const {
    (void)acquire();
    return KeyRange(opener(), [](std::string_view key, std::string_view) {
        return std::string(key);
    });
}

ValueRange PersistentDict::values() const {
    (void)acquire();
    return ValueRange(opener(), [codec = codec_](std::string_view, std::string_view blob) {
        return codec.decode(blob).value;
    });
}

ItemRange PersistentDict::items() const {
    (void)acquire();
    return ItemRange(opener(), [codec = codec_](std::string_view key, std::string_view blob) {
        return std::pair<std::string, Entry>(std::string(key), codec.decode(blob));
    });
}

std::size_t PersistentDict::size() const {
    auto store = acquire();
    auto lock = store->lock_read({});
    return store->engine().size();
}

// ── Lifecycle ────────────────────────────────────────────────────────────────

std::unique_ptr<PersistentDict> PersistentDict::share() const {
    return std::make_unique<PersistentDict>(acquire(), options_);
}

void PersistentDict::close() {
    std::shared_ptr<SharedStore> store;
    {
        std::unique_lock lock(state_->mutex);
        if (!state_->store) {
            return;
        }
        store = std::move(state_->store);
        state_->store.reset();
    }

    store->flush();
    logger_->debug("Dictionary closed");
    // The engine itself closes when the last owner releases `store`.
}

bool PersistentDict::is_closed() const {
    std::shared_lock lock(state_->mutex);
    return !state_->store;
}

std::shared_ptr<SharedStore> PersistentDict::store() const {
    return acquire();
}

} // namespace pdict
