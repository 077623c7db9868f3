#include "entry/entry.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace pdict {

namespace {

constexpr std::string_view kFieldValue     = "value";
constexpr std::string_view kFieldMetadata  = "metadata";
constexpr std::string_view kFieldCreatedAt = "created_at";
constexpr std::string_view kFieldUpdatedAt = "updated_at";

const Value& require_field(const Value& record, std::string_view name) {
    const Value* field = record.find(name);
    if (field == nullptr) {
        throw SerializationError(fmt::format("entry: record has no '{}' field", name));
    }
    return *field;
}

Timestamp require_timestamp(const Value& record, std::string_view name) {
    const Value& field = require_field(record, name);
    if (!field.is_int()) {
        throw SerializationError(fmt::format(
            "entry: '{}' must be an int, got {}", name, field.type_name()));
    }
    return Timestamp{std::chrono::microseconds{field.as_int()}};
}

} // anonymous namespace

Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

Entry new_entry(Value value, Timestamp at) {
    Entry entry;
    entry.value      = std::move(value);
    entry.created_at = at;
    entry.updated_at = at;
    return entry;
}

Entry with_value(Entry entry, Value value, Timestamp at) {
    entry.value      = std::move(value);
    entry.updated_at = at;
    return entry;
}

Entry with_metadata(Entry entry, Value metadata) {
    entry.metadata = std::move(metadata);
    return entry;
}

// ── EntryCodec ────────────────────────────────────────────────────────────────

EntryCodec::EntryCodec(CodecPipeline pipeline)
    : pipeline_(std::move(pipeline))
{}

std::string EntryCodec::encode(const Entry& entry) const {
    Value::Object record;
    record.emplace(kFieldValue, entry.value);
    record.emplace(kFieldMetadata, entry.metadata);
    record.emplace(kFieldCreatedAt, entry.created_at.time_since_epoch().count());
    record.emplace(kFieldUpdatedAt, entry.updated_at.time_since_epoch().count());
    return pipeline_.pack(Value(std::move(record)));
}

Entry EntryCodec::decode(std::string_view bytes) const {
    Value record = pipeline_.unpack(bytes);
    if (!record.is_object()) {
        throw SerializationError(fmt::format(
            "entry: record must be an object, got {}", record.type_name()));
    }
    if (record.as_object().size() != 4) {
        throw SerializationError(fmt::format(
            "entry: record has {} fields, expected 4", record.as_object().size()));
    }

    Entry entry;
    entry.value      = require_field(record, kFieldValue);
    entry.metadata   = require_field(record, kFieldMetadata);
    entry.created_at = require_timestamp(record, kFieldCreatedAt);
    entry.updated_at = require_timestamp(record, kFieldUpdatedAt);
    return entry;
}

} // namespace pdict
