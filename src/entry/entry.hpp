#pragma once

#include "codec/codec_pipeline.hpp"
#include "codec/value.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace pdict {

using Clock     = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Current wall-clock time truncated to the stored precision.
[[nodiscard]] Timestamp now() noexcept;

// ── Entry ─────────────────────────────────────────────────────────────────────
// The record stored under each key.

struct Entry {
    Value     value;
    Value     metadata = Value::object();
    Timestamp created_at{};
    Timestamp updated_at{};

    friend bool operator==(const Entry&, const Entry&) = default;
};

// Fresh entry: empty metadata, both timestamps = `at`.
[[nodiscard]] Entry new_entry(Value value, Timestamp at);

// Value replaced and updated_at refreshed; metadata and created_at kept.
[[nodiscard]] Entry with_value(Entry entry, Value value, Timestamp at);

// Metadata replaced; value and both timestamps kept.
[[nodiscard]] Entry with_metadata(Entry entry, Value metadata);

// ── EntryCodec ────────────────────────────────────────────────────────────────
//
// Packs an Entry as one composite object through the codec pipeline:
//
//   { "value": <Value>, "metadata": <Value>,
//     "created_at": <int, µs since epoch>, "updated_at": <int, µs since epoch> }
//
// decode() throws CorruptionError / SerializationError from the pipeline, and
// SerializationError if the decoded record does not have that shape.
// The record wraps the value in one extra level, so values deeper than
// kMaxNestingDepth - 1 are rejected by encode().

class EntryCodec {
public:
    explicit EntryCodec(CodecPipeline pipeline = CodecPipeline{});

    [[nodiscard]] std::string encode(const Entry& entry) const;
    [[nodiscard]] Entry decode(std::string_view bytes) const;

    [[nodiscard]] const CodecPipeline& pipeline() const noexcept { return pipeline_; }

private:
    CodecPipeline pipeline_;
};

} // namespace pdict
