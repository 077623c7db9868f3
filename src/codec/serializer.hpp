#pragma once

#include "codec/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pdict {

// Deepest Value accepted by the serializers (see Value::depth()).
inline constexpr std::size_t kMaxNestingDepth = 32;

// ── Serializer ────────────────────────────────────────────────────────────────
//
// First stage of the codec pipeline: Value <-> bytes.
//
// Implementations must be pure: no mutable state, safe to call concurrently
// from any thread. decode() throws SerializationError on input that does not
// describe a valid Value; encode() throws SerializationError for values it
// cannot represent (e.g. nesting deeper than kMaxNestingDepth).
//
// id() is written into every stored frame, so the pipeline can refuse blobs
// produced by a different serializer. Custom implementations should pick an
// id >= 0x80.

class Serializer {
public:
    virtual ~Serializer() = default;

    [[nodiscard]] virtual std::string encode(const Value& value) const = 0;
    [[nodiscard]] virtual Value decode(std::string_view bytes) const = 0;

    [[nodiscard]] virtual uint8_t id() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ── ProtobufSerializer ────────────────────────────────────────────────────────
// Default serializer. Maps Value onto the pdict.proto.Value message.

class ProtobufSerializer final : public Serializer {
public:
    static constexpr uint8_t kId = 0x01;

    [[nodiscard]] std::string encode(const Value& value) const override;
    [[nodiscard]] Value decode(std::string_view bytes) const override;

    [[nodiscard]] uint8_t id() const noexcept override { return kId; }
    [[nodiscard]] std::string_view name() const noexcept override { return "protobuf"; }
};

} // namespace pdict
