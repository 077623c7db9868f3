#pragma once

#include "codec/compressor.hpp"
#include "codec/serializer.hpp"
#include "codec/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pdict {

// ── Frame constants ───────────────────────────────────────────────────────────

inline constexpr char kFrameMagic[] = "PD";               // 2 bytes (no NUL)
inline constexpr std::size_t kFrameMagicSize = 2;
inline constexpr uint8_t kFrameVersion = 1;
inline constexpr std::size_t kFrameHeaderSize =
    kFrameMagicSize + 3 + sizeof(uint32_t);                // 9 bytes

// ── CodecPipeline ─────────────────────────────────────────────────────────────
//
// pack(v)   = frame(compress(serialize(v)))
// unpack(b) = deserialize(decompress(unframe(b)))
//
// Frame layout:
//
//   [magic: "PD" (2B)][version: u8 = 1][serializer id: u8][compressor id: u8]
//   [crc32: u32 LE]   // CRC of the payload
//   [payload]         // compressor output
//
// unpack() throws CorruptionError when the frame, checksum or compressed
// payload is damaged (or was written by another compressor), and
// SerializationError when the serializer rejects the decompressed bytes (or
// the blob was written by another serializer).
//
// Stateless once constructed; safe to share between threads.

class CodecPipeline {
public:
    // Null stages fall back to ProtobufSerializer / ZlibCompressor(6).
    explicit CodecPipeline(std::shared_ptr<const Serializer> serializer = nullptr,
                           std::shared_ptr<const Compressor> compressor = nullptr);

    [[nodiscard]] std::string pack(const Value& value) const;
    [[nodiscard]] Value unpack(std::string_view bytes) const;

    [[nodiscard]] const Serializer& serializer() const noexcept { return *serializer_; }
    [[nodiscard]] const Compressor& compressor() const noexcept { return *compressor_; }

private:
    std::shared_ptr<const Serializer> serializer_;
    std::shared_ptr<const Compressor> compressor_;
};

} // namespace pdict
