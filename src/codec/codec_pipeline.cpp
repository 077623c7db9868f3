#include "codec/codec_pipeline.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace pdict {

namespace {

void append_u32(std::string& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<char>(static_cast<uint8_t>(v >> (i * 8))));
    }
}

uint32_t read_u32(const char* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(static_cast<uint8_t>(p[i])) << (i * 8);
    }
    return v;
}

uint32_t payload_crc(std::string_view payload) {
    // Feed in chunks: crc32() takes a uInt length.
    uLong crc = ::crc32(0L, Z_NULL, 0);
    const auto* p = reinterpret_cast<const Bytef*>(payload.data());
    std::size_t remaining = payload.size();
    while (remaining > 0) {
        const auto chunk = static_cast<uInt>(std::min<std::size_t>(remaining, 1u << 30));
        crc = ::crc32(crc, p, chunk);
        p += chunk;
        remaining -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

} // anonymous namespace

CodecPipeline::CodecPipeline(std::shared_ptr<const Serializer> serializer,
                             std::shared_ptr<const Compressor> compressor)
    : serializer_(serializer ? std::move(serializer)
                             : std::make_shared<ProtobufSerializer>())
    , compressor_(compressor ? std::move(compressor)
                             : std::make_shared<ZlibCompressor>())
{}

std::string CodecPipeline::pack(const Value& value) const {
    const std::string payload = compressor_->compress(serializer_->encode(value));

    std::string out;
    out.reserve(kFrameHeaderSize + payload.size());
    out.append(kFrameMagic, kFrameMagicSize);
    out.push_back(static_cast<char>(kFrameVersion));
    out.push_back(static_cast<char>(serializer_->id()));
    out.push_back(static_cast<char>(compressor_->id()));
    append_u32(out, payload_crc(payload));
    out.append(payload);
    return out;
}

Value CodecPipeline::unpack(std::string_view bytes) const {
    if (bytes.size() < kFrameHeaderSize) {
        throw CorruptionError(fmt::format(
            "frame: blob of {} bytes is shorter than the {}-byte header",
            bytes.size(), kFrameHeaderSize));
    }
    if (std::memcmp(bytes.data(), kFrameMagic, kFrameMagicSize) != 0) {
        throw CorruptionError("frame: bad magic");
    }

    const auto version       = static_cast<uint8_t>(bytes[2]);
    const auto serializer_id = static_cast<uint8_t>(bytes[3]);
    const auto compressor_id = static_cast<uint8_t>(bytes[4]);

    if (version != kFrameVersion) {
        throw CorruptionError(fmt::format(
            "frame: unsupported version {} (expected {})", version, kFrameVersion));
    }

    const std::string_view payload = bytes.substr(kFrameHeaderSize);
    const uint32_t stored_crc = read_u32(bytes.data() + kFrameMagicSize + 3);
    if (payload_crc(payload) != stored_crc) {
        throw CorruptionError("frame: payload checksum mismatch");
    }

    if (compressor_id != compressor_->id()) {
        throw CorruptionError(fmt::format(
            "frame: written with compressor id {}, pipeline uses '{}' (id {})",
            compressor_id, compressor_->name(), compressor_->id()));
    }
    if (serializer_id != serializer_->id()) {
        throw SerializationError(fmt::format(
            "frame: written with serializer id {}, pipeline uses '{}' (id {})",
            serializer_id, serializer_->name(), serializer_->id()));
    }

    return serializer_->decode(compressor_->decompress(payload));
}

} // namespace pdict
