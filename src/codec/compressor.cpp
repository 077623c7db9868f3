#include "codec/compressor.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>
#include <zlib.h>

#include <stdexcept>

namespace pdict {

namespace {

constexpr std::size_t kSizePrefix = sizeof(uint64_t);

// Deflate cannot expand data by more than ~1032:1.
constexpr uint64_t kMaxInflateRatio = 1032;

void append_u64(std::string& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<char>(static_cast<uint8_t>(v >> (i * 8))));
    }
}

uint64_t read_u64(const char* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(static_cast<uint8_t>(p[i])) << (i * 8);
    }
    return v;
}

std::string_view zlib_error(int rc) {
    switch (rc) {
        case Z_MEM_ERROR:  return "out of memory";
        case Z_BUF_ERROR:  return "output size mismatch";
        case Z_DATA_ERROR: return "corrupt or truncated stream";
        default:           return "unknown zlib error";
    }
}

} // anonymous namespace

// ── IdentityCompressor ────────────────────────────────────────────────────────

std::string IdentityCompressor::compress(std::string_view raw) const {
    return std::string(raw);
}

std::string IdentityCompressor::decompress(std::string_view packed) const {
    return std::string(packed);
}

// ── ZlibCompressor ────────────────────────────────────────────────────────────

ZlibCompressor::ZlibCompressor(int level)
    : level_(level)
{
    if (level < 0 || level > 9) {
        throw std::invalid_argument(
            fmt::format("zlib compression level must be in [0, 9], got {}", level));
    }
}

std::string ZlibCompressor::compress(std::string_view raw) const {
    uLongf bound = ::compressBound(static_cast<uLong>(raw.size()));

    std::string out;
    out.reserve(kSizePrefix + bound);
    append_u64(out, raw.size());
    out.resize(kSizePrefix + bound);

    int rc = ::compress2(
        reinterpret_cast<Bytef*>(out.data() + kSizePrefix), &bound,
        reinterpret_cast<const Bytef*>(raw.data()), static_cast<uLong>(raw.size()),
        level_);
    if (rc != Z_OK) {
        // compressBound() guarantees room, so only allocation can fail here.
        throw SerializationError(
            fmt::format("zlib: compress failed: {}", zlib_error(rc)));
    }
    out.resize(kSizePrefix + bound);
    return out;
}

std::string ZlibCompressor::decompress(std::string_view packed) const {
    if (packed.size() < kSizePrefix) {
        throw CorruptionError(fmt::format(
            "zlib: blob of {} bytes is shorter than the size prefix", packed.size()));
    }

    const uint64_t raw_size = read_u64(packed.data());
    const uint64_t stream_size = packed.size() - kSizePrefix;
    if (raw_size > kMaxRawSize || raw_size > stream_size * kMaxInflateRatio + 64) {
        throw CorruptionError(fmt::format(
            "zlib: advertised size {} exceeds limit", raw_size));
    }

    std::string out(static_cast<std::size_t>(raw_size), '\0');
    uLongf out_len = static_cast<uLongf>(raw_size);
    const auto* src = reinterpret_cast<const Bytef*>(packed.data() + kSizePrefix);
    uLong src_len = static_cast<uLong>(stream_size);

    int rc = ::uncompress2(
        reinterpret_cast<Bytef*>(out.data()), &out_len, src, &src_len);
    if (rc != Z_OK) {
        throw CorruptionError(fmt::format("zlib: {}", zlib_error(rc)));
    }
    if (out_len != raw_size || src_len != stream_size) {
        throw CorruptionError(fmt::format(
            "zlib: stream inflated to {} bytes, expected {}", out_len, raw_size));
    }
    return out;
}

} // namespace pdict
