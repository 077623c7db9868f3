#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pdict {

// ── Compressor ────────────────────────────────────────────────────────────────
//
// Second stage of the codec pipeline: bytes <-> compressed bytes.
// Pure functions; decompress() throws CorruptionError on malformed input.

class Compressor {
public:
    virtual ~Compressor() = default;

    [[nodiscard]] virtual std::string compress(std::string_view raw) const = 0;
    [[nodiscard]] virtual std::string decompress(std::string_view packed) const = 0;

    [[nodiscard]] virtual uint8_t id() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ── IdentityCompressor ────────────────────────────────────────────────────────

class IdentityCompressor final : public Compressor {
public:
    static constexpr uint8_t kId = 0x00;

    [[nodiscard]] std::string compress(std::string_view raw) const override;
    [[nodiscard]] std::string decompress(std::string_view packed) const override;

    [[nodiscard]] uint8_t id() const noexcept override { return kId; }
    [[nodiscard]] std::string_view name() const noexcept override { return "identity"; }
};

// ── ZlibCompressor ────────────────────────────────────────────────────────────
//
// Layout: [raw_size: u64 LE][zlib stream]
//
// The size prefix lets decompress() allocate the output once and verify that
// the stream inflates to exactly the advertised length.

class ZlibCompressor final : public Compressor {
public:
    static constexpr uint8_t kId = 0x01;
    static constexpr int kDefaultLevel = 6;

    // Largest raw payload decompress() will allocate for.
    static constexpr uint64_t kMaxRawSize = uint64_t{1} << 32;

    // Throws std::invalid_argument unless 0 <= level <= 9.
    explicit ZlibCompressor(int level = kDefaultLevel);

    [[nodiscard]] std::string compress(std::string_view raw) const override;
    [[nodiscard]] std::string decompress(std::string_view packed) const override;

    [[nodiscard]] uint8_t id() const noexcept override { return kId; }
    [[nodiscard]] std::string_view name() const noexcept override { return "zlib"; }

    [[nodiscard]] int level() const noexcept { return level_; }

private:
    int level_;
};

} // namespace pdict
