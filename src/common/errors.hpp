#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pdict {

// ── Error hierarchy ───────────────────────────────────────────────────────────
//
// Every failure surfaced by the dictionary derives from pdict::Error, so callers
// can catch the whole family, or a single kind:
//
//   KeyNotFoundError   – operation without a default-returning form hit a
//                        missing key (e.g. reading metadata).
//   SerializationError – bytes do not describe a valid structured value.
//   CorruptionError    – stored blob cannot be unframed or decompressed.
//   StorageError       – the embedded engine failed (I/O, lock timeout, ...).
//   ClosedError        – operation attempted after close().

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class KeyNotFoundError final : public Error {
public:
    explicit KeyNotFoundError(std::string_view key);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class SerializationError final : public Error {
public:
    using Error::Error;
};

class CorruptionError final : public Error {
public:
    using Error::Error;
};

class ClosedError final : public Error {
public:
    ClosedError();
    explicit ClosedError(std::string_view what);
};

// ── StorageError ──────────────────────────────────────────────────────────────
// Single error kind for engine failures. The engine's own status text is kept
// in cause() for diagnostics.

class StorageError final : public Error {
public:
    enum class Code : uint8_t {
        Io              = 0,
        NoSpace         = 1,
        Busy            = 2,
        LockTimeout     = 3,
        Corruption      = 4,
        InvalidArgument = 5,
        Unknown         = 6,
    };

    StorageError(Code code, std::string_view message, std::string cause = {});

    [[nodiscard]] Code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    Code code_;
    std::string cause_;
};

[[nodiscard]] std::string_view to_string(StorageError::Code code) noexcept;

} // namespace pdict
