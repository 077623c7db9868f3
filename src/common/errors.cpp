#include "common/errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace pdict {

namespace {

std::string storage_message(StorageError::Code code, std::string_view message,
                            const std::string& cause) {
    if (cause.empty()) {
        return fmt::format("{} ({})", message, to_string(code));
    }
    return fmt::format("{} ({}): {}", message, to_string(code), cause);
}

} // anonymous namespace

KeyNotFoundError::KeyNotFoundError(std::string_view key)
    : Error(fmt::format("Key '{}' does not exist", key))
    , key_(key)
{}

ClosedError::ClosedError()
    : Error("Operation on a closed dictionary")
{}

ClosedError::ClosedError(std::string_view what)
    : Error(std::string(what))
{}

StorageError::StorageError(Code code, std::string_view message, std::string cause)
    : Error(storage_message(code, message, cause))
    , code_(code)
    , cause_(std::move(cause))
{}

std::string_view to_string(StorageError::Code code) noexcept {
    switch (code) {
        case StorageError::Code::Io:              return "io";
        case StorageError::Code::NoSpace:         return "no-space";
        case StorageError::Code::Busy:            return "busy";
        case StorageError::Code::LockTimeout:     return "lock-timeout";
        case StorageError::Code::Corruption:      return "corruption";
        case StorageError::Code::InvalidArgument: return "invalid-argument";
        case StorageError::Code::Unknown:         return "unknown";
    }
    return "unknown";
}

} // namespace pdict
