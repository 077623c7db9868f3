#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pdict {

// ── Value ─────────────────────────────────────────────────────────────────────
//
// Portable structured data stored in the dictionary: null, bool, signed 64-bit
// integer, double, string, raw bytes, arrays and string-keyed objects.
//
// Strings are opaque byte sequences (no encoding is enforced). Unsigned
// integers are stored as int64_t; one above INT64_MAX throws
// SerializationError instead of wrapping.

class Value {
public:
    using Null   = std::monostate;
    using Bytes  = std::vector<uint8_t>;
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    enum class Type : uint8_t {
        Null   = 0,
        Bool   = 1,
        Int    = 2,
        Double = 3,
        String = 4,
        Bytes  = 5,
        Array  = 6,
        Object = 7,
    };

    Value() = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) : data_(b) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data_(to_int64(i)) {}

    template <std::floating_point T>
    Value(T d) : data_(static_cast<double>(d)) {}

    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(data_.index()); }
    [[nodiscard]] std::string_view type_name() const noexcept;

    [[nodiscard]] bool is_null() const noexcept   { return type() == Type::Null; }
    [[nodiscard]] bool is_bool() const noexcept   { return type() == Type::Bool; }
    [[nodiscard]] bool is_int() const noexcept    { return type() == Type::Int; }
    [[nodiscard]] bool is_double() const noexcept { return type() == Type::Double; }
    [[nodiscard]] bool is_string() const noexcept { return type() == Type::String; }
    [[nodiscard]] bool is_bytes() const noexcept  { return type() == Type::Bytes; }
    [[nodiscard]] bool is_array() const noexcept  { return type() == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return type() == Type::Object; }

    // Checked accessors: throw std::bad_variant_access on a kind mismatch.
    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data_); }
    [[nodiscard]] double as_double() const { return std::get<double>(data_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    [[nodiscard]] const Array& as_array() const { return std::get<Array>(data_); }
    [[nodiscard]] Array& as_array() { return std::get<Array>(data_); }
    [[nodiscard]] const Object& as_object() const { return std::get<Object>(data_); }
    [[nodiscard]] Object& as_object() { return std::get<Object>(data_); }

    // Object member lookup. Returns nullptr if this is not an object or the
    // member is absent.
    [[nodiscard]] const Value* find(std::string_view key) const;

    // Number of nesting levels: scalars are 1, an empty container is 1,
    // a container of scalars is 2, and so on.
    [[nodiscard]] std::size_t depth() const;

    // Underlying variant, for std::visit.
    [[nodiscard]] const auto& data() const noexcept { return data_; }

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    template <std::integral T>
    [[nodiscard]] static int64_t to_int64(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (i > static_cast<T>(INT64_MAX)) {
                throw_int_out_of_range(static_cast<uint64_t>(i));
            }
        }
        return static_cast<int64_t>(i);
    }

    [[noreturn]] static void throw_int_out_of_range(uint64_t i);

    std::variant<Null, bool, int64_t, double, std::string, Bytes, Array, Object> data_;
};

// Compact human-readable rendering (JSON-like), used in logs and test output.
[[nodiscard]] std::string to_string(const Value& value);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace pdict
