#include "codec/value.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <ostream>
#include <type_traits>

namespace pdict {

namespace {

void append_escaped(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void render(std::string& out, const Value& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, Value::Null>) {
                out += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out += std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out += fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                append_escaped(out, v);
            } else if constexpr (std::is_same_v<T, Value::Bytes>) {
                out += "b'";
                for (uint8_t b : v) {
                    out += fmt::format("{:02x}", b);
                }
                out += '\'';
            } else if constexpr (std::is_same_v<T, Value::Array>) {
                out += '[';
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) out += ", ";
                    render(out, v[i]);
                }
                out += ']';
            } else if constexpr (std::is_same_v<T, Value::Object>) {
                out += '{';
                bool first = true;
                for (const auto& [k, member] : v) {
                    if (!first) out += ", ";
                    first = false;
                    append_escaped(out, k);
                    out += ": ";
                    render(out, member);
                }
                out += '}';
            }
        },
        value.data());
}

} // anonymous namespace

void Value::throw_int_out_of_range(uint64_t i) {
    throw SerializationError(
        fmt::format("Unsigned integer {} does not fit a signed 64-bit value", i));
}

std::string_view Value::type_name() const noexcept {
    switch (type()) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Int:    return "int";
        case Type::Double: return "double";
        case Type::String: return "string";
        case Type::Bytes:  return "bytes";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

const Value* Value::find(std::string_view key) const {
    const auto* obj = std::get_if<Object>(&data_);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    return it == obj->end() ? nullptr : &it->second;
}

std::size_t Value::depth() const {
    std::size_t deepest = 0;
    if (const auto* arr = std::get_if<Array>(&data_)) {
        for (const auto& item : *arr) {
            deepest = std::max(deepest, item.depth());
        }
    } else if (const auto* obj = std::get_if<Object>(&data_)) {
        for (const auto& [_, member] : *obj) {
            deepest = std::max(deepest, member.depth());
        }
    }
    return deepest + 1;
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.data_ == rhs.data_;
}

std::string to_string(const Value& value) {
    std::string out;
    render(out, value);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << to_string(value);
}

} // namespace pdict
