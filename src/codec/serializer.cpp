#include "codec/serializer.hpp"

#include "common/errors.hpp"
#include "pdict.pb.h"

#include <fmt/format.h>

#include <climits>
#include <type_traits>
#include <utility>

namespace pdict {

namespace {

// ── Value -> pdict.proto.Value ────────────────────────────────────────────────

void to_proto(const Value& value, proto::Value& out) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, Value::Null>) {
                out.set_null_value(proto::NULL_VALUE);
            } else if constexpr (std::is_same_v<T, bool>) {
                out.set_bool_value(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out.set_int_value(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out.set_double_value(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out.set_string_value(v);
            } else if constexpr (std::is_same_v<T, Value::Bytes>) {
                out.set_bytes_value(v.data(), v.size());
            } else if constexpr (std::is_same_v<T, Value::Array>) {
                auto* list = out.mutable_list_value();
                list->mutable_items()->Reserve(static_cast<int>(v.size()));
                for (const auto& item : v) {
                    to_proto(item, *list->add_items());
                }
            } else if constexpr (std::is_same_v<T, Value::Object>) {
                auto* map = out.mutable_map_value();
                map->mutable_entries()->Reserve(static_cast<int>(v.size()));
                for (const auto& [key, member] : v) {
                    auto* entry = map->add_entries();
                    entry->set_key(key);
                    to_proto(member, *entry->mutable_value());
                }
            }
        },
        value.data());
}

// ── pdict.proto.Value -> Value ────────────────────────────────────────────────

Value from_proto(const proto::Value& in, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        throw SerializationError(fmt::format(
            "protobuf: value nested deeper than {} levels", kMaxNestingDepth));
    }

    switch (in.kind_case()) {
        case proto::Value::kNullValue:
            return Value{};

        case proto::Value::kBoolValue:
            return Value(in.bool_value());

        case proto::Value::kIntValue:
            return Value(static_cast<int64_t>(in.int_value()));

        case proto::Value::kDoubleValue:
            return Value(in.double_value());

        case proto::Value::kStringValue:
            return Value(std::string(in.string_value()));

        case proto::Value::kBytesValue: {
            const auto& raw = in.bytes_value();
            return Value(Value::Bytes(raw.begin(), raw.end()));
        }

        case proto::Value::kListValue: {
            Value::Array items;
            items.reserve(static_cast<std::size_t>(in.list_value().items_size()));
            for (const auto& item : in.list_value().items()) {
                items.push_back(from_proto(item, depth + 1));
            }
            return Value(std::move(items));
        }

        case proto::Value::kMapValue: {
            Value::Object members;
            for (const auto& entry : in.map_value().entries()) {
                auto [it, inserted] = members.emplace(
                    std::string(entry.key()), from_proto(entry.value(), depth + 1));
                if (!inserted) {
                    throw SerializationError(fmt::format(
                        "protobuf: duplicate object key '{}'", it->first));
                }
            }
            return Value(std::move(members));
        }

        case proto::Value::KIND_NOT_SET:
            break;
    }
    throw SerializationError("protobuf: value has no kind set");
}

} // anonymous namespace

std::string ProtobufSerializer::encode(const Value& value) const {
    if (value.depth() > kMaxNestingDepth) {
        throw SerializationError(fmt::format(
            "protobuf: cannot encode value nested deeper than {} levels",
            kMaxNestingDepth));
    }

    proto::Value message;
    to_proto(value, message);

    std::string out;
    if (!message.SerializeToString(&out)) {
        throw SerializationError("protobuf: failed to serialize value");
    }
    return out;
}

Value ProtobufSerializer::decode(std::string_view bytes) const {
    if (bytes.size() > static_cast<std::size_t>(INT_MAX)) {
        throw SerializationError("protobuf: encoded value too large");
    }

    proto::Value message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw SerializationError(fmt::format(
            "protobuf: malformed value ({} bytes)", bytes.size()));
    }
    return from_proto(message, 1);
}

} // namespace pdict
