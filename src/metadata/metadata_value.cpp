#include <hybridstore/metadata/metadata_value.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace hybridstore::metadata {

namespace {

bool numericEqual(const MetadataValue& a, const MetadataValue& b) {
    if (a.type() == MetadataValueType::Integer && b.type() == MetadataValueType::Integer) {
        return a.asInteger() == b.asInteger();
    }
    return a.asNumber() == b.asNumber();
}

} // namespace

bool operator==(const MetadataValue& a, const MetadataValue& b) {
    if (a.isNumber() && b.isNumber()) {
        return numericEqual(a, b);
    }
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
        case MetadataValueType::Null:
            return true;
        case MetadataValueType::Boolean:
            return a.asBool() == b.asBool();
        case MetadataValueType::String:
            return a.asString() == b.asString();
        case MetadataValueType::Array:
            return a.asArray() == b.asArray();
        case MetadataValueType::Object:
            return a.asObject() == b.asObject();
        case MetadataValueType::Integer:
        case MetadataValueType::Real:
            break;
    }
    return false;
}

const char* typeName(MetadataValueType type) {
    switch (type) {
        case MetadataValueType::Null:
            return "null";
        case MetadataValueType::Boolean:
            return "boolean";
        case MetadataValueType::Integer:
            return "integer";
        case MetadataValueType::Real:
            return "real";
        case MetadataValueType::String:
            return "string";
        case MetadataValueType::Array:
            return "array";
        case MetadataValueType::Object:
            return "object";
    }
    return "unknown";
}

bool contains(const MetadataValue& haystack, const MetadataValue& needle) {
    if (haystack.isObject()) {
        if (!needle.isObject()) {
            return false;
        }
        const auto& h = haystack.asObject();
        for (const auto& [key, sub] : needle.asObject()) {
            auto it = h.find(key);
            if (it == h.end() || !contains(it->second, sub)) {
                return false;
            }
        }
        return true;
    }

    if (haystack.isArray()) {
        const auto& h = haystack.asArray();
        if (needle.isArray()) {
            return std::all_of(needle.asArray().begin(), needle.asArray().end(),
                               [&h](const MetadataValue& n) {
                                   return std::any_of(h.begin(), h.end(),
                                                      [&n](const MetadataValue& e) {
                                                          return contains(e, n);
                                                      });
                               });
        }
        if (needle.isObject()) {
            return false;
        }
        return std::any_of(h.begin(), h.end(), [&needle](const MetadataValue& e) {
            return !e.isArray() && !e.isObject() && e == needle;
        });
    }

    return haystack == needle;
}

bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto byte = static_cast<uint8_t>(text[i]);
        if (byte <= 0x7F) {
            i++;
            continue;
        }

        size_t extra = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (byte >= 0xC2 && byte <= 0xDF) {
            extra = 1;
        } else if (byte >= 0xE0 && byte <= 0xEF) {
            extra = 2;
            if (byte == 0xE0) {
                lo = 0xA0; // overlong
            } else if (byte == 0xED) {
                hi = 0x9F; // surrogates
            }
        } else if (byte >= 0xF0 && byte <= 0xF4) {
            extra = 3;
            if (byte == 0xF0) {
                lo = 0x90;
            } else if (byte == 0xF4) {
                hi = 0x8F; // > U+10FFFF
            }
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        auto second = static_cast<uint8_t>(text[i + 1]);
        if (second < lo || second > hi) {
            return false;
        }
        for (size_t k = 2; k <= extra; ++k) {
            if ((static_cast<uint8_t>(text[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

bool isValidUtf8(const MetadataValue& value) {
    switch (value.type()) {
        case MetadataValueType::String:
            return isValidUtf8(std::string_view(value.asString()));
        case MetadataValueType::Array:
            return std::all_of(value.asArray().begin(), value.asArray().end(),
                               [](const MetadataValue& e) { return isValidUtf8(e); });
        case MetadataValueType::Object:
            for (const auto& [key, sub] : value.asObject()) {
                if (!isValidUtf8(std::string_view(key)) || !isValidUtf8(sub)) {
                    return false;
                }
            }
            return true;
        default:
            return true;
    }
}

nlohmann::json toJson(const MetadataValue& value) {
    switch (value.type()) {
        case MetadataValueType::Null:
            return nullptr;
        case MetadataValueType::Boolean:
            return value.asBool();
        case MetadataValueType::Integer:
            return value.asInteger();
        case MetadataValueType::Real:
            return std::get<double>(value.value);
        case MetadataValueType::String:
            return value.asString();
        case MetadataValueType::Array: {
            auto arr = nlohmann::json::array();
            for (const auto& e : value.asArray()) {
                arr.push_back(toJson(e));
            }
            return arr;
        }
        case MetadataValueType::Object:
            return toJson(value.asObject());
    }
    return nullptr;
}

nlohmann::json toJson(const Metadata& metadata) {
    auto obj = nlohmann::json::object();
    for (const auto& [key, v] : metadata) {
        obj[key] = toJson(v);
    }
    return obj;
}

MetadataValue fromJson(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return MetadataValue{};
        case nlohmann::json::value_t::boolean:
            return MetadataValue{j.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return MetadataValue{j.get<int64_t>()};
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return MetadataValue{static_cast<double>(u)};
            }
            return MetadataValue{static_cast<int64_t>(u)};
        }
        case nlohmann::json::value_t::number_float:
            return MetadataValue{j.get<double>()};
        case nlohmann::json::value_t::string:
            return MetadataValue{j.get<std::string>()};
        case nlohmann::json::value_t::array: {
            MetadataArray arr;
            arr.reserve(j.size());
            for (const auto& e : j) {
                arr.push_back(fromJson(e));
            }
            return MetadataValue{std::move(arr)};
        }
        case nlohmann::json::value_t::object: {
            MetadataObject obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.emplace(it.key(), fromJson(it.value()));
            }
            return MetadataValue{std::move(obj)};
        }
        case nlohmann::json::value_t::binary:
            break;
    }
    return MetadataValue{};
}

std::string serializeMetadata(const Metadata& metadata) {
    return toJson(metadata).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<Metadata> parseMetadata(const std::string& text) {
    if (text.empty()) {
        return Metadata{};
    }
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::ValidationError, "Metadata is not valid JSON"};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "Metadata must be a JSON object"};
    }
    auto value = fromJson(j);
    return value.asObject();
}

} // namespace hybridstore::metadata
