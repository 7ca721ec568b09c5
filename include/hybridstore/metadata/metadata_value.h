#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <hybridstore/core/types.h>

namespace hybridstore::metadata {

struct MetadataValue;

using MetadataArray = std::vector<MetadataValue>;
using MetadataObject = std::map<std::string, MetadataValue>;

/**
 * @brief Closed set of value kinds that may appear in document metadata
 */
enum class MetadataValueType { Null, Boolean, Integer, Real, String, Array, Object };

/**
 * @brief JSON-like metadata value
 *
 * A tagged variant over null, bool, int64, double, string, and nested arrays/objects of the
 * same. Integer and real values compare numerically with each other.
 */
struct MetadataValue {
    using Variant = std::variant<std::nullptr_t, bool, int64_t, double, std::string, MetadataArray,
                                 MetadataObject>;

    Variant value;

    MetadataValue() : value(nullptr) {}
    MetadataValue(std::nullptr_t) : value(nullptr) {}
    MetadataValue(bool b) : value(b) {}
    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                                           int> = 0>
    MetadataValue(T i) : value(static_cast<int64_t>(i)) {}
    MetadataValue(double d) : value(d) {}
    MetadataValue(const char* s) : value(std::string(s)) {}
    MetadataValue(std::string s) : value(std::move(s)) {}
    MetadataValue(MetadataArray a) : value(std::move(a)) {}
    MetadataValue(MetadataObject o) : value(std::move(o)) {}

    [[nodiscard]] MetadataValueType type() const {
        return static_cast<MetadataValueType>(value.index());
    }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isNumber() const {
        return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<MetadataArray>(value); }
    bool isObject() const { return std::holds_alternative<MetadataObject>(value); }

    bool asBool() const { return std::get<bool>(value); }
    int64_t asInteger() const { return std::get<int64_t>(value); }
    double asNumber() const {
        if (auto* i = std::get_if<int64_t>(&value)) {
            return static_cast<double>(*i);
        }
        return std::get<double>(value);
    }
    const std::string& asString() const { return std::get<std::string>(value); }
    const MetadataArray& asArray() const { return std::get<MetadataArray>(value); }
    const MetadataObject& asObject() const { return std::get<MetadataObject>(value); }

    /**
     * @brief Deep equality; numbers compare by value across integer/real
     */
    friend bool operator==(const MetadataValue& a, const MetadataValue& b);
    friend bool operator!=(const MetadataValue& a, const MetadataValue& b) { return !(a == b); }
};

/// Document metadata: string keys mapped to values
using Metadata = MetadataObject;

const char* typeName(MetadataValueType type);

/**
 * @brief Containment test with JSON document semantics
 *
 * - scalars: equal
 * - objects: every key of @p needle is present in @p haystack with a contained value
 * - arrays: every element of @p needle is contained by some element of @p haystack
 * - an array haystack also contains a scalar needle equal to one of its elements
 */
bool contains(const MetadataValue& haystack, const MetadataValue& needle);

/**
 * @brief Well-formed UTF-8 check (no overlong forms, surrogates or code points past U+10FFFF)
 */
bool isValidUtf8(std::string_view text);

/**
 * @brief True when every string and object key inside @p value is valid UTF-8
 */
bool isValidUtf8(const MetadataValue& value);

// JSON conversion
nlohmann::json toJson(const MetadataValue& value);
nlohmann::json toJson(const Metadata& metadata);
MetadataValue fromJson(const nlohmann::json& j);

/**
 * @brief Serialize metadata as a compact JSON object string
 *
 * Invalid UTF-8 is written as U+FFFD; callers that persist metadata reject it beforehand.
 */
std::string serializeMetadata(const Metadata& metadata);

/**
 * @brief Parse a JSON object string into metadata
 * @return ValidationError when the text is not valid JSON or not an object
 */
Result<Metadata> parseMetadata(const std::string& text);

} // namespace hybridstore::metadata
