#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/metadata/metadata_value.h>

namespace hybridstore::metadata {

/**
 * @brief Predicate operators supported by metadata filters
 */
enum class FilterOp {
    Equals,  ///< metadata[key] deep-equals value
    Contains ///< metadata[key] contains value (JSON containment)
};

struct FilterPredicate {
    std::string key;
    FilterOp op = FilterOp::Equals;
    MetadataValue value;
};

/**
 * @brief Conjunction of predicates over document metadata
 *
 * An empty filter matches every document. Filters are evaluated before ranking.
 *
 * JSON form: a plain object such as {"category": "pets", "tags": ["a"]} requires every key to be
 * contained in the document metadata. Per-key operator objects are also accepted:
 * {"year": {"$eq": 2020}, "tags": {"$contains": ["a"]}}.
 */
class MetadataFilter {
public:
    MetadataFilter() = default;

    /**
     * @brief Build a filter from a parsed JSON document
     * @return FilterError for a non-object root, empty keys, or unknown operators
     */
    static Result<MetadataFilter> fromJson(const nlohmann::json& j);

    /**
     * @brief Parse a JSON filter string
     */
    static Result<MetadataFilter> parse(const std::string& text);

    /**
     * @brief Containment filter with one predicate per key of @p object
     */
    static MetadataFilter fromObject(const Metadata& object);

    MetadataFilter& equals(std::string key, MetadataValue value);
    MetadataFilter& contains(std::string key, MetadataValue value);

    /**
     * @brief Check the predicates are well formed
     * @return FilterError for an empty key or a key or value that is not valid UTF-8
     */
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] bool matches(const Metadata& doc) const;

    bool empty() const { return predicates_.empty(); }
    size_t size() const { return predicates_.size(); }
    const std::vector<FilterPredicate>& predicates() const { return predicates_; }

    nlohmann::json toJson() const;
    std::string toString() const {
        return toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

private:
    std::vector<FilterPredicate> predicates_;
};

} // namespace hybridstore::metadata
