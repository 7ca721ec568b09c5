#include <hybridstore/metadata/metadata_filter.h>

namespace hybridstore::metadata {

namespace {

bool isOperatorObject(const nlohmann::json& j) {
    if (!j.is_object() || j.empty()) {
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty() || it.key()[0] != '$') {
            return false;
        }
    }
    return true;
}

bool hasOperatorKey(const nlohmann::json& j) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.key().empty() && it.key()[0] == '$') {
            return true;
        }
    }
    return false;
}

} // namespace

Result<MetadataFilter> MetadataFilter::fromJson(const nlohmann::json& j) {
    if (j.is_null()) {
        return MetadataFilter{};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::FilterError,
                     std::string("Metadata filter must be a JSON object, got ") + j.type_name()};
    }

    MetadataFilter filter;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& key = it.key();
        const auto& val = it.value();
        if (key.empty()) {
            return Error{ErrorCode::FilterError, "Metadata filter contains an empty key"};
        }
        if (key[0] == '$') {
            return Error{ErrorCode::FilterError, "Operator '" + key + "' is not allowed at the top "
                                                                       "level of a filter"};
        }

        if (isOperatorObject(val)) {
            for (auto op = val.begin(); op != val.end(); ++op) {
                if (op.key() == "$eq") {
                    filter.equals(key, metadata::fromJson(op.value()));
                } else if (op.key() == "$contains") {
                    filter.contains(key, metadata::fromJson(op.value()));
                } else {
                    return Error{ErrorCode::FilterError,
                                 "Unknown filter operator '" + op.key() + "' for key '" + key +
                                     "'"};
                }
            }
        } else if (val.is_object() && hasOperatorKey(val)) {
            return Error{ErrorCode::FilterError,
                         "Filter for key '" + key + "' mixes operators and plain fields"};
        } else {
            filter.contains(key, metadata::fromJson(val));
        }
    }
    return filter;
}

Result<MetadataFilter> MetadataFilter::parse(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::FilterError, "Metadata filter is not valid JSON"};
    }
    return fromJson(j);
}

MetadataFilter MetadataFilter::fromObject(const Metadata& object) {
    MetadataFilter filter;
    for (const auto& [key, value] : object) {
        filter.contains(key, value);
    }
    return filter;
}

MetadataFilter& MetadataFilter::equals(std::string key, MetadataValue value) {
    predicates_.push_back({std::move(key), FilterOp::Equals, std::move(value)});
    return *this;
}

MetadataFilter& MetadataFilter::contains(std::string key, MetadataValue value) {
    predicates_.push_back({std::move(key), FilterOp::Contains, std::move(value)});
    return *this;
}

Result<void> MetadataFilter::validate() const {
    for (const auto& p : predicates_) {
        if (p.key.empty()) {
            return Error{ErrorCode::FilterError, "Metadata filter contains an empty key"};
        }
        if (!isValidUtf8(std::string_view(p.key)) || !isValidUtf8(p.value)) {
            return Error{ErrorCode::FilterError,
                         "Metadata filter contains a key or value that is not valid UTF-8"};
        }
    }
    return {};
}

bool MetadataFilter::matches(const Metadata& doc) const {
    for (const auto& p : predicates_) {
        auto it = doc.find(p.key);
        if (it == doc.end()) {
            return false;
        }
        switch (p.op) {
            case FilterOp::Equals:
                if (it->second != p.value) {
                    return false;
                }
                break;
            case FilterOp::Contains:
                if (!metadata::contains(it->second, p.value)) {
                    return false;
                }
                break;
        }
    }
    return true;
}

nlohmann::json MetadataFilter::toJson() const {
    auto obj = nlohmann::json::object();
    for (const auto& p : predicates_) {
        const char* op = p.op == FilterOp::Equals ? "$eq" : "$contains";
        obj[p.key][op] = metadata::toJson(p.value);
    }
    return obj;
}

} // namespace hybridstore::metadata
