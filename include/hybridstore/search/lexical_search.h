#pragma once

#include <memory>
#include <string>
#include <vector>
#include <hybridstore/core/types.h>
#include <hybridstore/search/search_types.h>
#include <hybridstore/storage/storage_backend.h>

namespace hybridstore::search {

/**
 * @brief Thin adapter over the backend's full-text index
 *
 * Ranks are non-negative and higher is better. Ties keep insertion order.
 */
class LexicalSearchEngine {
public:
    explicit LexicalSearchEngine(std::shared_ptr<storage::IStorageBackend> backend);

    /**
     * @return ValidationError for an empty query or limit < 1, FilterError for a malformed filter
     */
    Result<std::vector<SearchResult>> search(const std::string& queryText,
                                             const LexicalOptions& options) const;

private:
    std::shared_ptr<storage::IStorageBackend> backend_;
};

} // namespace hybridstore::search
