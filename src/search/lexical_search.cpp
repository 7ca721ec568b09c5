#include <hybridstore/search/lexical_search.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace hybridstore::search {

LexicalSearchEngine::LexicalSearchEngine(std::shared_ptr<storage::IStorageBackend> backend)
    : backend_(std::move(backend)) {}

Result<std::vector<SearchResult>>
LexicalSearchEngine::search(const std::string& queryText, const LexicalOptions& options) const {
    if (queryText.empty()) {
        return Error{ErrorCode::ValidationError, "Query text must not be empty"};
    }
    if (options.limit < 1) {
        return Error{ErrorCode::ValidationError, "Search limit must be at least 1"};
    }
    auto valid = options.filter.validate();
    if (!valid) {
        return valid.error();
    }

    auto hits = backend_->textTopK(queryText, options.limit, options.filter);
    if (!hits) {
        spdlog::error("Lexical search for '{}' failed: {}", queryText, hits.error().message);
        return Error{hits.error().code, "textTopK: " + hits.error().message};
    }

    std::vector<SearchResult> results;
    results.reserve(hits.value().size());
    for (const auto& hit : hits.value()) {
        SearchResult r;
        r.id = hit.id;
        r.seq = hit.seq;
        r.textRank = std::max(0.0, hit.textRank);
        results.push_back(std::move(r));
    }

    // Backends order by rank; make the insertion-order tie-break explicit
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         if (*a.textRank != *b.textRank) {
                             return *a.textRank > *b.textRank;
                         }
                         return a.seq < b.seq;
                     });

    spdlog::debug("Lexical search for '{}' returned {} results", queryText, results.size());
    return results;
}

} // namespace hybridstore::search
