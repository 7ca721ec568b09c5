#include <hybridstore/search/hybrid_fusion.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace hybridstore::search {

namespace {

struct FusionEntry {
    std::string id;
    int64_t seq = 0;
    double textRank = 0.0;
    double vectorRank = 0.0;
    std::optional<double> similarity;
};

} // namespace

std::vector<SearchResult> fuseRankings(const std::vector<SearchResult>& textHits,
                                       const std::vector<SearchResult>& vectorHits,
                                       FusionWeights weights, size_t limit) {
    std::vector<FusionEntry> entries;
    std::unordered_map<std::string, size_t> index;
    entries.reserve(textHits.size() + vectorHits.size());

    auto entryFor = [&](const SearchResult& hit) -> FusionEntry& {
        auto [it, inserted] = index.try_emplace(hit.id, entries.size());
        if (inserted) {
            FusionEntry e;
            e.id = hit.id;
            e.seq = hit.seq;
            entries.push_back(std::move(e));
        }
        return entries[it->second];
    };

    for (const auto& hit : textHits) {
        entryFor(hit).textRank = hit.textRank.value_or(0.0);
    }
    for (const auto& hit : vectorHits) {
        auto& e = entryFor(hit);
        e.vectorRank = hit.similarity.value_or(0.0);
        e.similarity = hit.similarity;
    }

    std::vector<SearchResult> fused;
    fused.reserve(entries.size());
    for (auto& e : entries) {
        SearchResult r;
        r.id = std::move(e.id);
        r.seq = e.seq;
        r.textRank = e.textRank;
        r.vectorRank = e.vectorRank;
        r.similarity = e.similarity;
        r.fusedScore = weights.text * e.textRank + weights.vector * e.vectorRank;
        fused.push_back(std::move(r));
    }

    std::sort(fused.begin(), fused.end(), [](const SearchResult& a, const SearchResult& b) {
        if (*a.fusedScore != *b.fusedScore) {
            return *a.fusedScore > *b.fusedScore;
        }
        return a.seq < b.seq;
    });

    if (fused.size() > limit) {
        fused.resize(limit);
    }
    return fused;
}

Result<void> validateWeights(FusionWeights weights) {
    auto check = [](double w, const char* name) -> Result<void> {
        if (!std::isfinite(w) || w < 0.0) {
            return Error{ErrorCode::ValidationError,
                         std::string(name) + " must be finite and non-negative, got " +
                             std::to_string(w)};
        }
        return Result<void>();
    };
    if (auto r = check(weights.text, "textWeight"); !r) {
        return r;
    }
    return check(weights.vector, "vectorWeight");
}

HybridFusionRanker::HybridFusionRanker(std::shared_ptr<vector::EmbeddingClient> embedder,
                                       std::shared_ptr<SimilaritySearchEngine> similarity,
                                       std::shared_ptr<LexicalSearchEngine> lexical)
    : embedder_(std::move(embedder)),
      similarity_(std::move(similarity)),
      lexical_(std::move(lexical)) {}

Result<std::vector<SearchResult>>
HybridFusionRanker::search(const std::string& queryText,
                           const HybridSearchOptions& options) const {
    if (queryText.empty()) {
        return Error{ErrorCode::ValidationError, "Query text must not be empty"};
    }
    if (options.limit < 1) {
        return Error{ErrorCode::ValidationError, "Search limit must be at least 1"};
    }
    FusionWeights weights{options.textWeight, options.vectorWeight};
    if (auto valid = validateWeights(weights); !valid) {
        return valid.error();
    }
    if (auto valid = options.filter.validate(); !valid) {
        return valid.error();
    }

    auto queryVector = embedder_->embedOne(queryText);
    if (!queryVector) {
        spdlog::error("Hybrid search could not embed query: {}", queryVector.error().message);
        return queryVector.error();
    }

    LexicalOptions lexicalOptions;
    lexicalOptions.limit = options.limit;
    lexicalOptions.filter = options.filter;
    auto textHits = lexical_->search(queryText, lexicalOptions);

    SearchOptions vectorOptions;
    vectorOptions.limit = options.limit;
    vectorOptions.filter = options.filter;
    auto vectorHits = similarity_->search(queryVector.value(), vectorOptions);

    if (!textHits && !vectorHits) {
        return textHits.error();
    }

    std::vector<SearchResult> emptyHits;
    if (!textHits || !vectorHits) {
        const auto& failure = !textHits ? textHits.error() : vectorHits.error();
        const char* side = !textHits ? "lexical" : "vector";
        if (!options.degradeOnPartialFailure) {
            return failure;
        }
        spdlog::warn("Hybrid search degraded: {} engine failed ({}: {})", side, failure.code,
                     failure.message);
    }

    const auto& text = textHits ? textHits.value() : emptyHits;
    const auto& vec = vectorHits ? vectorHits.value() : emptyHits;
    auto fused = fuseRankings(text, vec, weights, options.limit);

    spdlog::debug("Hybrid search fused {} text and {} vector candidates into {} results",
                  text.size(), vec.size(), fused.size());
    return fused;
}

} // namespace hybridstore::search
