#include <gtest/gtest.h>
#include <hybridstore/search/hybrid_fusion.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "common/test_helpers.h"

using namespace hybridstore;
using namespace hybridstore::search;
using hybridstore::metadata::Metadata;
using hybridstore::storage::StoredDocument;
using hybridstore::tests::FakeEmbeddingProvider;
using hybridstore::tests::FlakyStorageBackend;
using hybridstore::vector::DistanceMetric;

namespace {

SearchResult textHit(std::string id, double rank, int64_t seq) {
    SearchResult r;
    r.id = std::move(id);
    r.textRank = rank;
    r.seq = seq;
    return r;
}

SearchResult vectorHit(std::string id, double similarity, int64_t seq) {
    SearchResult r;
    r.id = std::move(id);
    r.similarity = similarity;
    r.seq = seq;
    return r;
}

std::vector<std::string> ids(const std::vector<SearchResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) {
        out.push_back(r.id);
    }
    return out;
}

size_t rankOf(const std::vector<SearchResult>& results, const std::string& id) {
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].id == id) {
            return i;
        }
    }
    return results.size();
}

} // namespace

// ===== Fusion Arithmetic =====

TEST(FuseRankingsTest, UnionOfBothListsWithMissingComponentsAsZero) {
    std::vector<SearchResult> text{textHit("a", 2.0, 1), textHit("b", 1.0, 2)};
    std::vector<SearchResult> vec{vectorHit("b", 0.9, 2), vectorHit("c", 0.5, 3)};

    auto fused = fuseRankings(text, vec, FusionWeights{0.5, 0.5}, 10);
    ASSERT_EQ(ids(fused), (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_DOUBLE_EQ(*fused[0].fusedScore, 1.0);
    EXPECT_DOUBLE_EQ(*fused[0].vectorRank, 0.0);
    EXPECT_FALSE(fused[0].similarity.has_value());

    EXPECT_DOUBLE_EQ(*fused[1].fusedScore, 0.5 * 1.0 + 0.5 * 0.9);
    EXPECT_DOUBLE_EQ(*fused[1].textRank, 1.0);
    EXPECT_DOUBLE_EQ(*fused[1].similarity, 0.9);

    EXPECT_DOUBLE_EQ(*fused[2].fusedScore, 0.25);
    EXPECT_DOUBLE_EQ(*fused[2].textRank, 0.0);
}

TEST(FuseRankingsTest, ZeroWeightSilencesASignal) {
    std::vector<SearchResult> text{textHit("a", 2.0, 1), textHit("b", 1.0, 2)};
    std::vector<SearchResult> vec{vectorHit("b", 0.9, 2), vectorHit("c", 0.5, 3)};

    auto textOnly = fuseRankings(text, vec, FusionWeights{1.0, 0.0}, 10);
    EXPECT_EQ(ids(textOnly), (std::vector<std::string>{"a", "b", "c"}));

    auto vectorOnly = fuseRankings(text, vec, FusionWeights{0.0, 1.0}, 10);
    EXPECT_EQ(ids(vectorOnly), (std::vector<std::string>{"b", "c", "a"}));
}

TEST(FuseRankingsTest, WeightsNeedNotSumToOne) {
    std::vector<SearchResult> text{textHit("a", 1.0, 1)};
    std::vector<SearchResult> vec{vectorHit("a", 0.5, 1)};
    auto fused = fuseRankings(text, vec, FusionWeights{2.0, 4.0}, 10);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_DOUBLE_EQ(*fused[0].fusedScore, 4.0);
}

TEST(FuseRankingsTest, DoublingVectorWeightNeverDemotesSimilarDocuments) {
    // "v" and "w" have positive similarity; "t", "u" and "z" have none
    std::vector<SearchResult> text{textHit("t", 1.0, 1), textHit("u", 0.6, 2),
                                   textHit("v", 0.2, 3), textHit("z", 0.1, 5)};
    std::vector<SearchResult> vec{vectorHit("v", 0.5, 3), vectorHit("w", 0.3, 4),
                                  vectorHit("z", 0.0, 5)};
    const std::vector<std::string> similar{"v", "w"};
    const std::vector<std::string> dissimilar{"t", "u", "z"};

    auto before = fuseRankings(text, vec, FusionWeights{1.0, 0.1}, 10);
    EXPECT_EQ(ids(before).front(), "t");
    for (double vw = 0.2; vw <= 6.4; vw *= 2) {
        auto after = fuseRankings(text, vec, FusionWeights{1.0, vw}, 10);
        ASSERT_EQ(after.size(), 5u);
        for (const auto& p : similar) {
            for (const auto& q : dissimilar) {
                if (rankOf(before, p) < rankOf(before, q)) {
                    EXPECT_LT(rankOf(after, p), rankOf(after, q))
                        << p << " fell below " << q << " at vectorWeight " << vw;
                }
            }
        }
        before = std::move(after);
    }
    EXPECT_EQ(ids(before).front(), "v");
}

TEST(FuseRankingsTest, TiesBreakByInsertionOrder) {
    std::vector<SearchResult> text{textHit("late", 1.0, 9), textHit("early", 1.0, 4)};
    auto fused = fuseRankings(text, {}, FusionWeights{1.0, 1.0}, 10);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"early", "late"}));
}

TEST(FuseRankingsTest, TruncatesAfterSorting) {
    std::vector<SearchResult> text{textHit("low", 0.1, 1), textHit("high", 5.0, 2)};
    std::vector<SearchResult> vec{vectorHit("mid", 0.8, 3)};
    auto fused = fuseRankings(text, vec, FusionWeights{}, 1);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"high"}));
}

TEST(FuseRankingsTest, EmptyInputsGiveEmptyOutput) {
    EXPECT_TRUE(fuseRankings({}, {}, FusionWeights{}, 10).empty());
}

TEST(ValidateWeightsTest, RejectsNegativeAndNonFinite) {
    EXPECT_TRUE(validateWeights(FusionWeights{0.0, 0.0}));
    EXPECT_TRUE(validateWeights(FusionWeights{3.0, 0.25}));

    for (auto bad : {-0.1, std::numeric_limits<double>::infinity(),
                     std::numeric_limits<double>::quiet_NaN()}) {
        auto textResult = validateWeights(FusionWeights{bad, 0.5});
        ASSERT_FALSE(textResult);
        EXPECT_EQ(textResult.error().code, ErrorCode::ValidationError);

        auto vectorResult = validateWeights(FusionWeights{0.5, bad});
        ASSERT_FALSE(vectorResult);
        EXPECT_EQ(vectorResult.error().code, ErrorCode::ValidationError);
    }
}

// ===== Ranker =====

class HybridFusionRankerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FlakyStorageBackend>();
        ASSERT_TRUE(backend_->open());
        ASSERT_TRUE(backend_->createSchema(3, DistanceMetric::Cosine));
        ASSERT_TRUE(backend_->insertRows({
            row("a", "a cat naps", {1, 0, 0}),
            row("b", "a dog barks", {0, 1, 0}),
            row("c", "birds sing", {0, 0, 1}),
            row("d", "fish swim", {0.7f, 0.7f, 0}),
        }));

        provider_ = std::make_shared<FakeEmbeddingProvider>(3);
        provider_->setVector("cat", {1, 0, 0});
        provider_->setVector("dog", {0, 1, 0});

        vector::EmbeddingClientConfig clientConfig;
        clientConfig.dimensions = 3;
        auto embedder = std::make_shared<vector::EmbeddingClient>(provider_, nullptr, clientConfig);
        auto similarity =
            std::make_shared<SimilaritySearchEngine>(backend_, 3, DistanceMetric::Cosine);
        auto lexical = std::make_shared<LexicalSearchEngine>(backend_);
        ranker_ = std::make_unique<HybridFusionRanker>(embedder, similarity, lexical);
    }

    static StoredDocument row(std::string id, std::string content, Embedding embedding) {
        StoredDocument doc;
        doc.id = std::move(id);
        doc.content = std::move(content);
        doc.embedding = std::move(embedding);
        doc.metadata = Metadata{{"owner", doc.id}};
        return doc;
    }

    static HybridSearchOptions weights(double text, double vector) {
        HybridSearchOptions options;
        options.textWeight = text;
        options.vectorWeight = vector;
        return options;
    }

    std::shared_ptr<FlakyStorageBackend> backend_;
    std::shared_ptr<FakeEmbeddingProvider> provider_;
    std::unique_ptr<HybridFusionRanker> ranker_;
};

TEST_F(HybridFusionRankerTest, TextOnlyWeightsFollowLexicalOrder) {
    auto results = ranker_->search("cat", weights(1.0, 0.0));
    ASSERT_TRUE(results) << results.error().message;
    ASSERT_FALSE(results.value().empty());
    EXPECT_EQ(results.value().front().id, "a");
    EXPECT_GT(*results.value().front().textRank, 0.0);

    // Every vector candidate is still present, scored on text alone
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(HybridFusionRankerTest, VectorOnlyWeightsFollowSimilarityOrder) {
    auto results = ranker_->search("dog", weights(0.0, 1.0));
    ASSERT_TRUE(results);
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"b", "d", "a", "c"}));
    EXPECT_NEAR(*results.value().front().vectorRank, 1.0, 1e-6);
}

TEST_F(HybridFusionRankerTest, LimitBoundsResults) {
    auto options = weights(0.5, 0.5);
    options.limit = 2;
    auto results = ranker_->search("cat", options);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 2u);
    EXPECT_EQ(results.value().front().id, "a");
}

TEST_F(HybridFusionRankerTest, FilterAppliesToBothEngines) {
    auto options = weights(0.5, 0.5);
    options.filter.equals("owner", "b");
    auto results = ranker_->search("cat", options);
    ASSERT_TRUE(results);
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"b"}));
}

// ===== Failure Handling =====

TEST_F(HybridFusionRankerTest, VectorFailureFailsClosedByDefault) {
    backend_->failVectorSearch(Error{ErrorCode::DatabaseError, "vector index unreadable"});
    auto results = ranker_->search("cat", weights(0.5, 0.5));
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::DatabaseError);
}

TEST_F(HybridFusionRankerTest, VectorFailureDegradesToLexicalWhenAllowed) {
    backend_->failVectorSearch(Error{ErrorCode::DatabaseError, "vector index unreadable"});
    auto options = weights(0.5, 0.5);
    options.degradeOnPartialFailure = true;
    auto results = ranker_->search("cat", options);
    ASSERT_TRUE(results) << results.error().message;
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"a"}));
    EXPECT_DOUBLE_EQ(*results.value().front().vectorRank, 0.0);
}

TEST_F(HybridFusionRankerTest, TextFailureDegradesToVectorWhenAllowed) {
    backend_->failTextSearch(Error{ErrorCode::DatabaseError, "fts corrupt"});

    auto strict = ranker_->search("cat", weights(0.5, 0.5));
    ASSERT_FALSE(strict);

    auto options = weights(0.5, 0.5);
    options.degradeOnPartialFailure = true;
    auto results = ranker_->search("cat", options);
    ASSERT_TRUE(results);
    EXPECT_EQ(results.value().size(), 4u);
    EXPECT_EQ(results.value().front().id, "a");
    EXPECT_DOUBLE_EQ(*results.value().front().textRank, 0.0);
}

TEST_F(HybridFusionRankerTest, BothEnginesFailingReturnsLexicalError) {
    backend_->failTextSearch(Error{ErrorCode::Timeout, "fts locked"});
    backend_->failVectorSearch(Error{ErrorCode::DatabaseError, "vector index unreadable"});
    auto options = weights(0.5, 0.5);
    options.degradeOnPartialFailure = true;
    auto results = ranker_->search("cat", options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::Timeout);
    EXPECT_NE(results.error().message.find("fts locked"), std::string::npos);
}

TEST_F(HybridFusionRankerTest, EmbeddingFailureIsNeverDegraded) {
    provider_->failWith(Error{ErrorCode::InternalError, "provider offline"});
    auto options = weights(0.5, 0.5);
    options.degradeOnPartialFailure = true;
    auto results = ranker_->search("cat", options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::EmbeddingError);
}

// ===== Validation =====

TEST_F(HybridFusionRankerTest, InvalidInputFailsBeforeEmbedding) {
    auto empty = ranker_->search("", weights(0.5, 0.5));
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    auto negative = ranker_->search("cat", weights(-1.0, 0.5));
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, ErrorCode::ValidationError);

    auto zeroLimit = weights(0.5, 0.5);
    zeroLimit.limit = 0;
    auto limited = ranker_->search("cat", zeroLimit);
    ASSERT_FALSE(limited);
    EXPECT_EQ(limited.error().code, ErrorCode::ValidationError);

    auto badFilter = weights(0.5, 0.5);
    badFilter.filter.equals("", 1);
    auto filtered = ranker_->search("cat", badFilter);
    ASSERT_FALSE(filtered);
    EXPECT_EQ(filtered.error().code, ErrorCode::FilterError);

    EXPECT_EQ(provider_->calls(), 0u);
}
