#include <gtest/gtest.h>
#include <hybridstore/search/similarity_search.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include "common/test_helpers.h"

using namespace hybridstore;
using namespace hybridstore::search;
using hybridstore::metadata::Metadata;
using hybridstore::metadata::MetadataFilter;
using hybridstore::storage::StoredDocument;
using hybridstore::tests::FlakyStorageBackend;
using hybridstore::vector::DistanceMetric;

class SimilaritySearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FlakyStorageBackend>();
        ASSERT_TRUE(backend_->open());
        ASSERT_TRUE(backend_->createSchema(3, DistanceMetric::Cosine));
        ASSERT_TRUE(backend_->insertRows({
            row("a", {1, 0, 0}, Metadata{{"lang", "en"}}),
            row("b", {0, 1, 0}, Metadata{{"lang", "de"}}),
            row("c", {0.9f, 0.1f, 0}, Metadata{{"lang", "de"}}),
            row("d", {0.6f, 0.6f, 0.2f}, Metadata{{"lang", "en"}}),
        }));
        engine_ = std::make_unique<SimilaritySearchEngine>(backend_, 3, DistanceMetric::Cosine);
    }

    static StoredDocument row(std::string id, Embedding embedding, Metadata meta) {
        StoredDocument doc;
        doc.content = "document " + id;
        doc.id = std::move(id);
        doc.embedding = std::move(embedding);
        doc.metadata = std::move(meta);
        return doc;
    }

    static std::vector<std::string> ids(const std::vector<SearchResult>& results) {
        std::vector<std::string> out;
        for (const auto& r : results) {
            out.push_back(r.id);
        }
        return out;
    }

    std::shared_ptr<FlakyStorageBackend> backend_;
    std::unique_ptr<SimilaritySearchEngine> engine_;
    std::vector<float> query_{1, 0, 0};
};

// ===== Ranking =====

TEST_F(SimilaritySearchTest, OrdersBySimilarityDescending) {
    auto results = engine_->search(query_, SearchOptions{});
    ASSERT_TRUE(results) << results.error().message;
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"a", "c", "d", "b"}));

    const auto& r = results.value();
    EXPECT_NEAR(*r.front().similarity, 1.0, 1e-6);
    EXPECT_NEAR(*r.back().similarity, 0.0, 1e-6);
    for (size_t i = 1; i < r.size(); ++i) {
        EXPECT_GE(*r[i - 1].similarity, *r[i].similarity);
    }
    EXPECT_FALSE(r.front().textRank.has_value());
    EXPECT_FALSE(r.front().content.has_value());
}

TEST_F(SimilaritySearchTest, LimitTruncates) {
    SearchOptions options;
    options.limit = 2;
    auto results = engine_->search(query_, options);
    ASSERT_TRUE(results);
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"a", "c"}));
}

TEST_F(SimilaritySearchTest, RaisingThresholdNeverAddsResults) {
    std::vector<std::string> previous;
    bool first = true;
    for (double threshold : {-1.0, 0.0, 0.5, 0.8, 0.99, 1.0}) {
        SearchOptions options;
        options.threshold = threshold;
        auto results = engine_->search(query_, options);
        ASSERT_TRUE(results) << "threshold " << threshold;
        for (const auto& r : results.value()) {
            EXPECT_GE(*r.similarity, threshold - 1e-9);
        }
        auto current = ids(results.value());
        if (!first) {
            for (const auto& id : current) {
                EXPECT_NE(std::find(previous.begin(), previous.end(), id), previous.end())
                    << id << " appeared when threshold rose to " << threshold;
            }
        }
        previous = std::move(current);
        first = false;
    }
}

TEST_F(SimilaritySearchTest, ThresholdAppliesBeforeLimit) {
    SearchOptions options;
    options.threshold = 0.9;
    options.limit = 10;
    auto results = engine_->search(query_, options);
    ASSERT_TRUE(results);
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"a", "c"}));
}

TEST_F(SimilaritySearchTest, FilterRestrictsCandidates) {
    SearchOptions options;
    options.filter.equals("lang", "de");
    auto results = engine_->search(query_, options);
    ASSERT_TRUE(results);
    EXPECT_EQ(ids(results.value()), (std::vector<std::string>{"c", "b"}));
}

// ===== Validation =====

TEST_F(SimilaritySearchTest, ZeroLimitIsValidationError) {
    SearchOptions options;
    options.limit = 0;
    auto results = engine_->search(query_, options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::ValidationError);
}

TEST_F(SimilaritySearchTest, WrongQueryLengthIsDimensionMismatch) {
    std::vector<float> shortQuery{1, 0};
    auto results = engine_->search(shortQuery, SearchOptions{});
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::DimensionMismatch);
}

TEST_F(SimilaritySearchTest, NonFiniteInputIsValidationError) {
    std::vector<float> nanQuery{std::nanf(""), 0, 0};
    auto results = engine_->search(nanQuery, SearchOptions{});
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::ValidationError);

    SearchOptions options;
    options.threshold = std::numeric_limits<double>::infinity();
    auto bad = engine_->search(query_, options);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ValidationError);
}

TEST_F(SimilaritySearchTest, EmptyFilterKeyIsFilterError) {
    SearchOptions options;
    options.filter.equals("", "x");
    auto results = engine_->search(query_, options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::FilterError);
}

TEST_F(SimilaritySearchTest, BackendFailureIsPropagated) {
    backend_->failVectorSearch(Error{ErrorCode::DatabaseError, "disk on fire"});
    auto results = engine_->search(query_, SearchOptions{});
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::DatabaseError);
    EXPECT_NE(results.error().message.find("disk on fire"), std::string::npos);
}
