#include <gtest/gtest.h>
#include <hybridstore/storage/sqlite_backend.h>
#include <hybridstore/store/document_store.h>

#include <cmath>
#include <limits>
#include <memory>
#include <set>

#include "common/test_helpers.h"

using namespace hybridstore;
using namespace hybridstore::store;
using hybridstore::metadata::Metadata;
using hybridstore::metadata::MetadataArray;
using hybridstore::metadata::MetadataFilter;
using hybridstore::tests::FakeEmbeddingProvider;
using hybridstore::vector::DistanceMetric;

class DocumentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<storage::SqliteStorageBackend>();
        ASSERT_TRUE(backend_->open());
        ASSERT_TRUE(backend_->createSchema(3, DistanceMetric::Cosine));

        provider_ = std::make_shared<FakeEmbeddingProvider>(3);
        provider_->setVector("cat", {1, 0, 0});
        provider_->setVector("dog", {0, 1, 0});
        provider_->setVector("bird", {0, 0, 1});

        vector::EmbeddingClientConfig clientConfig;
        clientConfig.dimensions = 3;
        auto embedder = std::make_shared<vector::EmbeddingClient>(provider_, nullptr, clientConfig);

        DocumentStoreConfig cfg;
        cfg.dimensions = 3;
        cfg.metric = DistanceMetric::Cosine;
        cfg.tableName = "documents";
        store_ = std::make_unique<DocumentStore>(backend_, embedder, cfg);
    }

    static DocumentInput doc(std::string content, std::optional<std::string> id = std::nullopt) {
        DocumentInput input;
        input.id = std::move(id);
        input.content = std::move(content);
        return input;
    }

    size_t count() { return store_->stats().value().totalDocuments; }

    std::shared_ptr<storage::SqliteStorageBackend> backend_;
    std::shared_ptr<FakeEmbeddingProvider> provider_;
    std::unique_ptr<DocumentStore> store_;
};

// ===== Insert =====

TEST_F(DocumentStoreTest, InsertEmbedsContentAndAssignsIds) {
    auto ids = store_->insert({doc("cat"), doc("dog")});
    ASSERT_TRUE(ids) << ids.error().message;
    ASSERT_EQ(ids.value().size(), 2u);
    EXPECT_NE(ids.value()[0], ids.value()[1]);
    EXPECT_EQ(ids.value()[0].size(), 36u);

    EXPECT_EQ(provider_->calls(), 1u);
    EXPECT_EQ(provider_->lastBatch(), (std::vector<std::string>{"cat", "dog"}));

    auto cat = store_->get(ids.value()[0]);
    ASSERT_TRUE(cat);
    EXPECT_EQ(cat.value().content, "cat");
    EXPECT_EQ(cat.value().embedding, (Embedding{1, 0, 0}));
    EXPECT_FALSE(cat.value().createdAt.empty());
    EXPECT_EQ(count(), 2u);
}

TEST_F(DocumentStoreTest, RoundTripPreservesEveryField) {
    DocumentInput input = doc("a document with metadata", "doc-1");
    input.metadata = Metadata{{"title", "Intro"},
                              {"rank", 3},
                              {"score", 0.25},
                              {"draft", false},
                              {"tags", MetadataArray{"x", "y"}}};
    input.embedding = Embedding{0.1f, 0.2f, 0.3f};
    auto id = store_->insertOne(input);
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), "doc-1");

    auto stored = store_->get("doc-1");
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.value().id, "doc-1");
    EXPECT_EQ(stored.value().content, input.content);
    EXPECT_EQ(stored.value().metadata, input.metadata);
    EXPECT_EQ(stored.value().embedding, *input.embedding);
}

TEST_F(DocumentStoreTest, ExplicitEmbeddingsSkipProvider) {
    DocumentInput withVector = doc("explicit", "e1");
    withVector.embedding = Embedding{1, 1, 0};
    ASSERT_TRUE(store_->insert({withVector}));
    EXPECT_EQ(provider_->calls(), 0u);

    // Mixed batch: only the documents without vectors reach the provider
    DocumentInput second = doc("also explicit", "e2");
    second.embedding = Embedding{0, 1, 1};
    auto ids = store_->insert({doc("bird", "p1"), second, doc("cat", "p2")});
    ASSERT_TRUE(ids);
    EXPECT_EQ(ids.value(), (std::vector<std::string>{"p1", "e2", "p2"}));
    EXPECT_EQ(provider_->calls(), 1u);
    EXPECT_EQ(provider_->lastBatch(), (std::vector<std::string>{"bird", "cat"}));
    EXPECT_EQ(store_->get("e2").value().embedding, (Embedding{0, 1, 1}));
    EXPECT_EQ(store_->get("p2").value().embedding, (Embedding{1, 0, 0}));
}

TEST_F(DocumentStoreTest, EmptyBatchIsNoOp) {
    auto ids = store_->insert({});
    ASSERT_TRUE(ids);
    EXPECT_TRUE(ids.value().empty());
    EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(DocumentStoreTest, InvalidDocumentsRejectWholeBatchBeforeEmbedding) {
    auto expectRejected = [&](std::vector<DocumentInput> batch, ErrorCode code) {
        auto result = store_->insert(batch);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, code) << result.error().message;
    };

    expectRejected({doc("ok"), doc("")}, ErrorCode::ValidationError);
    expectRejected({doc("ok", "")}, ErrorCode::ValidationError);
    expectRejected({doc("one", "same"), doc("two", "same")}, ErrorCode::ValidationError);

    DocumentInput emptyKey = doc("ok");
    emptyKey.metadata = Metadata{{"", 1}};
    expectRejected({emptyKey}, ErrorCode::ValidationError);

    DocumentInput nanMeta = doc("ok");
    nanMeta.metadata =
        Metadata{{"nested", MetadataArray{1.0, std::numeric_limits<double>::quiet_NaN()}}};
    expectRejected({nanMeta}, ErrorCode::ValidationError);

    DocumentInput shortVector = doc("ok");
    shortVector.embedding = Embedding{1, 0};
    expectRejected({doc("fine"), shortVector}, ErrorCode::DimensionMismatch);

    DocumentInput nanVector = doc("ok");
    nanVector.embedding = Embedding{std::nanf(""), 0, 0};
    expectRejected({nanVector}, ErrorCode::ValidationError);

    EXPECT_EQ(provider_->calls(), 0u);
    EXPECT_EQ(count(), 0u);
}

TEST_F(DocumentStoreTest, ProviderFailureWritesNothing) {
    provider_->failWith(Error{ErrorCode::InternalError, "quota exceeded"});
    auto result = store_->insert({doc("cat"), doc("dog")});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingError);
    EXPECT_EQ(count(), 0u);
}

TEST_F(DocumentStoreTest, MalformedProviderOutputWritesNothing) {
    provider_->returnWrongDimensions(true);
    auto result = store_->insertOne(doc("cat"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingError);
    EXPECT_EQ(count(), 0u);
}

TEST_F(DocumentStoreTest, ExistingIdRejectsWholeBatch) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "taken")));
    auto result = store_->insert({doc("dog", "new"), doc("bird", "taken")});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(count(), 1u);
    EXPECT_EQ(store_->get("new").error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->get("taken").value().content, "cat");
}

TEST_F(DocumentStoreTest, InvalidUtf8MetadataIsRejectedWithoutThrowing) {
    DocumentInput bad = doc("cat", "bad");
    bad.metadata = Metadata{{"tag", "\xff\xfe"}};
    bad.embedding = Embedding{1, 0, 0};
    DocumentInput good = doc("dog", "good");

    auto result = store_->insert({good, bad});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(count(), 0u);
    EXPECT_EQ(provider_->calls(), 0u);

    DocumentInput badKey = doc("cat", "bad-key");
    badKey.metadata = Metadata{{"\xc3", "v"}};
    auto keyResult = store_->insert({badKey});
    ASSERT_FALSE(keyResult);
    EXPECT_EQ(keyResult.error().code, ErrorCode::ValidationError);

    DocumentInput nested = doc("cat", "nested");
    nested.metadata = Metadata{{"tags", MetadataArray{"ok", "\xed\xa0\x80"}}};
    auto nestedResult = store_->insert({nested});
    ASSERT_FALSE(nestedResult);
    EXPECT_EQ(nestedResult.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(count(), 0u);
}

// ===== Get =====

TEST_F(DocumentStoreTest, GetMissingIsNotFound) {
    auto result = store_->get("nope");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

// ===== Update =====

TEST_F(DocumentStoreTest, MetadataOnlyUpdateKeepsEmbedding) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));
    const auto calls = provider_->calls();

    DocumentPatch patch;
    patch.metadata = Metadata{{"reviewed", true}};
    ASSERT_TRUE(store_->update("d", patch));

    auto stored = store_->get("d").value();
    EXPECT_EQ(stored.metadata, (Metadata{{"reviewed", true}}));
    EXPECT_EQ(stored.content, "cat");
    EXPECT_EQ(stored.embedding, (Embedding{1, 0, 0}));
    EXPECT_EQ(provider_->calls(), calls);
}

TEST_F(DocumentStoreTest, ChangedContentIsReembedded) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));
    const auto calls = provider_->calls();

    DocumentPatch patch;
    patch.content = "dog";
    ASSERT_TRUE(store_->update("d", patch));

    auto stored = store_->get("d").value();
    EXPECT_EQ(stored.content, "dog");
    EXPECT_EQ(stored.embedding, (Embedding{0, 1, 0}));
    EXPECT_EQ(provider_->calls(), calls + 1);
}

TEST_F(DocumentStoreTest, UnchangedContentIsNotReembedded) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));
    const auto calls = provider_->calls();

    DocumentPatch patch;
    patch.content = "cat";
    ASSERT_TRUE(store_->update("d", patch));
    EXPECT_EQ(provider_->calls(), calls);
}

TEST_F(DocumentStoreTest, ExplicitEmbeddingWinsOverReembedding) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));
    const auto calls = provider_->calls();

    DocumentPatch patch;
    patch.content = "something else";
    patch.embedding = Embedding{0.5f, 0.5f, 0};
    ASSERT_TRUE(store_->update("d", patch));
    EXPECT_EQ(store_->get("d").value().embedding, (Embedding{0.5f, 0.5f, 0}));
    EXPECT_EQ(provider_->calls(), calls);
}

TEST_F(DocumentStoreTest, FailedReembeddingLeavesDocumentUntouched) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));
    provider_->failWith(Error{ErrorCode::InternalError, "offline"});

    DocumentPatch patch;
    patch.content = "dog";
    auto result = store_->update("d", patch);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingError);
    EXPECT_EQ(store_->get("d").value().content, "cat");
}

TEST_F(DocumentStoreTest, InvalidUpdatesAreRejected) {
    ASSERT_TRUE(store_->insertOne(doc("cat", "d")));

    auto empty = store_->update("d", DocumentPatch{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    DocumentPatch blank;
    blank.content = "";
    EXPECT_EQ(store_->update("d", blank).error().code, ErrorCode::ValidationError);

    DocumentPatch wrongDims;
    wrongDims.embedding = Embedding{1, 2, 3, 4};
    EXPECT_EQ(store_->update("d", wrongDims).error().code, ErrorCode::DimensionMismatch);

    DocumentPatch meta;
    meta.metadata = Metadata{{"k", "v"}};
    EXPECT_EQ(store_->update("missing", meta).error().code, ErrorCode::NotFound);

    DocumentPatch badUtf8;
    badUtf8.metadata = Metadata{{"tag", "\xff\xfe"}};
    auto rejected = store_->update("d", badUtf8);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::ValidationError);
    EXPECT_TRUE(store_->get("d").value().metadata.empty());
}

// ===== Remove =====

TEST_F(DocumentStoreTest, RemoveMissingIsNotFoundAndChangesNothing) {
    ASSERT_TRUE(store_->insert({doc("cat", "a"), doc("dog", "b")}));
    auto before = store_->stats().value();

    auto result = store_->remove("ghost");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->stats().value().totalDocuments, before.totalDocuments);

    ASSERT_TRUE(store_->remove("a"));
    EXPECT_EQ(count(), 1u);
    EXPECT_EQ(store_->get("a").error().code, ErrorCode::NotFound);
}

TEST_F(DocumentStoreTest, RemoveByFilter) {
    DocumentInput a = doc("cat", "a");
    a.metadata = Metadata{{"tags", MetadataArray{"pet", "indoor"}}};
    DocumentInput b = doc("dog", "b");
    b.metadata = Metadata{{"tags", MetadataArray{"pet"}}};
    DocumentInput c = doc("bird", "c");
    c.metadata = Metadata{{"tags", MetadataArray{"wild"}}};
    ASSERT_TRUE(store_->insert({a, b, c}));

    auto removed = store_->removeByFilter(MetadataFilter().contains("tags", "pet"));
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(count(), 1u);

    auto empty = store_->removeByFilter(MetadataFilter{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    auto bad = store_->removeByFilter(MetadataFilter().equals("", "x"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::FilterError);

    auto truncated = store_->removeByFilter(MetadataFilter().equals("tags", "\xc3"));
    ASSERT_FALSE(truncated);
    EXPECT_EQ(truncated.error().code, ErrorCode::FilterError);
    EXPECT_EQ(count(), 1u);
}

TEST_F(DocumentStoreTest, ClearRemovesEverything) {
    ASSERT_TRUE(store_->insert({doc("cat"), doc("dog"), doc("bird")}));
    ASSERT_TRUE(store_->clear());
    EXPECT_EQ(count(), 0u);
}

// ===== Stats =====

TEST_F(DocumentStoreTest, StatsDescribeTheStore) {
    ASSERT_TRUE(store_->insert({doc("cat"), doc("dog")}));
    auto stats = store_->stats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().totalDocuments, 2u);
    EXPECT_EQ(stats.value().dimensions, 3u);
    EXPECT_EQ(stats.value().metric, "cosine");
    EXPECT_EQ(stats.value().tableName, "documents");
    EXPECT_EQ(stats.value().backend, "sqlite");
    EXPECT_EQ(stats.value().indexType, "exact");
}
