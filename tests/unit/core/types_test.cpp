#include <gtest/gtest.h>
#include <fmt/format.h>
#include <hybridstore/core/types.h>

#include <memory>
#include <string>
#include <vector>

using namespace hybridstore;

// ===== Result<T> =====

TEST(ResultTest, HoldsValue) {
    Result<int> r(42);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW(r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    Result<std::string> r(Error{ErrorCode::NotFound, "Document 'x' not found"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "Document 'x' not found");
    EXPECT_THROW(r.value(), std::runtime_error);
}

TEST(ResultTest, ErrorCodeOnlyUsesDefaultMessage) {
    Result<int> r(ErrorCode::Timeout);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, errorToString(ErrorCode::Timeout));
}

TEST(ResultTest, MovesOutMoveOnlyValue) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r);
    auto p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok);
    EXPECT_NO_THROW(ok.value());

    Result<void> failed(Error{ErrorCode::ValidationError, "bad"});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::ValidationError);
    EXPECT_THROW(failed.value(), std::runtime_error);
}

// ===== ErrorCode =====

TEST(ErrorCodeTest, RetryableCodes) {
    EXPECT_TRUE(isRetryable(ErrorCode::Timeout));
    EXPECT_TRUE(isRetryable(ErrorCode::EmbeddingError));
    EXPECT_TRUE(isRetryable(ErrorCode::DatabaseError));

    EXPECT_FALSE(isRetryable(ErrorCode::DimensionMismatch));
    EXPECT_FALSE(isRetryable(ErrorCode::NotFound));
    EXPECT_FALSE(isRetryable(ErrorCode::FilterError));
    EXPECT_FALSE(isRetryable(ErrorCode::ValidationError));
    EXPECT_FALSE(isRetryable(ErrorCode::AlreadyExists));
}

TEST(ErrorCodeTest, FormatsThroughFmt) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::DimensionMismatch), "Dimension mismatch");
    EXPECT_EQ(fmt::format("{}", ErrorCode::FilterError), "Invalid metadata filter");
}

TEST(ErrorCodeTest, ErrorComparesWithCode) {
    Error e{ErrorCode::AlreadyExists, "dup"};
    EXPECT_TRUE(e == ErrorCode::AlreadyExists);
    EXPECT_TRUE(ErrorCode::AlreadyExists == e);
    EXPECT_TRUE(e != ErrorCode::NotFound);
}
