#include <gtest/gtest.h>
#include <hybridstore/core/uuid.h>

#include <chrono>
#include <set>
#include <string>

using namespace hybridstore::core;

namespace {

bool is_ascii_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

TEST(UuidTest, HasVersion4Format) {
    auto uuid = generateUUID();
    ASSERT_EQ(uuid.size(), 36u);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            EXPECT_EQ(uuid[i], '-');
        } else {
            EXPECT_TRUE(is_ascii_lower_hex(uuid[i])) << "position " << i << " in " << uuid;
        }
    }
    // Version nibble and variant bits
    EXPECT_EQ(uuid[14], '4');
    char v = uuid[19];
    EXPECT_TRUE(v == '8' || v == '9' || v == 'a' || v == 'b');
}

TEST(UuidTest, GeneratesUniqueValues) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(generateUUID());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(TimestampTest, FormatsIso8601WithMilliseconds) {
    // 2021-01-01T00:00:00.250Z
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1609459200250LL)};
    EXPECT_EQ(formatTimestamp(tp), "2021-01-01T00:00:00.250Z");
}
