/**
 * @file test_session_id.cpp
 * @brief Unit tests for session identifier generation
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/session_id.h>

#include <set>
#include <string>

namespace kcenon::chunked_upload::test {

class SessionIdTest : public ::testing::Test {};

TEST_F(SessionIdTest, GeneratedIdHasExpectedShape) {
    auto id = generate_session_id();
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().size(), session_id_length);
    EXPECT_TRUE(is_valid_session_id(id.value()));
}

TEST_F(SessionIdTest, GeneratedIdsAreDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        auto id = generate_session_id();
        ASSERT_TRUE(id.has_value());
        ids.insert(id.value());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(SessionIdTest, RandomHexLength) {
    auto hex = random_hex(8);
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex.value().size(), 16u);

    auto empty = random_hex(0);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(SessionIdTest, RejectsMalformedIds) {
    EXPECT_FALSE(is_valid_session_id(""));
    EXPECT_FALSE(is_valid_session_id("abc"));
    EXPECT_FALSE(is_valid_session_id(std::string(31, 'a')));
    EXPECT_FALSE(is_valid_session_id(std::string(33, 'a')));
    EXPECT_FALSE(is_valid_session_id(std::string(32, 'A')));
    EXPECT_FALSE(is_valid_session_id(std::string(30, 'a') + "/."));
    EXPECT_FALSE(is_valid_session_id("../../../../../../../../etc/pass"));

    EXPECT_TRUE(is_valid_session_id(std::string(32, 'f')));
    EXPECT_TRUE(is_valid_session_id("0123456789abcdef0123456789abcdef"));
}

}  // namespace kcenon::chunked_upload::test
