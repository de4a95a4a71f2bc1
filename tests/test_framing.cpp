/**
 * @file test_framing.cpp
 * @brief Content-Length frame reading and writing.
 */
#include <gtest/gtest.h>
#include <sstream>
#include "rpc/framing.hpp"

using namespace codebox::rpc;

TEST(FramingTest, ReadsCrlfFrame) {
    std::istringstream in("Content-Length: 7\r\n\r\n{\"a\":1}");
    auto body = read_frame(in);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "{\"a\":1}");
}

TEST(FramingTest, HeaderNameIsCaseInsensitiveAndLfAccepted) {
    std::istringstream in("content-length:2\nContent-Type: application/json\n\n{}");
    auto body = read_frame(in);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "{}");
}

TEST(FramingTest, ReadsConsecutiveFrames) {
    std::istringstream in("Content-Length: 2\r\n\r\n[]Content-Length: 4\r\n\r\nnull");
    EXPECT_EQ(read_frame(in), std::optional<std::string>("[]"));
    EXPECT_EQ(read_frame(in), std::optional<std::string>("null"));
    EXPECT_FALSE(read_frame(in).has_value());
}

TEST(FramingTest, BodyIsExactlyLengthBytes) {
    // Newlines inside the body are not treated as header terminators
    std::istringstream in("Content-Length: 5\r\n\r\na\r\n\r\nrest");
    EXPECT_EQ(read_frame(in), std::optional<std::string>("a\r\n\r\n"));
}

TEST(FramingTest, MissingOrBadLengthEndsStream) {
    std::istringstream missing("X-Other: 1\r\n\r\n{}");
    EXPECT_FALSE(read_frame(missing).has_value());

    std::istringstream bad("Content-Length: twelve\r\n\r\n{}");
    EXPECT_FALSE(read_frame(bad).has_value());

    std::istringstream negative("Content-Length: -3\r\n\r\n{}");
    EXPECT_FALSE(read_frame(negative).has_value());
}

TEST(FramingTest, ShortBodyIsEndOfStream) {
    std::istringstream in("Content-Length: 10\r\n\r\nabc");
    EXPECT_FALSE(read_frame(in).has_value());
}

TEST(FramingTest, EmptyInputIsEndOfStream) {
    std::istringstream in("");
    EXPECT_FALSE(read_header(in).has_value());
}

TEST(FramingTest, WritesFrame) {
    std::ostringstream out;
    EXPECT_TRUE(write_frame(out, "{\"id\":1}"));
    EXPECT_EQ(out.str(), "Content-Length: 8\r\n\r\n{\"id\":1}");
}

TEST(FramingTest, WriteToFailedStreamReportsFailure) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_FALSE(write_frame(out, "{}"));
}
