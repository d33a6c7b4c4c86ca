#include "message_guard.hpp"
#include "logger.hpp"

#include <stdexcept>
#include <string>
#include <variant>

#include <gtest/gtest.h>

using namespace wsgate;

namespace {

fwd::forward_msg make_text_msg(uint32_t id, std::string body) {
    fwd::forward_msg msg;
    msg.delta.id = id;
    msg.delta.new_element = fwd::text_element{std::move(body)};
    return msg;
}

void expect_data_too_large(const std::string& bytes, uint32_t expected_id) {
    const fwd::forward_msg decoded = fwd::parse(bytes);
    EXPECT_EQ(expected_id, decoded.delta.id);
    const auto* ex = std::get_if<fwd::exception_element>(&decoded.delta.new_element);
    ASSERT_NE(nullptr, ex);
    EXPECT_EQ("std::runtime_error", ex->type);
    EXPECT_EQ("Data too large", ex->message);
}

} // namespace

TEST(MessageGuardTest, DefaultLimitIsFiftyMegabytes) {
    EXPECT_EQ(50'000'000u, fwd::message_size_limit);
}

TEST(MessageGuardTest, SmallMessageIsSerializedUnchanged) {
    const fwd::forward_msg msg = make_text_msg(4, "hello world");
    const fwd::forward_msg before = msg;

    EXPECT_EQ(fwd::serialize(msg), fwd::serialize_forward_msg(msg));
    EXPECT_EQ(before, msg);
}

TEST(MessageGuardTest, MessageExactlyAtTheLimitIsKept) {
    const fwd::forward_msg msg = make_text_msg(4, std::string(300, 'x'));
    const std::string direct = fwd::serialize(msg);

    EXPECT_EQ(direct, fwd::serialize_forward_msg(msg, direct.size()));
}

TEST(MessageGuardTest, OversizedMessageBecomesException) {
    const fwd::forward_msg msg = make_text_msg(17, std::string(1000, 'x'));
    const fwd::forward_msg before = msg;
    const std::string direct = fwd::serialize(msg);

    const std::string guarded = fwd::serialize_forward_msg(msg, direct.size() - 1);

    EXPECT_LT(guarded.size(), direct.size());
    expect_data_too_large(guarded, 17);
    // The caller's message is never touched.
    EXPECT_EQ(before, msg);
}

TEST(MessageGuardTest, OversizedMessageAgainstDefaultLimit) {
    const fwd::forward_msg msg = make_text_msg(2, std::string(fwd::message_size_limit, 'a'));

    const std::string guarded = fwd::serialize_forward_msg(msg);

    EXPECT_LT(guarded.size(), 1024u);
    expect_data_too_large(guarded, 2);
}

TEST(MessageGuardTest, ReplacementOverTheLimitIsStillReturned) {
    const fwd::forward_msg msg = make_text_msg(9, std::string(100, 'x'));

    // No payload fits in 8 bytes; the exception message is sent anyway.
    const std::string guarded = fwd::serialize_forward_msg(msg, 8);

    EXPECT_GT(guarded.size(), 8u);
    EXPECT_LT(guarded.size(), fwd::serialize(msg).size());
    expect_data_too_large(guarded, 9);
}

TEST(MessageGuardTest, NeverReturnsMoreBytesThanTheOriginal) {
    const fwd::forward_msg msg = make_text_msg(1, "");
    const std::string direct = fwd::serialize(msg);

    // The exception message is longer than this tiny text message.
    const std::string guarded = fwd::serialize_forward_msg(msg, direct.size() - 1);

    EXPECT_LE(guarded.size(), direct.size());
    EXPECT_EQ(direct, guarded);
}

TEST(MessageGuardTest, ToExceptionMsgKeepsOnlyTheDeltaId) {
    fwd::forward_msg msg = make_text_msg(42, "payload that must disappear");

    const fwd::forward_msg replacement = fwd::to_exception_msg(std::move(msg), std::invalid_argument("bad column"));

    EXPECT_EQ(42u, replacement.delta.id);
    const auto* ex = std::get_if<fwd::exception_element>(&replacement.delta.new_element);
    ASSERT_NE(nullptr, ex);
    EXPECT_EQ("std::invalid_argument", ex->type);
    EXPECT_EQ("bad column", ex->message);
}

TEST(MessageGuardTest, OversizedMessageWarningIsTaggedWithTheDelta) {
    const fwd::forward_msg msg = make_text_msg(31, std::string(500, 'x'));
    const log::Level saved = log::get_level();
    log::set_level(log::Level::Info);

    ::testing::internal::CaptureStdout();
    const std::string guarded = fwd::serialize_forward_msg(msg, 200);
    const std::string out = ::testing::internal::GetCapturedStdout();
    log::set_level(saved);

    expect_data_too_large(guarded, 31);
    EXPECT_NE(std::string::npos, out.find("[delta 31] ForwardMsg for delta 31 is"));
}
