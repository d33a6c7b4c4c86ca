#include "exception_marshal.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using namespace wsgate;

namespace marshal_test {

class quota_exceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace marshal_test

TEST(ExceptionMarshalTest, RecordsTypeAndMessage) {
    fwd::exception_element element;
    fwd::marshall(element, std::runtime_error("Data too large"));

    EXPECT_EQ("std::runtime_error", element.type);
    EXPECT_EQ("Data too large", element.message);
}

TEST(ExceptionMarshalTest, UsesTheDynamicType) {
    const marshal_test::quota_exceeded thrown("quota of 3 reached");
    const std::exception& base = thrown;

    fwd::exception_element element;
    fwd::marshall(element, base);

    EXPECT_EQ("marshal_test::quota_exceeded", element.type);
    EXPECT_EQ("quota of 3 reached", element.message);
}

TEST(ExceptionMarshalTest, OverwritesPreviousContent) {
    fwd::exception_element element{"old", "old message", {"old frame"}};
    fwd::marshall(element, std::logic_error("new"));

    EXPECT_EQ("std::logic_error", element.type);
    EXPECT_EQ("new", element.message);
#ifndef USE_STACKTRACE
    EXPECT_TRUE(element.stack_trace.empty());
#else
    EXPECT_FALSE(element.stack_trace.empty());
#endif
}
