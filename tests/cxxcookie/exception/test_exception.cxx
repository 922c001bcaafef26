#include <gtest/gtest.h>

#include <cxxcookie.hxx>

using namespace cxxcookie;

TEST(ExceptionTest, PlainMessage) {
    base_exception_t e("plain");

    EXPECT_STREQ(e.what(), "plain");
    EXPECT_EQ(e.message(), "plain");
    EXPECT_EQ(e.error(), e_error::none);
    EXPECT_TRUE(e.prefix().empty());
}

TEST(ExceptionTest, PrefixedMessage) {
    base_exception_t e("boom", e_error::none, "Custom");

    EXPECT_STREQ(e.what(), "[Custom] boom");
    EXPECT_EQ(e.message(), "boom");
    EXPECT_EQ(e.prefix(), "Custom");
}

TEST(ExceptionTest, MalformedCookie) {
    exceptions::malformed_cookie_t e("Cookie name is empty");

    EXPECT_EQ(e.error(), e_error::malformed_cookie);
    EXPECT_STREQ(e.what(), "[Cookie-Parse] Cookie name is empty");
}

TEST(ExceptionTest, InvalidOperation) {
    exceptions::invalid_operation_t e("Cannot remove mandatory field 'name'");

    EXPECT_EQ(e.error(), e_error::invalid_operation);
    EXPECT_STREQ(e.what(), "[Cookie-Operation] Cannot remove mandatory field 'name'");
}

TEST(ExceptionTest, CatchAsBase) {
    try {
        throw exceptions::invalid_operation_t("nope");
    }
    catch (const base_exception_t& e) {
        EXPECT_EQ(e.error(), e_error::invalid_operation);

        return;
    }

    FAIL() << "exception not caught as base_exception_t";
}
