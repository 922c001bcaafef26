#include <gtest/gtest.h>

#include <cxxcookie.hxx>

using namespace cxxcookie::http;

TEST(AttributeTest, RecognizeCaseInsensitive) {
    EXPECT_EQ(recognize("Expires"), e_attribute::expires);
    EXPECT_EQ(recognize("expires"), e_attribute::expires);
    EXPECT_EQ(recognize("Max-Age"), e_attribute::max_age);
    EXPECT_EQ(recognize("MAX-AGE"), e_attribute::max_age);
    EXPECT_EQ(recognize("Domain"), e_attribute::domain);
    EXPECT_EQ(recognize("path"), e_attribute::path);
    EXPECT_EQ(recognize("SECURE"), e_attribute::secure);
    EXPECT_EQ(recognize("httponly"), e_attribute::http_only);
    EXPECT_EQ(recognize("HttpOnly"), e_attribute::http_only);
    EXPECT_EQ(recognize("SameSite"), e_attribute::same_site);
}

TEST(AttributeTest, RecognizeRejectsUnknown) {
    EXPECT_FALSE(recognize("").has_value());
    EXPECT_FALSE(recognize("Foo").has_value());
    EXPECT_FALSE(recognize("MaxAge").has_value());
    EXPECT_FALSE(recognize("Http-Only").has_value());
    EXPECT_FALSE(recognize("Priority").has_value());
    EXPECT_FALSE(recognize("Partitioned").has_value());
    EXPECT_FALSE(recognize("Paths").has_value());
    EXPECT_FALSE(recognize(" Path").has_value());
}

TEST(AttributeTest, AttributeToStrRoundTrip) {
    for (const auto attribute : {e_attribute::expires, e_attribute::max_age, e_attribute::domain, e_attribute::path,
                                 e_attribute::secure, e_attribute::http_only, e_attribute::same_site}) {
        EXPECT_EQ(recognize(attribute_to_str(attribute)), attribute);

        EXPECT_EQ(to_attribute(to_field(attribute)), attribute);
    }

    EXPECT_EQ(attribute_to_str(e_attribute::max_age), "Max-Age");
    EXPECT_EQ(attribute_to_str(e_attribute::http_only), "HttpOnly");
    EXPECT_EQ(attribute_to_str(e_attribute::same_site), "SameSite");
}

TEST(AttributeTest, Flags) {
    EXPECT_TRUE(is_flag(e_attribute::secure));
    EXPECT_TRUE(is_flag(e_attribute::http_only));

    EXPECT_FALSE(is_flag(e_attribute::expires));
    EXPECT_FALSE(is_flag(e_attribute::max_age));
    EXPECT_FALSE(is_flag(e_attribute::domain));
    EXPECT_FALSE(is_flag(e_attribute::path));
    EXPECT_FALSE(is_flag(e_attribute::same_site));
}

TEST(AttributeTest, MandatoryFieldsHaveNoAttribute) {
    EXPECT_FALSE(to_attribute(e_field::name).has_value());
    EXPECT_FALSE(to_attribute(e_field::value).has_value());
}

TEST(AttributeTest, SameSite) {
    EXPECT_EQ(str_to_same_site("Strict"), e_same_site::strict);
    EXPECT_EQ(str_to_same_site("lax"), e_same_site::lax);
    EXPECT_EQ(str_to_same_site("NONE"), e_same_site::none);

    EXPECT_FALSE(str_to_same_site("").has_value());
    EXPECT_FALSE(str_to_same_site("relaxed").has_value());

    EXPECT_EQ(same_site_to_str(e_same_site::strict), "Strict");
    EXPECT_EQ(same_site_to_str(e_same_site::lax), "Lax");
    EXPECT_EQ(same_site_to_str(e_same_site::none), "None");
}

TEST(AttributeTest, Fnv1aHash) {
    static_assert(utils::fnv1a_hash("") == 2166136261u);

    EXPECT_EQ(utils::fnv1a_hash("a"), 0xE40C292Cu);
    EXPECT_NE(utils::fnv1a_hash("path"), utils::fnv1a_hash("Path"));
}

TEST(AttributeTest, TrimAndCtl) {
    EXPECT_EQ(utils::trim("  a b \t"), "a b");
    EXPECT_EQ(utils::trim(" \t "), "");
    EXPECT_EQ(utils::trim(""), "");
    EXPECT_EQ(utils::trim("x"), "x");

    EXPECT_FALSE(utils::has_ctl("a\tb"));
    EXPECT_TRUE(utils::has_ctl("a\rb"));
    EXPECT_TRUE(utils::has_ctl("a\nb"));
    EXPECT_TRUE(utils::has_ctl(std::string_view{"a\0b", 3u}));
    EXPECT_TRUE(utils::has_ctl("\x7F"));
}
