#include <gtest/gtest.h>

#include <cxxcookie.hxx>

using namespace cxxcookie::http;
using namespace cxxcookie::http::internal;

// concatenating the segments in order must give back the buffer
static void expect_consistent(const slice_index_t& index, const std::string& buffer) {
    std::string rebuilt{};

    for (const auto& entry : index.entries()) {
        EXPECT_LE(entry.m_segment.end(), buffer.size());
        EXPECT_LE(entry.m_segment.m_offset, entry.m_value.m_offset);
        EXPECT_LE(entry.m_value.end(), entry.m_segment.end());

        rebuilt.append(entry.m_segment.view(buffer));
    }

    EXPECT_EQ(rebuilt, buffer);
}

TEST(SliceIndexTest, ResetBuildsPair) {
    slice_index_t index;
    std::string buffer{"garbage"};

    index.reset(buffer, "id", "42");

    EXPECT_EQ(buffer, "id=42");

    ASSERT_EQ(index.entries().size(), 2u);

    EXPECT_EQ(index.get(e_field::name), (slice_t{0u, 2u}));
    EXPECT_EQ(index.get(e_field::value), (slice_t{3u, 2u}));

    EXPECT_EQ(index.entries()[1].m_segment, (slice_t{2u, 3u}));
    EXPECT_EQ(index.entries()[1].m_segment.view(buffer), "=42");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, AppendsAttributesInOrder) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "id", "42");

    index.set(buffer, e_field::secure, "ignored");
    index.set(buffer, e_field::path, "/");

    EXPECT_EQ(buffer, "id=42; Secure; Path=/");

    const auto secure = index.get(e_field::secure);

    ASSERT_TRUE(secure.has_value());

    EXPECT_EQ(secure->m_length, 0u);
    EXPECT_EQ(index.get(e_field::path)->view(buffer), "/");

    EXPECT_FALSE(index.get(e_field::domain).has_value());
    EXPECT_FALSE(index.contains(e_field::max_age));

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, SpliceShiftsLaterEntries) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "id", "42");

    index.set(buffer, e_field::domain, "example.com");
    index.set(buffer, e_field::path, "/a");
    index.set(buffer, e_field::http_only, {});

    index.set(buffer, e_field::value, "a-much-longer-value");

    EXPECT_EQ(buffer, "id=a-much-longer-value; Domain=example.com; Path=/a; HttpOnly");
    EXPECT_EQ(index.get(e_field::domain)->view(buffer), "example.com");
    EXPECT_EQ(index.get(e_field::path)->view(buffer), "/a");

    expect_consistent(index, buffer);

    index.set(buffer, e_field::domain, "x.io");

    EXPECT_EQ(buffer, "id=a-much-longer-value; Domain=x.io; Path=/a; HttpOnly");
    EXPECT_EQ(index.get(e_field::path)->view(buffer), "/a");

    expect_consistent(index, buffer);

    index.set(buffer, e_field::name, "session");

    EXPECT_EQ(buffer, "session=a-much-longer-value; Domain=x.io; Path=/a; HttpOnly");
    EXPECT_EQ(index.get(e_field::name)->view(buffer), "session");
    EXPECT_EQ(index.get(e_field::value)->view(buffer), "a-much-longer-value");
    EXPECT_EQ(index.get(e_field::domain)->view(buffer), "x.io");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, ReplaceKeepsPosition) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "a", "b");

    index.set(buffer, e_field::path, "/x");
    index.set(buffer, e_field::domain, "d");
    index.set(buffer, e_field::path, "/yy");

    EXPECT_EQ(buffer, "a=b; Path=/yy; Domain=d");

    ASSERT_EQ(index.entries().size(), 4u);

    EXPECT_EQ(index.entries()[2].m_field, e_field::path);
    EXPECT_EQ(index.entries()[3].m_field, e_field::domain);

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, RemoveErasesSegment) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "a", "b");

    index.set(buffer, e_field::domain, "d");
    index.set(buffer, e_field::secure, {});
    index.set(buffer, e_field::path, "/p");

    EXPECT_TRUE(index.remove(buffer, e_field::secure));

    EXPECT_EQ(buffer, "a=b; Domain=d; Path=/p");
    EXPECT_EQ(index.get(e_field::path)->view(buffer), "/p");

    expect_consistent(index, buffer);

    EXPECT_TRUE(index.remove(buffer, e_field::domain));

    EXPECT_EQ(buffer, "a=b; Path=/p");

    EXPECT_FALSE(index.remove(buffer, e_field::domain));

    EXPECT_EQ(buffer, "a=b; Path=/p");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, RemoveMandatoryThrows) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "a", "b");

    index.set(buffer, e_field::secure, {});

    EXPECT_THROW(index.remove(buffer, e_field::name), cxxcookie::exceptions::invalid_operation_t);
    EXPECT_THROW(index.remove(buffer, e_field::value), cxxcookie::exceptions::invalid_operation_t);

    EXPECT_EQ(buffer, "a=b; Secure");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, EmptyValue) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "a", "");

    EXPECT_EQ(buffer, "a=");
    EXPECT_EQ(index.get(e_field::value)->view(buffer), "");

    index.set(buffer, e_field::path, "/");
    index.set(buffer, e_field::value, "v");

    EXPECT_EQ(buffer, "a=v; Path=/");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, AppendFromOwnBuffer) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "id", "abcdefghijklmnopqrstuvwxyz");

    index.set(buffer, e_field::domain, index.get(e_field::value)->view(buffer));

    EXPECT_EQ(buffer, "id=abcdefghijklmnopqrstuvwxyz; Domain=abcdefghijklmnopqrstuvwxyz");

    index.set(buffer, e_field::path, buffer);

    EXPECT_EQ(index.get(e_field::path)->view(buffer), "id=abcdefghijklmnopqrstuvwxyz; Domain=abcdefghijklmnopqrstuvwxyz");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, SpliceFromOwnBuffer) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "a-rather-long-cookie-name", "v");

    index.set(buffer, e_field::path, "/some/long/path/segment");

    index.set(buffer, e_field::value, index.get(e_field::path)->view(buffer));

    EXPECT_EQ(buffer, "a-rather-long-cookie-name=/some/long/path/segment; Path=/some/long/path/segment");

    index.set(buffer, e_field::path, index.get(e_field::name)->view(buffer));

    EXPECT_EQ(buffer, "a-rather-long-cookie-name=/some/long/path/segment; Path=a-rather-long-cookie-name");

    expect_consistent(index, buffer);
}

TEST(SliceIndexTest, ResetFromOwnBuffer) {
    slice_index_t index;
    std::string buffer{};

    index.reset(buffer, "first-name-long-enough", "first-value-long-enough");

    const auto name = index.get(e_field::value)->view(buffer);
    const auto value = index.get(e_field::name)->view(buffer);

    index.reset(buffer, name, value);

    EXPECT_EQ(buffer, "first-value-long-enough=first-name-long-enough");

    expect_consistent(index, buffer);
}
