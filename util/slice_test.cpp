#include "blockcache/slice.hpp"

#include <string>

#include <gtest/gtest.h>

namespace blockcache {

TEST(SliceTest, Accessors) {
    Slice s("HelloWorld");
    ASSERT_EQ(10, s.size());
    ASSERT_FALSE(s.empty());
    ASSERT_EQ('H', s[0]);
    ASSERT_EQ('d', s[9]);
    ASSERT_TRUE(Slice("").empty());
    ASSERT_TRUE(Slice().empty());
}

TEST(SliceTest, RemovePrefix) {
    Slice b("WellHelloMac");
    b.remove_prefix(4);
    ASSERT_EQ("HelloMac", b.ToString());
    ASSERT_EQ(8, b.size());

    b.clear();
    ASSERT_TRUE(b.empty());
    ASSERT_EQ("", b.ToString());
}

TEST(SliceTest, Compare) {
    Slice s("HelloWorld");
    Slice b("HelloMac");
    ASSERT_GT(s.compare(b), 0);
    ASSERT_LT(b.compare(s), 0);
    ASSERT_EQ(0, s.compare(Slice("HelloWorld")));

    // A proper prefix sorts first
    ASSERT_LT(Slice("Hello").compare(s), 0);
    ASSERT_GT(s.compare(Slice("Hello")), 0);

    // Bytes compare as unsigned
    ASSERT_LT(Slice("\x01", 1).compare(Slice("\xff", 1)), 0);
}

TEST(SliceTest, StartsWith) {
    Slice s("HelloWorld");
    ASSERT_TRUE(s.starts_with("Hello"));
    ASSERT_TRUE(s.starts_with(""));
    ASSERT_FALSE(s.starts_with("HelloMac"));
    ASSERT_FALSE(Slice("Hell").starts_with("Hello"));
}

TEST(SliceTest, Equality) {
    std::string storage("Hello");
    Slice a(storage);
    Slice b("Hello");
    Slice c("Hellp");
    ASSERT_TRUE(a == b);
    ASSERT_FALSE(a != b);
    ASSERT_TRUE(a != c);
    ASSERT_TRUE(Slice("abc", 2) == Slice("ab"));

    // Embedded zeros take part in the comparison
    ASSERT_TRUE(Slice("a\0b", 3) != Slice("a\0c", 3));
}

TEST(SliceDeathTest, IndexPastEndAborts) {
    Slice s("abc");
    ASSERT_EQ('c', s[s.size() - 1]);
    ASSERT_DEATH(s[s.size()], "check failed: Slice::operator\\[\\]\\(3\\) on size 3");
    ASSERT_DEATH(s[7], "check failed");
    ASSERT_DEATH(Slice()[0], "check failed");
}

TEST(SliceDeathTest, RemovePrefixPastEndAborts) {
    Slice s("ab");
    ASSERT_DEATH(s.remove_prefix(s.size() + 1),
                 "check failed: Slice::remove_prefix\\(3\\) on size 2");
    ASSERT_EQ(2, s.size());

    s.remove_prefix(s.size());
    ASSERT_TRUE(s.empty());
    ASSERT_DEATH(s.remove_prefix(1), "check failed");
}

}  // namespace blockcache
