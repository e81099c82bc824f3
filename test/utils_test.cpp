#include <gtest/gtest.h>
#include <fluxflow/utils.h>

TEST(UtilsTest, TruncateAscii) {
  EXPECT_EQ(Truncate("abcdef", 3), "abc");
  EXPECT_EQ(Truncate("abc", 3), "abc");
  EXPECT_EQ(Truncate("abc", 0), "abc");
  EXPECT_EQ(Truncate("", 5), "");
}

TEST(UtilsTest, TruncateCountsCharacters) {
  // 2, 3 and 4 byte sequences
  std::string str = "aé€\U0001F600b";
  EXPECT_EQ(Utf8Length(str), 5u);
  EXPECT_EQ(Truncate(std::string(str), 5), str);
  EXPECT_EQ(Truncate(std::string(str), 1), "a");
  EXPECT_EQ(Truncate(std::string(str), 2), "aé");
  EXPECT_EQ(Truncate(std::string(str), 3), "aé€");
  EXPECT_EQ(Truncate(std::string(str), 4), "aé€\U0001F600");

  std::string wide;
  for (int i = 0; i < 100; i++) wide += "é";
  std::string cut = Truncate(std::string(wide), 60);
  EXPECT_EQ(cut.size(), 120u);
  EXPECT_EQ(Utf8Length(cut), 60u);
  // longer in bytes than the limit, but within it in characters
  EXPECT_EQ(Truncate(std::string(wide), 100), wide);
}

TEST(UtilsTest, Utf8Length) {
  EXPECT_EQ(Utf8Length(""), 0u);
  EXPECT_EQ(Utf8Length("hello"), 5u);
  EXPECT_EQ(Utf8Length("été"), 3u);
}
