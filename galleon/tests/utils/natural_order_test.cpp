#include "utils/string/natural_order.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "io/folder_scan.hpp"

namespace galleon {
TEST(NaturalOrderTest, DigitRunsCompareByValue) {
  EXPECT_LT(NaturalCompare("img2.jpg", "img10.jpg"), 0);
  EXPECT_GT(NaturalCompare("img10.jpg", "img9.jpg"), 0);
  EXPECT_LT(NaturalCompare("a1b2", "a1b10"), 0);
  EXPECT_EQ(NaturalCompare("same.png", "same.png"), 0);
}

TEST(NaturalOrderTest, TextRunsIgnoreCase) {
  EXPECT_EQ(NaturalCompare("Img2.jpg", "img2.jpg"), 0);
  EXPECT_LT(NaturalCompare("a.jpg", "B.jpg"), 0);
  EXPECT_LT(NaturalCompare("Img2.jpg", "img10.jpg"), 0);
}

TEST(NaturalOrderTest, LeadingZerosDoNotChangeValue) {
  EXPECT_EQ(NaturalCompare("img007.jpg", "img7.jpg"), 0);
  EXPECT_LT(NaturalCompare("img7.jpg", "img08.jpg"), 0);
  EXPECT_LT(NaturalCompare("img0.jpg", "img1.jpg"), 0);
}

TEST(NaturalOrderTest, AccentedLettersFoldCase) {
  // "\xC3\x89" is U+00C9, "\xC3\xA9" is U+00E9
  EXPECT_EQ(NaturalCompare("\xC3\x89" "a.jpg", "\xC3\xA9" "a.jpg"), 0);
  EXPECT_LT(NaturalCompare("\xC3\xA9" "b.jpg", "\xC3\x89" "c.jpg"), 0);

  auto ordered = OrderFileNames({"\xC3\x89" "c.jpg", "\xC3\xA9" "a.jpg", "\xC3\xA9" "b.jpg"});
  EXPECT_EQ(ordered, (std::vector<std::string>{"\xC3\xA9" "a.jpg", "\xC3\xA9" "b.jpg",
                                               "\xC3\x89" "c.jpg"}));
}

TEST(NaturalOrderTest, DigitLeadingNamesSortFirst) {
  EXPECT_LT(NaturalCompare("1.jpg", "a.jpg"), 0);
  EXPECT_LT(NaturalCompare("99.jpg", "_a.jpg"), 0);
  EXPECT_LT(NaturalCompare("2.jpg", "10.jpg"), 0);
}

TEST(NaturalOrderTest, LessBreaksTiesByBytes) {
  EXPECT_TRUE(NaturalLess("Img2.jpg", "img2.jpg"));
  EXPECT_FALSE(NaturalLess("img2.jpg", "Img2.jpg"));
  EXPECT_FALSE(NaturalLess("x.jpg", "x.jpg"));
  EXPECT_TRUE(NaturalLess("img007.jpg", "img7.jpg"));
}

TEST(NaturalOrderTest, MalformedUtf8StillOrders) {
  const std::string broken = std::string("img") + static_cast<char>(0xC3) + "2.jpg";
  EXPECT_NE(NaturalCompare(broken, "img2.jpg"), 0);
  EXPECT_TRUE(NaturalLess(broken, "img2.jpg") != NaturalLess("img2.jpg", broken));
}

TEST(NaturalOrderTest, OrderFileNamesSortsAndDedupes) {
  std::vector<std::string> names = {"a10.jpg", "A2.jpg", "a1.jpg", "a10.jpg", "3.png", "a2.jpg"};
  auto                     ordered = OrderFileNames(names);
  EXPECT_EQ(ordered,
            (std::vector<std::string>{"3.png", "a1.jpg", "A2.jpg", "a2.jpg", "a10.jpg"}));

  // Input order has no influence
  std::reverse(names.begin(), names.end());
  EXPECT_EQ(OrderFileNames(names), ordered);
}
};  // namespace galleon
