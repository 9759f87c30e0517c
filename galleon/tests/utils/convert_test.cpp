#include "utils/string/convert.hpp"

#include <gtest/gtest.h>

#include <string>

namespace galleon {
TEST(ConvertTest, WideStringsRoundTrip) {
  const std::string utf8 = "caf\xC3\xA9_\xE6\x99\xAE\xE6\xB4\xB1.jpg";
  std::wstring      wide = conv::FromBytes(utf8);
  EXPECT_EQ(wide.size(), 11u);
  EXPECT_EQ(conv::ToBytes(wide), utf8);
}

TEST(ConvertTest, CodepointsOfValidInput) {
  auto cps = conv::ToCodepoints("a\xC3\xA9" "1");
  ASSERT_EQ(cps.size(), 3u);
  EXPECT_EQ(cps[0], U'a');
  EXPECT_EQ(cps[1], static_cast<char32_t>(0xE9));
  EXPECT_EQ(cps[2], U'1');
}

TEST(ConvertTest, MalformedInputFallsBackToBytes) {
  const std::string broken = std::string("ab") + static_cast<char>(0xFF) + "c";
  auto              cps    = conv::ToCodepoints(broken);
  ASSERT_EQ(cps.size(), 4u);
  EXPECT_EQ(cps[2], static_cast<char32_t>(0xFF));
  EXPECT_EQ(cps[3], U'c');
}

TEST(ConvertTest, MalformedInputThrowsOnWideConversion) {
  const std::string broken = std::string("x") + static_cast<char>(0xC3);
  EXPECT_ANY_THROW(conv::FromBytes(broken));
}
};  // namespace galleon
