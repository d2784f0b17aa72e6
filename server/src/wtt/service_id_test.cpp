#include "wtt/service_id.h"

#include <gtest/gtest.h>

namespace rakelink {
namespace {

TEST(ServiceIdTest, ParsesFiveDigitIdentifiers) {
  EXPECT_EQ(ParseServiceIdCell("93001"), ServiceId{"93001"});
  EXPECT_EQ(ParseServiceIdCell(" 93232 L/SPL"), ServiceId{"93232"});
}

TEST(ServiceIdTest, RejectsOtherNumbers) {
  EXPECT_EQ(ParseServiceIdCell("930011"), std::nullopt);
  EXPECT_EQ(ParseServiceIdCell("9300"), std::nullopt);
  EXPECT_EQ(ParseServiceIdCell("12 CAR"), std::nullopt);
  EXPECT_EQ(ParseServiceIdCell(""), std::nullopt);
}

TEST(ServiceIdTest, NormalizesPlaceholders) {
  EXPECT_EQ(ParseServiceIdCell("ETY 12"), ServiceId{"ETY 12"});
  EXPECT_EQ(ParseServiceIdCell("ety012"), ServiceId{"ETY 12"});
  EXPECT_EQ(ParseServiceIdCell("SPL ETY 3 LOCAL"), ServiceId{"ETY 3"});
}

TEST(ServiceIdTest, PlaceholderDetection) {
  EXPECT_TRUE(IsStablingPlaceholder(ServiceId{"ETY 4"}));
  EXPECT_FALSE(IsStablingPlaceholder(ServiceId{"93001"}));
}

TEST(ServiceIdTest, FiveDigitNumeral) {
  EXPECT_TRUE(IsFiveDigitNumeral(" 92010 "));
  EXPECT_FALSE(IsFiveDigitNumeral("92010 L"));
  EXPECT_FALSE(IsFiveDigitNumeral("9201"));
  EXPECT_FALSE(IsFiveDigitNumeral("nan"));
}

}  // namespace
}  // namespace rakelink
