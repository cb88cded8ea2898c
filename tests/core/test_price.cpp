#include <gtest/gtest.h>
#include "core/price.h"
#include "core/errors.h"

#include <limits>

namespace matchbook {
namespace test {

TEST(ParsePrice, AcceptsIntegersAndDecimals) {
    EXPECT_EQ(parsePrice("5"), 50000);
    EXPECT_EQ(parsePrice("5.00"), 50000);
    EXPECT_EQ(parsePrice("9.5"), 95000);
    EXPECT_EQ(parsePrice("0.0001"), 1);
    EXPECT_EQ(parsePrice("123.4567"), 1234567);
    EXPECT_EQ(parsePrice(".25"), 2500);
}

TEST(ParsePrice, RejectsNonPositive) {
    EXPECT_THROW(parsePrice("0"), ValidationError);
    EXPECT_THROW(parsePrice("0.0000"), ValidationError);
    EXPECT_THROW(parsePrice("-1"), ValidationError);
}

TEST(ParsePrice, RejectsMalformed) {
    EXPECT_THROW(parsePrice(""), ValidationError);
    EXPECT_THROW(parsePrice("abc"), ValidationError);
    EXPECT_THROW(parsePrice("1.2.3"), ValidationError);
    EXPECT_THROW(parsePrice("."), ValidationError);
    EXPECT_THROW(parsePrice("1e3"), ValidationError);
    EXPECT_THROW(parsePrice(" 5"), ValidationError);
    EXPECT_THROW(parsePrice("1.00001"), ValidationError);
}

TEST(ParsePrice, RejectsOverflow) {
    EXPECT_THROW(parsePrice("99999999999999999999"), ValidationError);
}

TEST(ParsePrice, RejectsOverflowInFraction) {
    EXPECT_EQ(parsePrice("922337203685477.5807"), std::numeric_limits<PriceTicks>::max());
    EXPECT_THROW(parsePrice("922337203685477.5808"), ValidationError);
    EXPECT_THROW(parsePrice("922337203685477.9999"), ValidationError);
}

TEST(FormatPrice, KeepsCentsAndTrimsTicks) {
    EXPECT_EQ(formatPrice(50000), "5.00");
    EXPECT_EQ(formatPrice(95000), "9.50");
    EXPECT_EQ(formatPrice(95050), "9.505");
    EXPECT_EQ(formatPrice(1), "0.0001");
    EXPECT_EQ(formatPrice(1234567), "123.4567");
}

TEST(RoundToCents, HalfAwayFromZero) {
    EXPECT_EQ(roundToCents(95049), 95000);
    EXPECT_EQ(roundToCents(95050), 95100);
    EXPECT_EQ(roundToCents(95000), 95000);
    EXPECT_EQ(roundToCents(49), 0);
    EXPECT_EQ(roundToCents(50), 100);
}

}  // namespace test
}  // namespace matchbook
