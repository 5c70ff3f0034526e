#include <gtest/gtest.h>

#include "pricing/CourtRatePricing.hpp"
#include "test_helpers.h"

#include <stdexcept>

using namespace avail;
using avail::test::day;
using avail::test::hm;
using avail::test::makeCourt;

namespace {
    // 2025-06-02 is a Monday, 2025-06-07 a Saturday
    Court pricedCourt() {
        Court c = makeCourt("c1", "v1", "Center", CourtStatus::Active, 30.0);
        c.pricing.peakHourRate = 40.0;
        c.pricing.weekendRate = 50.0;
        c.pricing.memberDiscount = 10.0;
        return c;
    }
}

TEST(CourtRatePricingTest, BaseRateTimesHours) {
    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T10:00:00", "2025-06-02T11:30:00", ""), 45.0);
}

TEST(CourtRatePricingTest, WeekdayPeakWindowUsesPeakRate) {
    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T17:00:00", "2025-06-02T18:00:00", ""), 40.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T16:30:00", "2025-06-02T17:30:00", ""), 30.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T21:00:00", "2025-06-02T22:00:00", ""), 30.0);
}

TEST(CourtRatePricingTest, WeekendRateWinsOnSaturdayAndSunday) {
    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-07T18:00:00", "2025-06-07T19:00:00", ""), 50.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-08T09:00:00", "2025-06-08T09:30:00", ""), 25.0);

    Court noWeekend = pricedCourt();
    noWeekend.pricing.weekendRate.reset();
    // no peak hours on weekends either
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(noWeekend, "2025-06-07T18:00:00", "2025-06-07T19:00:00", ""), 30.0);
}

TEST(CourtRatePricingTest, SpecialRatesMatchDayAndWindow) {
    Court c = pricedCourt();
    SpecialRate morning;
    morning.name = "early bird";
    morning.rate = 20.0;
    morning.applyDays = std::vector<std::string>{"monday", "wednesday"};
    morning.startTime = "08:00";
    morning.endTime = "12:00";
    SpecialRate evening;
    evening.name = "league night";
    evening.rate = 60.0;
    evening.applyDays = std::vector<std::string>{"monday"};
    evening.startTime = "18:00";
    evening.endTime = "20:00";
    c.pricing.specialRates = {morning, evening};

    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(c, "2025-06-02T09:00:00", "2025-06-02T10:00:00", ""), 20.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(c, "2025-06-02T12:00:00", "2025-06-02T13:00:00", ""), 30.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(c, "2025-06-03T09:00:00", "2025-06-03T10:00:00", ""), 30.0);
    // overrides the peak rate
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(c, "2025-06-02T18:00:00", "2025-06-02T19:00:00", ""), 60.0);

    ASSERT_NE(CourtRatePricing::applicableSpecialRate(c.pricing, day(2025, 6, 4), hm(11, 30)), nullptr);
    EXPECT_EQ(CourtRatePricing::applicableSpecialRate(c.pricing, day(2025, 6, 4), hm(11, 30))->name, "early bird");
}

TEST(CourtRatePricingTest, EmptyApplyDaysNeverMatch) {
    Court c = pricedCourt();
    SpecialRate disabled;
    disabled.name = "disabled";
    disabled.rate = 5.0;
    disabled.applyDays = std::vector<std::string>{};
    SpecialRate everyDay;
    everyDay.name = "every day";
    everyDay.rate = 25.0;
    everyDay.startTime = "08:00";
    everyDay.endTime = "09:00";
    c.pricing.specialRates = {disabled, everyDay};

    for (int d = 2; d <= 8; ++d) {
        EXPECT_EQ(CourtRatePricing::applicableSpecialRate(c.pricing, day(2025, 6, d), hm(12)), nullptr);
        const SpecialRate *sr = CourtRatePricing::applicableSpecialRate(c.pricing, day(2025, 6, d), hm(8, 30));
        ASSERT_NE(sr, nullptr);
        EXPECT_EQ(sr->name, "every day");
    }

    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(c, "2025-06-02T12:00:00", "2025-06-02T13:00:00", ""), 30.0);
}

TEST(CourtRatePricingTest, MemberDiscountOnlyForMembers) {
    const CourtRatePricing pricing(nullptr, {"member-1"});
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T10:00:00", "2025-06-02T11:00:00", "member-1"), 27.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T10:00:00", "2025-06-02T11:00:00", "guest"), 30.0);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T10:00:00", "2025-06-02T11:00:00", ""), 30.0);
}

TEST(CourtRatePricingTest, NeverBelowOne) {
    const Court cheap = makeCourt("c2", "v1", "Cheap", CourtStatus::Active, 1.0);
    const CourtRatePricing pricing;
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(cheap, "2025-06-02T10:00:00", "2025-06-02T10:30:00", ""), 1.0);
}

TEST(CourtRatePricingTest, OffsetTimestampsArePricedInLocalTime) {
    // UTC clock: 19:00+02:00 is 17:00 local, inside the peak window
    const avail::test::FixedClock utc(LocalDateTime{day(2025, 6, 2), 0});
    const CourtRatePricing pricing(&utc);
    EXPECT_DOUBLE_EQ(pricing.calculatePrice(pricedCourt(), "2025-06-02T19:00:00+02:00",
                                            "2025-06-02T20:00:00+02:00", ""), 40.0);
}

TEST(CourtRatePricingTest, InvalidRangesThrow) {
    const CourtRatePricing pricing;
    EXPECT_THROW(pricing.calculatePrice(pricedCourt(), "tomorrow", "2025-06-02T11:00:00", ""), std::invalid_argument);
    EXPECT_THROW(pricing.calculatePrice(pricedCourt(), "2025-06-02T11:00:00", "2025-06-02T11:00:00", ""),
                 std::invalid_argument);
    EXPECT_THROW(pricing.calculatePrice(pricedCourt(), "2025-06-02T11:00:00", "2025-06-02T10:00:00", ""),
                 std::invalid_argument);
}

TEST(CourtRatePricingTest, StandardDurationPriceList) {
    const CourtRatePricing pricing;
    const auto list = pricing.standardDurationPrices(makeCourt("c1", "v1", "Center"), "2025-06-02T10:00:00");

    ASSERT_EQ(list.size(), kStandardDurations.size());
    EXPECT_EQ(list[0].label, "30m");
    EXPECT_EQ(list[2].label, "1.5h");
    EXPECT_EQ(list[5].label, "3h");
    for (std::size_t i = 0; i < list.size(); ++i) {
        EXPECT_DOUBLE_EQ(list[i].price, 15.0 * static_cast<double>(i + 1));
        EXPECT_EQ(list[i].courtId.value_or(""), "c1");
    }
}
