#include <gtest/gtest.h>

#include "schedule/OccupancyMapper.hpp"
#include "schedule/SlotGenerator.hpp"
#include "test_helpers.h"

#include <algorithm>

using namespace avail;
using avail::test::day;
using avail::test::hm;
using avail::test::makeBooking;

namespace {
    const auto kDay = day(2025, 6, 3);
    const std::string kDayStr = "2025-06-03";

    std::vector<TimeSlot> skeleton() {
        const SlotGenerator gen(EngineConfig{});
        return gen.generate(kDay, {"Court-1", "Court-2"}, LocalDateTime{day(2025, 6, 2), hm(12)});
    }

    const TimeSlot &at(const std::vector<TimeSlot> &slots, int minutes) {
        const auto it = std::find_if(slots.begin(), slots.end(), [&](const TimeSlot &s) { return s.timeValue == minutes; });
        EXPECT_NE(it, slots.end());
        return *it;
    }
}

TEST(OccupancyMapperTest, BookingBlocksItsHalfOpenRange) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {makeBooking("b1", "Court-1", kDayStr, "10:00", "11:00")}, kDay);

    EXPECT_TRUE(at(slots, hm(9, 30)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(10)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(10, 30)).courtAvailability.at("Court-1"));
    EXPECT_TRUE(at(slots, hm(11)).courtAvailability.at("Court-1"));

    // the other court keeps the slot open
    EXPECT_TRUE(at(slots, hm(10)).courtAvailability.at("Court-2"));
    EXPECT_TRUE(at(slots, hm(10)).hasAvailableCourts);
}

TEST(OccupancyMapperTest, SummaryFollowsCourtFlags) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {
                                        makeBooking("b1", "Court-1", kDayStr, "10:00", "11:00"),
                                        makeBooking("b2", "Court-2", kDayStr, "10:30", "12:00"),
                                    }, kDay);

    for (const auto &s: slots) {
        const bool any = std::any_of(s.courtAvailability.begin(), s.courtAvailability.end(),
                                     [](const auto &kv) { return kv.second; });
        EXPECT_EQ(s.hasAvailableCourts, any) << s.time;
    }
    EXPECT_TRUE(at(slots, hm(10)).hasAvailableCourts);
    EXPECT_FALSE(at(slots, hm(10, 30)).hasAvailableCourts);
    EXPECT_TRUE(at(slots, hm(11)).hasAvailableCourts);
}

TEST(OccupancyMapperTest, OnlyOccupyingStatusesOnTheDayCount) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {
                                        makeBooking("c", "Court-1", kDayStr, "10:00", "11:00", BookingStatus::Cancelled),
                                        makeBooking("d", "Court-1", kDayStr, "12:00", "13:00", BookingStatus::Completed),
                                        makeBooking("h", "Court-1", kDayStr, "14:00", "15:00", BookingStatus::Holding),
                                        makeBooking("o", "Court-1", "2025-06-04", "16:00", "17:00"),
                                    }, kDay);

    EXPECT_TRUE(at(slots, hm(10)).courtAvailability.at("Court-1"));
    EXPECT_TRUE(at(slots, hm(12)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(14)).courtAvailability.at("Court-1"));
    EXPECT_TRUE(at(slots, hm(16)).courtAvailability.at("Court-1"));
}

TEST(OccupancyMapperTest, UnknownCourtIsIgnored) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {makeBooking("b1", "Court-9", kDayStr, "10:00", "11:00")}, kDay);

    EXPECT_EQ(at(slots, hm(10)).courtAvailability.size(), 2u);
    EXPECT_EQ(at(slots, hm(10)).courtAvailability.count("Court-9"), 0u);
}

TEST(OccupancyMapperTest, InvalidTimesSkipOnlyThatBooking) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {
                                        makeBooking("bad", "Court-1", kDayStr, "ten", "11:00"),
                                        makeBooking("inv", "Court-1", kDayStr, "13:00", "12:00"),
                                        makeBooking("ok", "Court-2", kDayStr, "10:00", "10:30"),
                                    }, kDay);

    EXPECT_TRUE(at(slots, hm(10)).courtAvailability.at("Court-1"));
    EXPECT_TRUE(at(slots, hm(12)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(10)).courtAvailability.at("Court-2"));
}

TEST(OccupancyMapperTest, MidnightEndClosesTheDay) {
    const OccupancyMapper mapper;
    const auto slots = mapper.apply(skeleton(), {makeBooking("late", "Court-1", kDayStr, "21:00", "00:00")}, kDay);

    EXPECT_FALSE(at(slots, hm(21)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(21, 30)).courtAvailability.at("Court-1"));
}

TEST(OccupancyMapperTest, IsoTimesAreConvertedToLocalWallTime) {
    // Fixed clock is UTC: 08:00Z -> 08:00 local
    const avail::test::FixedClock utc(LocalDateTime{kDay, 0});
    const OccupancyMapper mapper(&utc);

    auto b = makeBooking("iso", "Court-1", "", "2025-06-03T10:00:00+02:00", "2025-06-03T11:00:00+02:00");
    const auto slots = mapper.apply(skeleton(), {b}, kDay);

    EXPECT_FALSE(at(slots, hm(8)).courtAvailability.at("Court-1"));
    EXPECT_FALSE(at(slots, hm(8, 30)).courtAvailability.at("Court-1"));
    EXPECT_TRUE(at(slots, hm(9)).courtAvailability.at("Court-1"));
}

TEST(OccupancyMapperTest, RecomputingIsIdempotent) {
    const OccupancyMapper mapper;
    const std::vector<Booking> bookings{
        makeBooking("b1", "Court-1", kDayStr, "10:00", "11:00"),
        makeBooking("b2", "Court-2", kDayStr, "18:30", "20:00"),
    };

    const auto base = skeleton();
    const auto once = mapper.apply(base, bookings, kDay);
    const auto twice = mapper.apply(base, bookings, kDay);
    const auto folded = mapper.apply(once, bookings, kDay);

    ASSERT_EQ(once.size(), twice.size());
    for (std::size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].courtAvailability, twice[i].courtAvailability);
        EXPECT_EQ(once[i].courtAvailability, folded[i].courtAvailability);
        EXPECT_EQ(once[i].hasAvailableCourts, twice[i].hasAvailableCourts);
    }
}

TEST(OccupancyMapperTest, BookingOrderDoesNotMatter) {
    const OccupancyMapper mapper;
    std::vector<Booking> bookings{
        makeBooking("b1", "Court-1", kDayStr, "10:00", "11:00"),
        makeBooking("b2", "Court-1", kDayStr, "10:30", "12:00"),
        makeBooking("b3", "Court-2", kDayStr, "08:00", "09:00"),
    };

    const auto forward = mapper.apply(skeleton(), bookings, kDay);
    std::reverse(bookings.begin(), bookings.end());
    const auto backward = mapper.apply(skeleton(), bookings, kDay);

    for (std::size_t i = 0; i < forward.size(); ++i) {
        EXPECT_EQ(forward[i].courtAvailability, backward[i].courtAvailability);
    }
}

TEST(OccupancyMapperTest, SpanClipsMultiDayBookings) {
    const OccupancyMapper mapper;
    auto b = makeBooking("x", "Court-1", kDayStr, "2025-06-02T20:00:00", "2025-06-03T09:00:00");

    const auto s = mapper.span(b, kDay);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->startMinutes, 0);
    EXPECT_EQ(s->endMinutes, hm(9));
}
