#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "engine/AvailabilityQueries.hpp"
#include "engine/SchedulerState.hpp"
#include "store/InMemoryStores.hpp"
#include "test_helpers.h"

#include "mocks/mock_booking_store.h"

using namespace avail;
using avail::test::day;
using avail::test::hm;
using avail::test::makeBooking;
using avail::test::makeCourt;

using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;

namespace {
    const auto kToday = day(2025, 6, 2);
    const std::string kTodayStr = "2025-06-02";

    Venue venue(const std::string &id, std::optional<std::string> flow = std::nullopt) {
        Venue v;
        v.id = id;
        v.name = "Venue " + id;
        if (flow) {
            VenueSettings s;
            s.bookingFlow = flow;
            v.settings = s;
        }
        return v;
    }

    class SchedulerStateTest : public ::testing::Test {
    protected:
        SchedulerStateTest()
            : clock(LocalDateTime{kToday, hm(8)}),
              courts({makeCourt("Court-1", "v1", "Court 1"), makeCourt("Court-2", "v1", "Court 2")}),
              venues({venue("v1"), venue("v2")}),
              state(courts, venues, store, clock) {
        }

        const TimeSlot &slot(int minutes) {
            const TimeSlot *s = state.snapshot()->slotAt(minutes);
            EXPECT_NE(s, nullptr);
            return *s;
        }

        avail::test::FixedClock clock;
        InMemoryCourtRegistry courts;
        InMemoryVenueRegistry venues;
        ManualBookingStore store;
        SchedulerState state;
    };
}

TEST_F(SchedulerStateTest, SelectPublishesLoadingUntilBookingsArrive) {
    ASSERT_EQ(state.start(), Status::OK);
    ASSERT_EQ(state.select(kTodayStr, "v1"), Status::OK);

    auto snap = state.snapshot();
    EXPECT_TRUE(snap->loading);
    EXPECT_FALSE(snap->error.has_value());
    EXPECT_EQ(snap->venueId, "v1");
    ASSERT_EQ(store.liveCount(), 1u);

    store.emit({});
    snap = state.snapshot();
    EXPECT_FALSE(snap->loading);
    EXPECT_EQ(snap->venueName, "Venue v1");
    EXPECT_THAT(snap->activeCourtIds, ElementsAre("Court-1", "Court-2"));
}

TEST_F(SchedulerStateTest, EmptyDayOnTodayIsFullyAvailable) {
    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});

    const AvailabilityQueries queries(clock);
    const auto views = queries.availableTimeSlots(*state.snapshot());

    ASSERT_EQ(views.size(), 28u);
    EXPECT_EQ(views.front().label, "08:00");
    EXPECT_EQ(views.back().label, "21:30");
    for (std::size_t i = 0; i < views.size(); ++i) {
        EXPECT_EQ(views[i].value, hm(8) + static_cast<int>(i) * 30);
        EXPECT_TRUE(views[i].available) << views[i].label;
    }
}

TEST_F(SchedulerStateTest, BookingBlocksOneCourtOnly) {
    state.start();
    state.select(kTodayStr, "v1");
    store.emit({makeBooking("b1", "Court-1", kTodayStr, "10:00", "11:00")});

    for (int m: {hm(10), hm(10, 30)}) {
        EXPECT_FALSE(slot(m).courtAvailability.at("Court-1"));
        EXPECT_TRUE(slot(m).courtAvailability.at("Court-2"));
        EXPECT_TRUE(slot(m).hasAvailableCourts);
    }
    EXPECT_TRUE(slot(hm(11)).courtAvailability.at("Court-1"));
    EXPECT_EQ(state.snapshot()->bookings.size(), 1u);
}

TEST_F(SchedulerStateTest, NoActiveCourtsIsAnError) {
    courts.setStatus("Court-1", CourtStatus::Maintenance);
    courts.setStatus("Court-2", CourtStatus::Inactive);

    state.start();
    state.select(kTodayStr, "v1");

    const auto snap = state.snapshot();
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(*snap->error, "No active courts found for this venue");
    EXPECT_EQ(snap->errorKind, AvailabilityErrorKind::NoActiveCourts);
    EXPECT_TRUE(snap->timeSlots.empty());
    EXPECT_FALSE(snap->loading);
    EXPECT_EQ(store.liveCount(), 0u);
}

TEST_F(SchedulerStateTest, VenueWithoutCourtsIsAnError) {
    state.start();
    state.select(kTodayStr, "v2");
    EXPECT_EQ(state.snapshot()->errorKind, AvailabilityErrorKind::NoActiveCourts);
}

TEST_F(SchedulerStateTest, DataSourceFailureKeepsLastSlotData) {
    state.start();
    state.select(kTodayStr, "v1");
    store.emit({makeBooking("b1", "Court-1", kTodayStr, "10:00", "11:00")});
    store.fail("deadline exceeded");

    const auto snap = state.snapshot();
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(*snap->error, "Failed to load availability data");
    EXPECT_EQ(snap->errorKind, AvailabilityErrorKind::DataSourceFailure);
    EXPECT_FALSE(snap->loading);
    EXPECT_FALSE(slot(hm(10)).courtAvailability.at("Court-1"));
    EXPECT_EQ(snap->timeSlots.size(), 28u);
}

TEST_F(SchedulerStateTest, FailureBeforeFirstEmissionStillHasSkeleton) {
    state.start();
    state.select(kTodayStr, "v1");
    store.fail("unavailable");

    const auto snap = state.snapshot();
    EXPECT_EQ(snap->errorKind, AvailabilityErrorKind::DataSourceFailure);
    EXPECT_EQ(snap->timeSlots.size(), 28u);
    EXPECT_TRUE(slot(hm(10)).courtAvailability.at("Court-1"));
}

TEST_F(SchedulerStateTest, NewSelectionSupersedesOlderEmissions) {
    state.start();
    state.select(kTodayStr, "v1");
    state.select("2025-06-03", "v1");

    ASSERT_EQ(store.entries.size(), 2u);
    EXPECT_TRUE(store.entries[0]->cancelled);
    EXPECT_EQ(store.entries[1]->filter.date, "2025-06-03");

    // a late emission of the old subscription must not land in the new snapshot
    const auto before = state.snapshot()->version;
    store.entries[0]->onNext({makeBooking("old", "Court-1", kTodayStr, "10:00", "11:00")});
    store.entries[0]->onError("late error");
    EXPECT_EQ(state.snapshot()->version, before);

    store.emit({});
    EXPECT_EQ(state.snapshot()->date, day(2025, 6, 3));
    EXPECT_TRUE(slot(hm(10)).courtAvailability.at("Court-1"));
}

TEST_F(SchedulerStateTest, SameSelectionIsANoOp) {
    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});
    const auto version = state.snapshot()->version;

    EXPECT_EQ(state.select(kTodayStr, "v1"), Status::OK);
    EXPECT_EQ(state.snapshot()->version, version);
    EXPECT_EQ(store.entries.size(), 1u);
}

TEST_F(SchedulerStateTest, CourtChangeRecomputes) {
    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});

    courts.setStatus("Court-2", CourtStatus::Maintenance);
    EXPECT_TRUE(state.snapshot()->loading);
    ASSERT_EQ(store.liveCount(), 1u);

    store.emit({});
    EXPECT_THAT(state.snapshot()->activeCourtIds, ElementsAre("Court-1"));
    EXPECT_EQ(slot(hm(12)).courtAvailability.count("Court-2"), 0u);
}

TEST_F(SchedulerStateTest, RefreshResubscribes) {
    state.start();
    EXPECT_EQ(state.refresh(), Status::ERROR);

    state.select(kTodayStr, "v1");
    EXPECT_EQ(state.refresh(), Status::OK);
    EXPECT_EQ(store.entries.size(), 2u);
    EXPECT_EQ(store.liveCount(), 1u);
}

TEST_F(SchedulerStateTest, SkeletonFollowsVenueOperatingHours) {
    Venue v = venue("v1");
    WeeklyHours hours;
    hours[1] = DayHours{"10:00", "14:00"}; // Monday only
    v.operatingHours = hours;
    venues.upsert(v);

    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});

    const auto snap = state.snapshot();
    ASSERT_EQ(snap->timeSlots.size(), 8u);
    EXPECT_EQ(snap->timeSlots.front().time, "10:00");
    EXPECT_EQ(snap->timeSlots.back().time, "13:30");
    EXPECT_EQ(snap->slotAt(hm(9)), nullptr);
}

TEST_F(SchedulerStateTest, ClosedDayHasNoSlots) {
    Venue v = venue("v1");
    WeeklyHours hours;
    hours[1] = DayHours{"10:00", "14:00"};
    v.operatingHours = hours;
    venues.upsert(v);

    state.start();
    state.select("2025-06-03", "v1");
    ASSERT_EQ(store.liveCount(), 1u);
    store.emit({});

    const auto snap = state.snapshot();
    EXPECT_FALSE(snap->loading);
    EXPECT_FALSE(snap->error.has_value());
    EXPECT_THAT(snap->activeCourtIds, ElementsAre("Court-1", "Court-2"));
    EXPECT_TRUE(snap->timeSlots.empty());

    const AvailabilityQueries queries(clock);
    EXPECT_TRUE(queries.availableTimeSlots(*snap).empty());
}

TEST_F(SchedulerStateTest, FlowIsFixedForTheVenueSelection) {
    venues.upsert(venue("v1", "date_time_duration_court"));

    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});
    EXPECT_EQ(state.snapshot()->flowType, BookingFlowType::DateTimeDurationCourt);

    // settings edit mid-session: recompute, but the flow stays
    venues.upsert(venue("v1", "date_time_court_duration"));
    store.emit({});
    EXPECT_EQ(state.snapshot()->flowType, BookingFlowType::DateTimeDurationCourt);

    // a new venue selection picks it up
    state.select(kTodayStr, "v2");
    state.select(kTodayStr, "v1");
    store.emit({});
    EXPECT_EQ(state.snapshot()->flowType, BookingFlowType::DateTimeCourtDuration);
}

TEST_F(SchedulerStateTest, InvalidDateFallsBackToToday) {
    clock.set(LocalDateTime{kToday, hm(9, 15)});
    state.start();
    EXPECT_EQ(state.select("2025-02-30", "v1"), Status::OK);
    EXPECT_EQ(state.snapshot()->date, kToday);
    ASSERT_EQ(store.entries.size(), 1u);
    EXPECT_EQ(store.entries[0]->filter.date, kTodayStr);
}

TEST_F(SchedulerStateTest, RejectsIncompleteOrEarlySelections) {
    EXPECT_EQ(state.select(kTodayStr, "v1"), Status::ERROR);
    state.start();
    EXPECT_EQ(state.start(), Status::ERROR);
    EXPECT_EQ(state.select("", "v1"), Status::ERROR);
    EXPECT_EQ(state.select(kTodayStr, ""), Status::ERROR);
    EXPECT_TRUE(store.entries.empty());
}

TEST_F(SchedulerStateTest, StopUnsubscribesEverything) {
    std::vector<std::uint64_t> seen;
    state.setOnSnapshot([&](const SnapshotPtr &s) { seen.push_back(s->version); });

    state.start();
    state.select(kTodayStr, "v1");
    store.emit({});
    ASSERT_FALSE(seen.empty());

    state.stop();
    EXPECT_FALSE(state.isRunning());
    EXPECT_EQ(store.liveCount(), 0u);

    const auto count = seen.size();
    store.entries[0]->onNext({});
    courts.setStatus("Court-1", CourtStatus::Maintenance);
    EXPECT_EQ(seen.size(), count);

    for (std::size_t i = 1; i < seen.size(); ++i) EXPECT_GT(seen[i], seen[i - 1]);
}

TEST(SchedulerStateFilterTest, SubscribesWithDateVenueAndOccupyingStatuses) {
    const avail::test::FixedClock clock(LocalDateTime{kToday, hm(8)});
    InMemoryCourtRegistry courts({makeCourt("Court-1", "v1", "Court 1")});
    InMemoryVenueRegistry venues({venue("v1")});
    MockBookingStore store;

    EXPECT_CALL(store, subscribe(AllOf(Field(&BookingFilter::date, kTodayStr),
                                       Field(&BookingFilter::venueId, "v1"),
                                       Field(&BookingFilter::statusIn,
                                             ElementsAre(BookingStatus::Confirmed, BookingStatus::Holding))),
                                 _, _))
        .WillOnce([](const BookingFilter &, IBookingStore::BookingsHandler, IBookingStore::ErrorHandler) {
            return Subscription();
        });

    SchedulerState state(courts, venues, store, clock);
    state.start();
    EXPECT_EQ(state.select(kTodayStr, "v1"), Status::OK);
}

TEST(SchedulerStateAsioTest, BookingStoreEmissionsArriveThroughTheEventLoop) {
    boost::asio::io_context ioc;
    const avail::test::FixedClock clock(LocalDateTime{kToday, hm(8)});
    InMemoryCourtRegistry courts({makeCourt("Court-1", "v1", "Court 1")});
    InMemoryVenueRegistry venues({venue("v1")});
    InMemoryBookingStore store(ioc);

    SchedulerState state(courts, venues, store, clock);
    state.start();
    state.select(kTodayStr, "v1");
    EXPECT_TRUE(state.snapshot()->loading);

    ioc.run();
    EXPECT_FALSE(state.snapshot()->loading);
    EXPECT_TRUE(state.snapshot()->slotAt(hm(10))->courtAvailability.at("Court-1"));

    store.upsert(makeBooking("b1", "Court-1", kTodayStr, "10:00", "11:00"));
    store.upsert(makeBooking("b2", "Court-1", kTodayStr, "12:00", "13:00", BookingStatus::Cancelled));
    ioc.restart();
    ioc.run();

    EXPECT_FALSE(state.snapshot()->slotAt(hm(10))->courtAvailability.at("Court-1"));
    EXPECT_TRUE(state.snapshot()->slotAt(hm(12))->courtAvailability.at("Court-1"));
    EXPECT_EQ(state.snapshot()->bookings.size(), 1u);

    // queued emissions of a stopped state are dropped
    store.remove("b1");
    state.stop();
    ioc.restart();
    ioc.run();
    EXPECT_FALSE(state.snapshot()->slotAt(hm(10))->courtAvailability.at("Court-1"));
    EXPECT_EQ(store.subscriberCount(), 0u);
}
