#include "CmdLine.hpp"
#include "engine/AvailabilityQueries.hpp"
#include "engine/CourtAvailabilityAggregator.hpp"
#include "engine/DurationCalculator.hpp"
#include "engine/SchedulerState.hpp"
#include "io/ScenarioJson.hpp"
#include "pricing/CourtRatePricing.hpp"
#include "schedule/FlowResolver.hpp"
#include "store/InMemoryStores.hpp"
#include "tz/FixedClockTimezone.hpp"
#include "tz/ZoneInfoTimezone.hpp"
#include "utils/LogUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <set>

using json = nlohmann::json;

int main(int argc, char **argv) {
    CmdOptions options;
    if (!parse_cmdline(argc, argv, options)) {
        // parse_cmdline already printed error/help on failure
        return 1;
    }

    if (options.show_help) {
        return 0;
    }

    avail::log::verbose = options.verbose;

    // ---------------------------------------------------------------------
    // 1) Scenario + config
    // ---------------------------------------------------------------------
    avail::Scenario scenario;
    try {
        scenario = avail::loadScenarioFile(options.scenario);
        if (options.grace) {
            scenario.config.graceMinutes = *options.grace;
            scenario.config.validate();
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    const avail::EngineConfig &cfg = scenario.config;

    // ---------------------------------------------------------------------
    // 2) Timezone + clock
    // ---------------------------------------------------------------------
    std::string zone_name;
    if (options.tz) zone_name = *options.tz;
    else if (!scenario.timezone.empty()) zone_name = scenario.timezone;
    else zone_name = avail::ZoneInfoTimezone::detectZoneName(cfg.defaultTimezone);

    const avail::ZoneInfoTimezone zone(zone_name);

    std::unique_ptr<avail::FixedClockTimezone> pinned;
    if (options.now) {
        const auto day = avail::parseDate(options.date);
        const auto now = avail::resolveLocal(*options.now, day ? *day : zone.localNow().date, &zone);
        if (!now) {
            std::cerr << "Error: invalid --now '" << *options.now << "' ("
                      << avail::to_string(now.error) << ")\n";
            return 1;
        }
        pinned = std::make_unique<avail::FixedClockTimezone>(zone, *now);
    }
    const avail::ITimezoneProvider &clock = pinned ? static_cast<const avail::ITimezoneProvider &>(*pinned) : zone;

    // ---------------------------------------------------------------------
    // 3) Collaborators + state
    // ---------------------------------------------------------------------
    boost::asio::io_context ioc;

    avail::InMemoryCourtRegistry courts(scenario.courts);
    avail::InMemoryVenueRegistry venues(scenario.venues);
    avail::InMemoryBookingStore bookings(ioc);
    for (const auto &b: scenario.bookings) bookings.upsert(b);

    const avail::CourtRatePricing pricing(&clock, std::set<std::string>(scenario.members.begin(),
                                                                        scenario.members.end()));

    std::unique_ptr<avail::SchedulerState> state;
    try {
        state = std::make_unique<avail::SchedulerState>(courts, venues, bookings, clock, cfg);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (state->start() != avail::Status::OK) {
        std::cerr << "start() failed\n";
        return 1;
    }

    if (state->select(options.date, options.venue) != avail::Status::OK) {
        std::cerr << "select() failed for venue='" << options.venue << "' date='" << options.date << "'\n";
        return 1;
    }

    // Deliver the booking emissions
    ioc.run();

    const avail::SnapshotPtr snap = state->snapshot();

    // ---------------------------------------------------------------------
    // 4) Read-side queries
    // ---------------------------------------------------------------------
    const avail::AvailabilityQueries queries(clock, cfg);

    json out;
    out["timezone"] = clock.userTimezone();
    out["snapshot"] = avail::snapshotToJson(*snap);
    out["availableTimeSlots"] = queries.availableTimeSlots(*snap);
    out["timeSlotStatuses"] = queries.timeSlotStatuses(*snap);

    json steps = json::array();
    for (const auto &s: avail::flowSteps(snap->flowType)) {
        steps.push_back({{"step", s.step}, {"label", avail::to_string(s.label)}});
    }
    out["flowSteps"] = steps;

    if (options.start) {
        const avail::DurationCalculator durations(queries, pricing);
        const avail::CourtAvailabilityAggregator aggregator(queries);

        avail::DurationQuery q;
        q.startTime = *options.start;
        q.courtId = options.court;
        q.userId = options.user;

        out["durations"] = durations.availableDurations(*snap, q);
        out["durationAvailability"] = durations.durationAvailability(*snap, *options.start, options.user);
        out["courts"] = aggregator.courtsAvailability(*snap, *options.start, options.duration);

        if (options.court) {
            out["alternativeCourts"] = aggregator.alternativeCourts(
                *snap, *options.start, options.duration.value_or(avail::kDefaultCourtCheckMinutes), *options.court);
        }
    }

    std::cout << out.dump(2) << "\n";

    state->stop();
    return snap->error ? 2 : 0;
}
