#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "config/EngineConfig.hpp"
#include "engine/AvailabilitySnapshot.hpp"
#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"

namespace avail {
    /**
     * @brief Everything the CLI needs to replay a venue day.
     *
     * {
     *   "timezone": "Europe/Berlin",             (optional)
     *   "config":   { "openMinute": 480, ... },  (optional, EngineConfig keys)
     *   "venues":   [ { "id", "name", "settings": { "bookingFlow" },
     *                   "operatingHours": { "monday": { "open": "08:00", "close": "22:00" }, ... } } ],
     *   "courts":   [ { "id", "venueId", "name", "status", "pricing": { ... } } ],
     *   "bookings": [ { "id", "userId", "courtId", "venueId", "date", "startTime", "endTime", "status" } ],
     *   "members":  [ "userId", ... ]             (optional)
     * }
     */
    struct Scenario {
        EngineConfig config;
        std::string timezone; ///< empty = detect
        std::vector<Venue> venues;
        std::vector<Court> courts;
        std::vector<Booking> bookings;
        std::vector<std::string> members;
    };

    /// Input model (from_json throws nlohmann::json::exception on missing required keys)
    void from_json(const nlohmann::json &j, SpecialRate &r);
    void from_json(const nlohmann::json &j, Pricing &p);
    void from_json(const nlohmann::json &j, Court &c);
    void from_json(const nlohmann::json &j, Booking &b);
    void from_json(const nlohmann::json &j, VenueSettings &s);
    void from_json(const nlohmann::json &j, DayHours &h);
    void from_json(const nlohmann::json &j, Venue &v);

    void to_json(nlohmann::json &j, const SpecialRate &r);
    void to_json(nlohmann::json &j, const Pricing &p);
    void to_json(nlohmann::json &j, const Court &c);
    void to_json(nlohmann::json &j, const Booking &b);

    /// Results
    void to_json(nlohmann::json &j, const TimeSlot &s);
    void to_json(nlohmann::json &j, const SlotView &v);
    void to_json(nlohmann::json &j, const TimeSlotStatus &s);
    void to_json(nlohmann::json &j, const Duration &d);
    void to_json(nlohmann::json &j, const DurationAvailability &d);
    void to_json(nlohmann::json &j, const CourtAvailabilityStatus &s);

    nlohmann::json snapshotToJson(const AvailabilitySnapshot &snap);

    /// Throws std::runtime_error (I/O, syntax) or std::invalid_argument (bad content).
    Scenario parseScenario(const nlohmann::json &j);

    Scenario loadScenarioFile(const std::string &path);
} // namespace avail
