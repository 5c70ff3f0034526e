#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/BookingTypes.hpp"

namespace avail {
    /**
     * @brief One 30-minute unit of the bookable day.
     *
     * Invariants:
     *   - timeValue % 30 == 0
     *   - hasAvailableCourts == OR over courtAvailability
     *   - courtAvailability keys == active courts at computation time
     */
    struct TimeSlot {
        std::string time; ///< "HH:MM"
        int timeValue{0}; ///< minutes since midnight
        std::map<CourtId, bool> courtAvailability;
        bool hasAvailableCourts{false};
    };

    /// Flattened view used by the time selection step.
    struct SlotView {
        std::string label;
        int value{0};
        bool available{false};

        bool operator==(const SlotView &) const = default;
    };

    /// Per-slot breakdown of which courts are free.
    struct TimeSlotStatus {
        std::string time;
        int timeValue{0};
        std::vector<CourtId> availableCourts;
        std::vector<CourtId> unavailableCourts;
        bool hasAvailableCourts{false};
    };

    struct Duration {
        std::string label; ///< "30m", "1h", "1.5h", ...
        int minutes{0};
        double price{0.0};
        std::optional<CourtId> courtId;
    };

    struct DurationAvailability {
        Duration duration;
        std::vector<CourtId> availableCourts;
        std::vector<CourtId> unavailableCourts;
    };

    struct CourtAvailabilityStatus {
        CourtId courtId;
        std::string courtName;
        bool available{false};
        bool fullyAvailable{false};
        std::vector<std::string> availableTimeSlots;
        std::vector<std::string> unavailableTimeSlots;
    };
} // namespace avail
