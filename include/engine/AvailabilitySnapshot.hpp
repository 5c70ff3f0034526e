#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"
#include "schedule/FlowResolver.hpp"

namespace avail {
    /**
     * User-visible failure of a snapshot. Exclusion-style problems (bad time input,
     * pricing failures) never show up here; they only drop the affected item.
     */
    enum class AvailabilityErrorKind : std::uint8_t {
        None,
        NoActiveCourts, // venue has zero active courts
        DataSourceFailure // booking subscription failed; slot data is the last known state
    };

    inline constexpr std::string_view kNoActiveCourtsMessage = "No active courts found for this venue";
    inline constexpr std::string_view kDataSourceFailureMessage = "Failed to load availability data";

    inline const char *to_string(AvailabilityErrorKind k) {
        switch (k) {
            case AvailabilityErrorKind::None: return "none";
            case AvailabilityErrorKind::NoActiveCourts: return "no_active_courts";
            case AvailabilityErrorKind::DataSourceFailure: return "data_source_failure";
            default: return "unknown";
        }
    }

    /**
     * @brief Fully computed availability of one (venue, date) selection.
     *
     * Immutable once published: SchedulerState replaces the whole snapshot, never patches it.
     * timeSlots are ordered by timeValue.
     */
    struct AvailabilitySnapshot {
        std::uint64_t version{0}; ///< bumps on every publish of the owning SchedulerState

        boost::gregorian::date date;
        VenueId venueId;
        std::string venueName;

        std::vector<TimeSlot> timeSlots;
        std::vector<CourtId> activeCourtIds;
        std::vector<Court> activeCourts; ///< same order as activeCourtIds
        std::vector<Booking> bookings; ///< occupying bookings of the day

        BookingFlowType flowType{kDefaultFlow};

        bool loading{false};
        std::optional<std::string> error;
        AvailabilityErrorKind errorKind{AvailabilityErrorKind::None};

        /// Slot starting exactly at `minutes`, or nullptr if none was generated.
        [[nodiscard]] const TimeSlot *slotAt(int minutes) const noexcept;

        [[nodiscard]] const Court *court(const CourtId &id) const noexcept;

        [[nodiscard]] bool hasDate() const noexcept { return !date.is_special(); }
    };

    using SnapshotPtr = std::shared_ptr<const AvailabilitySnapshot>;
} // namespace avail
