#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <optional>
#include <vector>

#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"

namespace avail {
    class ITimezoneProvider;

    /// Booking converted to venue-local minutes on one day: [startMinutes, endMinutes).
    struct BookingSpan {
        CourtId courtId;
        int startMinutes{0};
        int endMinutes{0};
    };

    /**
     * @brief Folds bookings into a slot skeleton.
     *
     * For every occupying booking of the day, each slot with timeValue in [start, end)
     * gets courtAvailability[courtId] = false. Courts missing from the slot map are ignored
     * (deactivated since the booking was made). hasAvailableCourts is recomputed afterwards.
     *
     * Pure: the result depends only on (skeleton, bookings, date), not on booking order.
     */
    class OccupancyMapper {
    public:
        explicit OccupancyMapper(const ITimezoneProvider *tz = nullptr) : tz_(tz) {}

        [[nodiscard]] std::vector<TimeSlot> apply(std::vector<TimeSlot> skeleton,
                                                  const std::vector<Booking> &bookings,
                                                  const boost::gregorian::date &date) const;

        /// True if the booking blocks its court on `date` (active status, same day).
        [[nodiscard]] static bool occupies(const Booking &b, const boost::gregorian::date &date);

        /**
         * 'span' converts booking times to minutes on `date`, clipped to the day.
         * Returns nothing (and logs) for unparseable times or an empty/inverted range.
         */
        [[nodiscard]] std::optional<BookingSpan> span(const Booking &b, const boost::gregorian::date &date) const;

    private:
        const ITimezoneProvider *tz_;
    };

    /// Sets hasAvailableCourts to the OR of the slot's court flags.
    void refreshSlotSummary(TimeSlot &slot) noexcept;
} // namespace avail
