#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <vector>

#include "model/SlotTypes.hpp"
#include "utils/TimeUtils.hpp"

namespace avail {
    constexpr int kDefaultGraceMinutes = 10;

    /**
     * 'isTimeSlotInPast' : now > (date, minutes) + grace, all in venue-local wall time.
     *
     *  - dates before now.date are entirely past
     *  - dates after now.date are entirely future
     */
    bool isTimeSlotInPast(const LocalDateTime &now,
                          const boost::gregorian::date &date,
                          int minutes,
                          int graceMinutes = kDefaultGraceMinutes) noexcept;

    /**
     * @brief Forces elapsed slots of a read-side view unavailable.
     *
     * Never touches the occupancy map: re-deriving a view later re-evaluates past-ness
     * without regenerating occupancy.
     */
    class PastSlotFilter {
    public:
        explicit PastSlotFilter(int graceMinutes = kDefaultGraceMinutes) : grace_(graceMinutes) {}

        [[nodiscard]] std::vector<SlotView> apply(std::vector<SlotView> views,
                                                  const boost::gregorian::date &date,
                                                  const LocalDateTime &now) const;

        [[nodiscard]] bool isPast(const boost::gregorian::date &date, int minutes, const LocalDateTime &now) const noexcept {
            return isTimeSlotInPast(now, date, minutes, grace_);
        }

        [[nodiscard]] int graceMinutes() const noexcept { return grace_; }

    private:
        int grace_;
    };
} // namespace avail
