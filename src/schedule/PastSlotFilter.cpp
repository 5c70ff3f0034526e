#include "schedule/PastSlotFilter.hpp"

namespace avail {
    bool isTimeSlotInPast(const LocalDateTime &now,
                          const boost::gregorian::date &date,
                          int minutes,
                          int graceMinutes) noexcept {
        if (date < now.date) return true;
        if (date > now.date) return false;
        return now.minutes > minutes + graceMinutes;
    }

    std::vector<SlotView> PastSlotFilter::apply(std::vector<SlotView> views,
                                                const boost::gregorian::date &date,
                                                const LocalDateTime &now) const {
        for (SlotView &v: views) {
            if (v.available && isPast(date, v.value, now)) v.available = false;
        }
        return views;
    }
} // namespace avail
