#include "abstract/TimezoneProvider.hpp"
#include "schedule/PastSlotFilter.hpp"

namespace avail {
    bool ITimezoneProvider::isTimeSlotInPast(const boost::gregorian::date &date, int minutes, int graceMinutes) const {
        return avail::isTimeSlotInPast(localNow(), date, minutes, graceMinutes);
    }
} // namespace avail
