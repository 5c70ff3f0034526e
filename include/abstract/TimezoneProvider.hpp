#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <string>

#include "utils/TimeUtils.hpp"

namespace avail {
    /**
     * @brief Viewer-local clock.
     *
     * All past/future decisions use the viewer's IANA zone, never server time.
     */
    class ITimezoneProvider {
    public:
        virtual ~ITimezoneProvider() = default;

        /// IANA zone name, e.g. "Europe/Berlin".
        virtual std::string userTimezone() const = 0;

        /// Current wall-clock date and time in the user's zone.
        virtual LocalDateTime localNow() const = 0;

        /// Converts a UTC instant to wall-clock time in the user's zone.
        virtual LocalDateTime toLocal(const boost::posix_time::ptime &utc) const = 0;

        /// True if localNow() is strictly after slot start + grace.
        virtual bool isTimeSlotInPast(const boost::gregorian::date &date, int minutes, int graceMinutes) const;
    };
} // namespace avail
