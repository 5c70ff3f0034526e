#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace avail {
    /**
     * @brief One DST transition of a POSIX TZ rule.
     *
     *  - Mm.w.d : weekday d (0 = Sunday) of week w (5 = last) of month m
     *  - Jn     : day n of the year, 1..365, Feb 29 never counted
     *  - n      : zero-based day of the year, 0..365
     *
     * `seconds` is the local time of the transition and may lie outside a day
     * (e.g. "/26" or "/-1"), which moves the transition to a neighbouring day.
     */
    struct PosixTransition {
        enum class Kind : std::uint8_t { MonthWeekDay, JulianNoLeap, ZeroBasedDay };

        Kind kind{Kind::MonthWeekDay};
        int month{0};
        int week{0};
        int weekday{0};
        int day{0};
        long seconds{2 * 3600};
        std::string text; ///< as written, e.g. "M3.5.0/3"

        /// Calendar day the rule names in `year`, before `seconds` is applied.
        [[nodiscard]] boost::gregorian::date dateIn(int year) const;
    };

    /**
     * @brief Parsed POSIX TZ string, as found in the footer of TZif v2+ files.
     *
     * Offsets are stored east-positive (UTC+1 = 3600), the opposite of the POSIX
     * text where "CET-1" means one hour east of Greenwich.
     */
    struct PosixTzRule {
        std::string stdAbbrev;
        long stdOffsetSeconds{0};

        std::optional<std::string> dstAbbrev;
        long dstOffsetSeconds{0};
        PosixTransition start;
        PosixTransition end;

        [[nodiscard]] bool hasDst() const noexcept {
            return dstAbbrev.has_value() && dstOffsetSeconds != stdOffsetSeconds;
        }
    };

    /// Throws std::invalid_argument if `text` is not a POSIX TZ string.
    PosixTzRule parsePosixTzRule(const std::string &text);

    /**
     * Builds a boost zone that applies `rule`.
     *
     * Negative DST (standard time in summer, e.g. Europe/Dublin) is expressed with the
     * roles of both periods swapped, since boost only models a positive adjustment.
     */
    boost::local_time::time_zone_ptr makeTimeZone(const PosixTzRule &rule);
} // namespace avail
