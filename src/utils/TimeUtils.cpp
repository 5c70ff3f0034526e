#include "utils/TimeUtils.hpp"
#include "abstract/TimezoneProvider.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <charconv>
#include <cstdio>
#include <stdexcept>

namespace avail {
    /// Reads exactly `width` decimal digits starting at `pos`.
    static bool read_fixed(std::string_view s, std::size_t pos, std::size_t width, int &out) noexcept {
        if (pos + width > s.size()) return false;
        for (std::size_t i = pos; i < pos + width; ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
        }
        const char *first = s.data() + pos;
        const auto [ptr, ec] = std::from_chars(first, first + width, out);
        return ec == std::errc{} && ptr == first + width;
    }

    static std::string_view trimmed(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    Parsed<boost::gregorian::date> parseDate(std::string_view raw) {
        const std::string_view s = trimmed(raw);
        if (s.empty()) return Parsed<boost::gregorian::date>::fail(ParseError::Empty);
        if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
            return Parsed<boost::gregorian::date>::fail(ParseError::Malformed);
        }

        int y = 0, m = 0, d = 0;
        if (!read_fixed(s, 0, 4, y) || !read_fixed(s, 5, 2, m) || !read_fixed(s, 8, 2, d)) {
            return Parsed<boost::gregorian::date>::fail(ParseError::Malformed);
        }

        try {
            return Parsed<boost::gregorian::date>::ok(boost::gregorian::date(
                static_cast<unsigned short>(y), static_cast<unsigned short>(m), static_cast<unsigned short>(d)));
        } catch (const std::out_of_range &) {
            // bad_year / bad_month / bad_day_of_month
            return Parsed<boost::gregorian::date>::fail(ParseError::OutOfRange);
        }
    }

    Parsed<int> parseClock(std::string_view raw) {
        const std::string_view s = trimmed(raw);
        if (s.empty()) return Parsed<int>::fail(ParseError::Empty);

        const std::size_t colon = s.find(':');
        if (colon == std::string_view::npos || colon == 0 || colon > 2 || s.size() != colon + 3) {
            return Parsed<int>::fail(ParseError::Malformed);
        }

        int h = 0, m = 0;
        if (!read_fixed(s, 0, colon, h) || !read_fixed(s, colon + 1, 2, m)) {
            return Parsed<int>::fail(ParseError::Malformed);
        }

        if (h == 24 && m == 0) return Parsed<int>::ok(kMinutesPerDay);
        if (h > 23 || m > 59) return Parsed<int>::fail(ParseError::OutOfRange);
        return Parsed<int>::ok(h * 60 + m);
    }

    Parsed<IsoDateTime> parseIsoDateTime(std::string_view raw) {
        const std::string_view s = trimmed(raw);
        if (s.empty()) return Parsed<IsoDateTime>::fail(ParseError::Empty);
        if (s.size() < 16 || (s[10] != 'T' && s[10] != ' ')) {
            return Parsed<IsoDateTime>::fail(ParseError::Malformed);
        }

        const auto day = parseDate(s.substr(0, 10));
        if (!day) return Parsed<IsoDateTime>::fail(day.error);

        IsoDateTime out;
        out.date = *day;

        int h = 0, m = 0;
        if (s[13] != ':' || !read_fixed(s, 11, 2, h) || !read_fixed(s, 14, 2, m)) {
            return Parsed<IsoDateTime>::fail(ParseError::Malformed);
        }
        if (h > 23 || m > 59) return Parsed<IsoDateTime>::fail(ParseError::OutOfRange);
        out.minutes = h * 60 + m;

        std::size_t pos = 16;
        if (pos < s.size() && s[pos] == ':') {
            int sec = 0;
            if (!read_fixed(s, pos + 1, 2, sec)) return Parsed<IsoDateTime>::fail(ParseError::Malformed);
            if (sec > 60) return Parsed<IsoDateTime>::fail(ParseError::OutOfRange);
            out.seconds = sec;
            pos += 3;

            // fractional seconds are accepted and dropped
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                const std::size_t frac_begin = pos;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
                if (pos == frac_begin) return Parsed<IsoDateTime>::fail(ParseError::Malformed);
            }
        }

        if (pos == s.size()) return Parsed<IsoDateTime>::ok(out);

        if (s[pos] == 'Z' || s[pos] == 'z') {
            if (pos + 1 != s.size()) return Parsed<IsoDateTime>::fail(ParseError::Malformed);
            out.utcOffsetMinutes = 0;
            return Parsed<IsoDateTime>::ok(out);
        }

        if (s[pos] == '+' || s[pos] == '-') {
            const int sign = (s[pos] == '-') ? -1 : 1;
            int oh = 0, om = 0;
            // "+HH:MM" or "+HHMM"
            if (s.size() == pos + 6 && s[pos + 3] == ':') {
                if (!read_fixed(s, pos + 1, 2, oh) || !read_fixed(s, pos + 4, 2, om)) {
                    return Parsed<IsoDateTime>::fail(ParseError::Malformed);
                }
            } else if (s.size() == pos + 5) {
                if (!read_fixed(s, pos + 1, 2, oh) || !read_fixed(s, pos + 3, 2, om)) {
                    return Parsed<IsoDateTime>::fail(ParseError::Malformed);
                }
            } else {
                return Parsed<IsoDateTime>::fail(ParseError::Malformed);
            }
            if (oh > 14 || om > 59) return Parsed<IsoDateTime>::fail(ParseError::OutOfRange);
            out.utcOffsetMinutes = sign * (oh * 60 + om);
            return Parsed<IsoDateTime>::ok(out);
        }

        return Parsed<IsoDateTime>::fail(ParseError::Malformed);
    }

    boost::posix_time::ptime toUtc(const IsoDateTime &t) {
        const boost::posix_time::ptime wall(t.date,
                                            boost::posix_time::minutes(t.minutes) +
                                            boost::posix_time::seconds(t.seconds));
        return wall - boost::posix_time::minutes(t.utcOffsetMinutes.value_or(0));
    }

    Parsed<LocalDateTime> resolveLocal(std::string_view raw,
                                       const boost::gregorian::date &day,
                                       const ITimezoneProvider *tz) {
        const std::string_view s = trimmed(raw);
        if (s.empty()) return Parsed<LocalDateTime>::fail(ParseError::Empty);

        // Plain wall-clock time on the selected day
        if (s.size() <= 5) {
            const auto clock = parseClock(s);
            if (!clock) return Parsed<LocalDateTime>::fail(clock.error);
            return Parsed<LocalDateTime>::ok(LocalDateTime{day, *clock});
        }

        const auto iso = parseIsoDateTime(s);
        if (!iso) return Parsed<LocalDateTime>::fail(iso.error);

        if (!iso->utcOffsetMinutes.has_value()) {
            return Parsed<LocalDateTime>::ok(LocalDateTime{iso->date, iso->minutes});
        }

        const boost::posix_time::ptime utc = toUtc(*iso);
        if (tz) return Parsed<LocalDateTime>::ok(tz->toLocal(utc));

        const auto tod = utc.time_of_day();
        return Parsed<LocalDateTime>::ok(
            LocalDateTime{utc.date(), static_cast<int>(tod.hours() * 60 + tod.minutes())});
    }

    std::string formatClock(int minutes) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
        return buf;
    }

    std::string formatDate(const boost::gregorian::date &d) {
        return boost::gregorian::to_iso_extended_string(d);
    }

    std::string formatLocalIso(const boost::gregorian::date &d, int minutes) {
        return formatDate(d) + "T" + formatClock(minutes) + ":00";
    }
} // namespace avail
