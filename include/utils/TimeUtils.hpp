#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace avail {
    class ITimezoneProvider;

    /**
     * @brief Why a boundary value could not be parsed.
     *
     *  - Empty      : nothing was supplied (typical for an incomplete wizard selection).
     *  - Malformed  : text does not match the expected shape.
     *  - OutOfRange : shape is fine but a field is impossible (e.g. "25:00", "2025-02-30").
     */
    enum class ParseError { None, Empty, Malformed, OutOfRange };

    inline const char *to_string(ParseError e) {
        switch (e) {
            case ParseError::None: return "none";
            case ParseError::Empty: return "empty";
            case ParseError::Malformed: return "malformed";
            case ParseError::OutOfRange: return "out_of_range";
            default: return "unknown";
        }
    }

    /// Result of a boundary parse: either a value or the reason there is none.
    template<typename T>
    struct Parsed {
        std::optional<T> value;
        ParseError error{ParseError::None};

        static Parsed ok(T v) { return Parsed{std::move(v), ParseError::None}; }
        static Parsed fail(ParseError e) { return Parsed{std::nullopt, e}; }

        [[nodiscard]] bool has_value() const noexcept { return value.has_value(); }
        explicit operator bool() const noexcept { return value.has_value(); }
        const T &operator*() const { return *value; }
        const T *operator->() const { return &*value; }
    };

    /// A wall-clock position in the venue's timezone.
    struct LocalDateTime {
        boost::gregorian::date date;
        int minutes{0}; ///< minutes since local midnight; 1440 only as an end-of-day marker
    };

    /// "YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]"
    struct IsoDateTime {
        boost::gregorian::date date;
        int minutes{0};
        int seconds{0};
        std::optional<int> utcOffsetMinutes; ///< absent for floating (local) timestamps
    };

    constexpr int kMinutesPerDay = 24 * 60;

    /// Lowercase weekday names indexed like boost's day_of_week (0 = Sunday).
    constexpr std::array<const char *, 7> kWeekdayNames{
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
    };

    inline int weekdayIndex(const boost::gregorian::date &d) {
        return static_cast<int>(d.day_of_week().as_number());
    }

    Parsed<boost::gregorian::date> parseDate(std::string_view s);

    /// "HH:MM" or "H:MM"; "24:00" is accepted as end-of-day (1440).
    Parsed<int> parseClock(std::string_view s);

    Parsed<IsoDateTime> parseIsoDateTime(std::string_view s);

    /**
     * 'resolveLocal' turns a booking/selection time into venue-local wall time.
     *
     *  - "HH:MM"                  -> {day, minutes}
     *  - ISO without offset       -> wall time as written
     *  - ISO with offset / "Z"    -> converted through tz (UTC if tz is null)
     */
    Parsed<LocalDateTime> resolveLocal(std::string_view s,
                                       const boost::gregorian::date &day,
                                       const ITimezoneProvider *tz);

    std::string formatClock(int minutes);

    std::string formatDate(const boost::gregorian::date &d);

    /// Floating local ISO timestamp, e.g. "2025-06-01T10:30:00".
    std::string formatLocalIso(const boost::gregorian::date &d, int minutes);

    boost::posix_time::ptime toUtc(const IsoDateTime &t);
} // namespace avail
