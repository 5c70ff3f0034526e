#pragma once

#include <boost/date_time/local_time/local_time.hpp>

#include <optional>
#include <string>

#include "abstract/TimezoneProvider.hpp"

namespace avail {
    inline constexpr const char *kDefaultZoneinfoDir = "/usr/share/zoneinfo";

    /**
     * @brief IANA zone backed by the system zoneinfo database.
     *
     * The TZif v2+ footer of the zone file carries a POSIX TZ rule
     * (e.g. "CET-1CEST,M3.5.0,M10.5.0/3") that describes current and future
     * transitions; it is parsed into a PosixTzRule and applied through a
     * boost::local_time::custom_time_zone.
     * Historic transitions before the rule took effect are not modelled.
     *
     * A zone that cannot be loaded falls back to UTC (logged); isFallback() tells.
     */
    class ZoneInfoTimezone final : public ITimezoneProvider {
    public:
        explicit ZoneInfoTimezone(std::string zoneName, std::string zoneinfoDir = kDefaultZoneinfoDir);

        /// TZ environment (leading ':' stripped), else /etc/timezone, else `fallback`.
        [[nodiscard]] static std::string detectZoneName(const std::string &fallback = "Europe/Berlin");

        /// POSIX rule from the footer of a TZif v2+ file; nothing for v1 files or I/O errors.
        [[nodiscard]] static std::optional<std::string> readPosixFooter(const std::string &path);

        std::string userTimezone() const override { return name_; }

        LocalDateTime localNow() const override;

        LocalDateTime toLocal(const boost::posix_time::ptime &utc) const override;

        /// Footer rule in use, as written in the zone file ("UTC0" after a fallback).
        [[nodiscard]] const std::string &posixRule() const noexcept { return rule_; }
        [[nodiscard]] bool isFallback() const noexcept { return fallback_; }

    private:
        std::string name_;
        std::string rule_;
        boost::local_time::time_zone_ptr zone_;
        bool fallback_{false};
    };
} // namespace avail
