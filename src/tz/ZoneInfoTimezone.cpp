#include "tz/ZoneInfoTimezone.hpp"
#include "tz/PosixTzRule.hpp"
#include "utils/LogUtils.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace avail {
    namespace {
        LocalDateTime fromPtime(const boost::posix_time::ptime &t) {
            const auto tod = t.time_of_day();
            return LocalDateTime{t.date(), static_cast<int>(tod.hours() * 60 + tod.minutes())};
        }
    } // namespace

    std::string ZoneInfoTimezone::detectZoneName(const std::string &fallback) {
        if (const char *env = std::getenv("TZ"); env && *env) {
            std::string tz(env);
            if (tz.front() == ':') tz.erase(0, 1);
            boost::algorithm::trim(tz);
            if (!tz.empty()) return tz;
        }

        std::ifstream in("/etc/timezone");
        std::string line;
        if (in && std::getline(in, line)) {
            boost::algorithm::trim(line);
            if (!line.empty()) return line;
        }

        return fallback;
    }

    std::optional<std::string> ZoneInfoTimezone::readPosixFooter(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;

        const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        // header: "TZif" + version byte ('\0' = v1, '2', '3', ...)
        if (data.size() < 5 || data.compare(0, 4, "TZif") != 0 || data[4] == '\0') return std::nullopt;

        // footer: "\n<rule>\n" at the very end
        if (data.size() < 2 || data.back() != '\n') return std::nullopt;
        const std::size_t open = data.rfind('\n', data.size() - 2);
        if (open == std::string::npos) return std::nullopt;

        std::string rule = data.substr(open + 1, data.size() - open - 2);
        if (rule.empty()) return std::nullopt;
        return rule;
    }

    ZoneInfoTimezone::ZoneInfoTimezone(std::string zoneName, std::string zoneinfoDir)
        : name_(std::move(zoneName)) {
        const std::string path = (!name_.empty() && name_.front() == '/') ? name_ : zoneinfoDir + "/" + name_;

        if (const auto footer = readPosixFooter(path)) {
            try {
                zone_ = makeTimeZone(parsePosixTzRule(*footer));
                rule_ = *footer;
            } catch (const std::exception &e) {
                log::warn("Timezone", "cannot use rule '" + *footer + "' of " + name_ + ": " + e.what());
                zone_.reset();
            }
        } else {
            log::warn("Timezone", "no zoneinfo rule for '" + name_ + "' under " + zoneinfoDir);
        }

        if (!zone_) {
            fallback_ = true;
            rule_ = "UTC0";
            zone_ = makeTimeZone(parsePosixTzRule(rule_));
            log::warn("Timezone", "using UTC instead of '" + name_ + "'");
        }

        log::info("Timezone", name_ + " -> " + rule_);
    }

    LocalDateTime ZoneInfoTimezone::toLocal(const boost::posix_time::ptime &utc) const {
        const boost::local_time::local_date_time ldt(utc, zone_);
        return fromPtime(ldt.local_time());
    }

    LocalDateTime ZoneInfoTimezone::localNow() const {
        return toLocal(boost::posix_time::second_clock::universal_time());
    }
} // namespace avail
