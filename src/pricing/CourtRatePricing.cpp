#include "pricing/CourtRatePricing.hpp"
#include "engine/DurationCalculator.hpp"
#include "utils/PriceUtils.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>
#include <stdexcept>

namespace avail {
    namespace {
        bool isWeekend(const boost::gregorian::date &d) {
            const int w = weekdayIndex(d);
            return w == 0 || w == 6;
        }

        bool positive(const std::optional<double> &v) {
            return v.has_value() && *v > 0.0;
        }
    } // namespace

    LocalDateTime CourtRatePricing::toLocal_(const std::string &iso) const {
        const auto parsed = parseIsoDateTime(iso);
        if (!parsed) {
            throw std::invalid_argument("invalid timestamp '" + iso + "' (" + to_string(parsed.error) + ")");
        }
        if (!parsed->utcOffsetMinutes.has_value()) return LocalDateTime{parsed->date, parsed->minutes};

        const auto utc = toUtc(*parsed);
        if (tz_) return tz_->toLocal(utc);

        const auto tod = utc.time_of_day();
        return LocalDateTime{utc.date(), static_cast<int>(tod.hours() * 60 + tod.minutes())};
    }

    bool CourtRatePricing::isPeakHour(const boost::gregorian::date &date, int minutes) {
        if (isWeekend(date)) return false;
        return minutes >= kPeakStartMinute && minutes < kPeakEndMinute;
    }

    const SpecialRate *CourtRatePricing::applicableSpecialRate(const Pricing &pricing,
                                                               const boost::gregorian::date &date,
                                                               int minutes) {
        const std::string day = kWeekdayNames[static_cast<std::size_t>(weekdayIndex(date))];
        const std::string clock = formatClock(minutes);

        for (const SpecialRate &sr: pricing.specialRates) {
            if (sr.applyDays &&
                std::find(sr.applyDays->begin(), sr.applyDays->end(), day) == sr.applyDays->end()) {
                continue;
            }
            // "HH:MM" strings order like the times they encode
            if (!sr.startTime.empty() && !sr.endTime.empty()) {
                if (clock < sr.startTime || clock >= sr.endTime) continue;
            }
            return &sr;
        }
        return nullptr;
    }

    double CourtRatePricing::hourlyRate(const Pricing &pricing, const LocalDateTime &start) {
        if (isWeekend(start.date) && positive(pricing.weekendRate)) return *pricing.weekendRate;

        double rate = pricing.baseHourlyRate;
        if (isPeakHour(start.date, start.minutes) && positive(pricing.peakHourRate)) rate = *pricing.peakHourRate;
        if (const SpecialRate *sr = applicableSpecialRate(pricing, start.date, start.minutes)) rate = sr->rate;
        return rate;
    }

    double CourtRatePricing::calculatePrice(const Court &court,
                                            const std::string &startIso,
                                            const std::string &endIso,
                                            const std::string &userId) const {
        const LocalDateTime start = toLocal_(startIso);
        const LocalDateTime end = toLocal_(endIso);

        const long long minutes = (end.date - start.date).days() * kMinutesPerDay + end.minutes - start.minutes;
        if (minutes <= 0) {
            throw std::invalid_argument("end '" + endIso + "' is not after start '" + startIso + "'");
        }

        const Pricing &pricing = court.pricing;
        double total = hourlyRate(pricing, start) * (static_cast<double>(minutes) / 60.0);

        if (isMember(userId) && positive(pricing.memberDiscount)) {
            total -= total * (*pricing.memberDiscount / 100.0);
        }

        return std::max(roundToCents(total), 1.0);
    }

    std::vector<Duration> CourtRatePricing::standardDurationPrices(const Court &court,
                                                                   const std::string &startIso,
                                                                   const std::string &userId) const {
        const LocalDateTime start = toLocal_(startIso);

        std::vector<Duration> out;
        out.reserve(kStandardDurations.size());
        for (const int minutes: kStandardDurations) {
            const int end = start.minutes + minutes;
            const std::string endIso = formatLocalIso(start.date + boost::gregorian::days(end / kMinutesPerDay),
                                                      end % kMinutesPerDay);

            Duration d;
            d.label = DurationCalculator::durationLabel(minutes);
            d.minutes = minutes;
            d.price = calculatePrice(court, formatLocalIso(start.date, start.minutes), endIso, userId);
            d.courtId = court.id;
            out.push_back(std::move(d));
        }
        return out;
    }
} // namespace avail
