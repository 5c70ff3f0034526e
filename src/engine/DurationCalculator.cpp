#include "engine/DurationCalculator.hpp"
#include "utils/LogUtils.hpp"
#include "utils/PriceUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <cmath>
#include <cstdio>
#include <exception>

namespace avail {
    std::vector<int> DurationCalculator::candidateMinutes() const {
        const EngineConfig &cfg = queries_.config();
        std::vector<int> out;
        for (int m = cfg.slotMinutes; m <= cfg.maxDurationMinutes; m += cfg.slotMinutes) out.push_back(m);
        return out;
    }

    std::string DurationCalculator::durationLabel(int minutes) {
        if (minutes < 60) return std::to_string(minutes) + "m";
        if (minutes % 60 == 0) return std::to_string(minutes / 60) + "h";

        char buf[16];
        std::snprintf(buf, sizeof(buf), "%gh", minutes / 60.0);
        return buf;
    }

    std::optional<int> DurationCalculator::usableStart_(const AvailabilitySnapshot &snap,
                                                        const std::string &startTime) const {
        const auto start = queries_.startMinutes(snap, startTime);
        if (!start) {
            log::warn("DurationCalculator", "unusable start time '" + startTime + "' (" +
                                            to_string(start.error) + "), no durations");
            return std::nullopt;
        }
        if (queries_.isPast(snap, *start)) {
            log::info("DurationCalculator", "start " + formatClock(*start) + " already elapsed");
            return std::nullopt;
        }
        return *start;
    }

    std::optional<double> DurationCalculator::priceFor_(const Court &court,
                                                        const AvailabilitySnapshot &snap,
                                                        int startMinutes,
                                                        int durationMinutes,
                                                        const std::string &userId) const {
        const int end = startMinutes + durationMinutes;
        const std::string startIso = formatLocalIso(snap.date, startMinutes);
        const std::string endIso = formatLocalIso(snap.date + boost::gregorian::days(end / kMinutesPerDay),
                                                  end % kMinutesPerDay);
        try {
            const double p = pricing_.calculatePrice(court, startIso, endIso, userId);
            if (std::isnan(p) || p < 0.0) {
                log::warn("DurationCalculator", "rejected price for court " + court.id + " " + startIso);
                return std::nullopt;
            }
            return p;
        } catch (const std::exception &e) {
            log::warn("DurationCalculator", "pricing failed for court " + court.id + " (" +
                                            std::to_string(durationMinutes) + "m): " + e.what());
            return std::nullopt;
        }
    }

    std::optional<double> DurationCalculator::meanPrice_(const AvailabilitySnapshot &snap,
                                                         const std::vector<CourtId> &courtIds,
                                                         int startMinutes,
                                                         int durationMinutes,
                                                         const std::string &userId) const {
        double total = 0.0;
        int priced = 0;
        for (const CourtId &id: courtIds) {
            const Court *court = snap.court(id);
            if (!court) continue;
            if (const auto p = priceFor_(*court, snap, startMinutes, durationMinutes, userId)) {
                total += *p;
                ++priced;
            }
        }
        if (priced == 0) return std::nullopt;
        return roundToCents(total / priced);
    }

    std::vector<Duration> DurationCalculator::availableDurations(const AvailabilitySnapshot &snap,
                                                                 const DurationQuery &query) const {
        std::vector<Duration> out;

        const auto start = usableStart_(snap, query.startTime);
        if (!start) return out;

        const Court *court = nullptr;
        if (query.courtId) {
            court = snap.court(*query.courtId);
            if (!court) {
                log::warn("DurationCalculator", "court '" + *query.courtId + "' is not active at this venue");
                return out;
            }
        }

        for (const int minutes: candidateMinutes()) {
            if (*start + minutes > kMinutesPerDay) {
                log::info("DurationCalculator", durationLabel(minutes) + " ends after midnight, skipped");
                continue;
            }

            std::optional<double> price;
            if (court) {
                if (!queries_.isCourtAvailableForDuration(snap, court->id, *start, minutes)) continue;
                price = priceFor_(*court, snap, *start, minutes, query.userId);
            } else {
                std::vector<CourtId> free;
                for (const CourtId &id: snap.activeCourtIds) {
                    if (queries_.isCourtAvailableForDuration(snap, id, *start, minutes)) free.push_back(id);
                }
                if (free.empty()) continue;
                price = meanPrice_(snap, free, *start, minutes, query.userId);
            }
            if (!price) continue;

            Duration d;
            d.label = durationLabel(minutes);
            d.minutes = minutes;
            d.price = *price;
            if (court) d.courtId = court->id;
            out.push_back(std::move(d));
        }

        return out;
    }

    std::vector<DurationAvailability> DurationCalculator::durationAvailability(const AvailabilitySnapshot &snap,
                                                                               const std::string &startTime,
                                                                               const std::string &userId) const {
        std::vector<DurationAvailability> out;

        const auto start = usableStart_(snap, startTime);
        if (!start) return out;

        for (const int minutes: candidateMinutes()) {
            if (*start + minutes > kMinutesPerDay) continue;

            DurationAvailability da;
            for (const CourtId &id: snap.activeCourtIds) {
                if (queries_.isCourtAvailableForDuration(snap, id, *start, minutes)) {
                    da.availableCourts.push_back(id);
                } else {
                    da.unavailableCourts.push_back(id);
                }
            }
            if (da.availableCourts.empty()) continue;

            const auto price = meanPrice_(snap, da.availableCourts, *start, minutes, userId);
            if (!price) continue;

            da.duration.label = durationLabel(minutes);
            da.duration.minutes = minutes;
            da.duration.price = *price;
            out.push_back(std::move(da));
        }

        return out;
    }
} // namespace avail
