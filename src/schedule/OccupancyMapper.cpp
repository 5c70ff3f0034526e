#include "schedule/OccupancyMapper.hpp"
#include "abstract/TimezoneProvider.hpp"
#include "utils/LogUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <algorithm>
#include <string>

namespace avail {
    void refreshSlotSummary(TimeSlot &slot) noexcept {
        slot.hasAvailableCourts = std::any_of(slot.courtAvailability.begin(), slot.courtAvailability.end(),
                                              [](const auto &kv) { return kv.second; });
    }

    bool OccupancyMapper::occupies(const Booking &b, const boost::gregorian::date &date) {
        if (!is_occupying(b.status)) return false;

        if (!b.date.empty()) return b.date == formatDate(date);

        // No explicit date: fall back to the date part of an ISO start time
        const auto iso = parseIsoDateTime(b.startTime);
        return iso && iso->date == date;
    }

    std::optional<BookingSpan> OccupancyMapper::span(const Booking &b, const boost::gregorian::date &date) const {
        const auto start = resolveLocal(b.startTime, date, tz_);
        const auto end = resolveLocal(b.endTime, date, tz_);

        if (!start || !end) {
            log::warn("OccupancyMapper",
                      "skipping booking '" + b.id + "': invalid time (start=" + std::string(to_string(start.error)) +
                      ", end=" + std::string(to_string(end.error)) + ")");
            return std::nullopt;
        }

        // Clip to the requested day; cross-day schedules are not modelled
        if (start->date > date || end->date < date) return std::nullopt;

        BookingSpan out;
        out.courtId = b.courtId;
        out.startMinutes = (start->date < date) ? 0 : start->minutes;
        out.endMinutes = (end->date > date) ? kMinutesPerDay : end->minutes;

        // "00:00" as an end time closes the day
        if (out.endMinutes == 0 && out.startMinutes > 0) out.endMinutes = kMinutesPerDay;

        if (out.endMinutes <= out.startMinutes) {
            log::warn("OccupancyMapper", "skipping booking '" + b.id + "': end is not after start");
            return std::nullopt;
        }

        return out;
    }

    std::vector<TimeSlot> OccupancyMapper::apply(std::vector<TimeSlot> slots,
                                                 const std::vector<Booking> &bookings,
                                                 const boost::gregorian::date &date) const {
        for (const Booking &b: bookings) {
            if (!occupies(b, date)) continue;

            const auto s = span(b, date);
            if (!s) continue;

            for (TimeSlot &slot: slots) {
                if (slot.timeValue < s->startMinutes || slot.timeValue >= s->endMinutes) continue;

                // Only ever flips true -> false, so the fold is order independent
                auto it = slot.courtAvailability.find(s->courtId);
                if (it != slot.courtAvailability.end()) it->second = false;
            }
        }

        for (TimeSlot &slot: slots) refreshSlotSummary(slot);

        return slots;
    }
} // namespace avail
