#include "engine/CourtAvailabilityAggregator.hpp"
#include "utils/LogUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <algorithm>

namespace avail {
    std::optional<int> CourtAvailabilityAggregator::selectionDuration(const AvailabilitySnapshot &snap,
                                                                      const BookingSelection &selection) const {
        if (!snap.hasDate() || selection.startTime.empty() || selection.endTime.empty()) return std::nullopt;

        const auto start = resolveLocal(selection.startTime, snap.date, &queries_.timezone());
        const auto end = resolveLocal(selection.endTime, snap.date, &queries_.timezone());
        if (!start || !end) return std::nullopt;

        const long long diff = (end->date - start->date).days() * kMinutesPerDay + end->minutes - start->minutes;
        if (diff <= 0 || diff > kMinutesPerDay) return std::nullopt;
        return static_cast<int>(diff);
    }

    std::vector<CourtAvailabilityStatus> CourtAvailabilityAggregator::courtsAvailability(
        const AvailabilitySnapshot &snap,
        const std::string &startTime,
        std::optional<int> durationMinutes,
        const BookingSelection *selection) const {
        std::vector<CourtAvailabilityStatus> out;

        std::string effectiveStart = startTime;
        if (effectiveStart.empty() && selection) effectiveStart = selection->startTime;

        int duration = kDefaultCourtCheckMinutes;
        if (durationMinutes && *durationMinutes > 0) {
            duration = *durationMinutes;
        } else if (selection) {
            duration = selectionDuration(snap, *selection).value_or(kDefaultCourtCheckMinutes);
        }

        const auto start = queries_.startMinutes(snap, effectiveStart);
        if (!start) {
            log::warn("CourtAvailability", "unusable start time '" + effectiveStart + "' (" +
                                           to_string(start.error) + ")");
            return out;
        }

        // the range must end on the selected day
        if (duration > kMinutesPerDay - *start) {
            log::warn("CourtAvailability", "range " + formatClock(*start) + " + " + std::to_string(duration) +
                                           " min runs past midnight");
            return out;
        }

        const int step = queries_.config().slotMinutes;
        const int end = *start + duration;

        out.reserve(snap.activeCourts.size());
        for (const Court &court: snap.activeCourts) {
            CourtAvailabilityStatus st;
            st.courtId = court.id;
            st.courtName = court.name;

            for (int t = *start; t < end; t += step) {
                const std::string label = formatClock(t);
                const bool free = AvailabilityQueries::isCourtAvailable(snap, court.id, t) &&
                                  !queries_.isPast(snap, t);
                (free ? st.availableTimeSlots : st.unavailableTimeSlots).push_back(label);
            }

            st.available = !st.availableTimeSlots.empty();
            st.fullyAvailable = st.available && st.unavailableTimeSlots.empty();
            out.push_back(std::move(st));
        }

        std::stable_sort(out.begin(), out.end(), [](const CourtAvailabilityStatus &a, const CourtAvailabilityStatus &b) {
            if (a.fullyAvailable != b.fullyAvailable) return a.fullyAvailable;
            if (a.availableTimeSlots.size() != b.availableTimeSlots.size()) {
                return a.availableTimeSlots.size() > b.availableTimeSlots.size();
            }
            return a.courtName < b.courtName;
        });

        return out;
    }

    std::vector<Court> CourtAvailabilityAggregator::alternativeCourts(const AvailabilitySnapshot &snap,
                                                                      const std::string &startTime,
                                                                      int durationMinutes,
                                                                      const CourtId &currentCourtId) const {
        std::vector<Court> out;
        for (const auto &st: courtsAvailability(snap, startTime, durationMinutes)) {
            if (!st.fullyAvailable || st.courtId == currentCourtId) continue;
            if (const Court *c = snap.court(st.courtId)) out.push_back(*c);
        }
        return out;
    }
} // namespace avail
