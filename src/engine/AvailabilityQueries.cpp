#include "engine/AvailabilityQueries.hpp"
#include "schedule/PastSlotFilter.hpp"

namespace avail {
    std::vector<SlotView> AvailabilityQueries::availableTimeSlots(const AvailabilitySnapshot &snap) const {
        std::vector<SlotView> views;
        views.reserve(snap.timeSlots.size());
        for (const TimeSlot &s: snap.timeSlots) {
            views.push_back(SlotView{s.time, s.timeValue, s.hasAvailableCourts});
        }
        if (!snap.hasDate()) return views;

        const PastSlotFilter filter(cfg_.graceMinutes);
        return filter.apply(std::move(views), snap.date, tz_.localNow());
    }

    std::vector<TimeSlotStatus> AvailabilityQueries::timeSlotStatuses(const AvailabilitySnapshot &snap) const {
        std::vector<TimeSlotStatus> out;
        if (!snap.hasDate()) return out;

        for (const TimeSlot &s: snap.timeSlots) {
            if (isPast(snap, s.timeValue)) continue;

            TimeSlotStatus st;
            st.time = s.time;
            st.timeValue = s.timeValue;
            for (const CourtId &id: snap.activeCourtIds) {
                const auto it = s.courtAvailability.find(id);
                if (it != s.courtAvailability.end() && it->second) {
                    st.availableCourts.push_back(id);
                } else {
                    st.unavailableCourts.push_back(id);
                }
            }
            st.hasAvailableCourts = !st.availableCourts.empty();
            out.push_back(std::move(st));
        }
        return out;
    }

    bool AvailabilityQueries::isCourtAvailable(const AvailabilitySnapshot &snap,
                                               const CourtId &courtId,
                                               int minutes) noexcept {
        const TimeSlot *slot = snap.slotAt(minutes);
        if (!slot) return false;
        const auto it = slot->courtAvailability.find(courtId);
        return it != slot->courtAvailability.end() && it->second;
    }

    bool AvailabilityQueries::isCourtAvailableForDuration(const AvailabilitySnapshot &snap,
                                                          const CourtId &courtId,
                                                          int startMinutes,
                                                          int durationMinutes) const noexcept {
        if (durationMinutes <= 0 || startMinutes < 0 || durationMinutes > kMinutesPerDay - startMinutes) return false;
        const int end = startMinutes + durationMinutes;

        for (int t = startMinutes; t < end; t += cfg_.slotMinutes) {
            if (!isCourtAvailable(snap, courtId, t)) return false;
        }
        return true;
    }

    Parsed<int> AvailabilityQueries::startMinutes(const AvailabilitySnapshot &snap, std::string_view startTime) const {
        if (!snap.hasDate()) return Parsed<int>::fail(ParseError::Empty);

        const auto local = resolveLocal(startTime, snap.date, &tz_);
        if (!local) return Parsed<int>::fail(local.error);
        if (local->date != snap.date || local->minutes >= kMinutesPerDay) {
            return Parsed<int>::fail(ParseError::OutOfRange);
        }
        return Parsed<int>::ok(local->minutes);
    }

    bool AvailabilityQueries::isPast(const AvailabilitySnapshot &snap, int minutes) const {
        return tz_.isTimeSlotInPast(snap.date, minutes, cfg_.graceMinutes);
    }
} // namespace avail
