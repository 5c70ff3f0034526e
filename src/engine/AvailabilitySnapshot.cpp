#include "engine/AvailabilitySnapshot.hpp"

#include <algorithm>

namespace avail {
    const TimeSlot *AvailabilitySnapshot::slotAt(int minutes) const noexcept {
        const auto it = std::lower_bound(timeSlots.begin(), timeSlots.end(), minutes,
                                         [](const TimeSlot &s, int m) { return s.timeValue < m; });
        if (it == timeSlots.end() || it->timeValue != minutes) return nullptr;
        return &*it;
    }

    const Court *AvailabilitySnapshot::court(const CourtId &id) const noexcept {
        const auto it = std::find_if(activeCourts.begin(), activeCourts.end(),
                                     [&](const Court &c) { return c.id == id; });
        return it == activeCourts.end() ? nullptr : &*it;
    }
} // namespace avail
