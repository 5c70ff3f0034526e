#include "schedule/SlotGenerator.hpp"
#include "utils/LogUtils.hpp"

#include <algorithm>

namespace avail {
    std::optional<OpeningWindow> SlotGenerator::windowFor(const std::optional<WeeklyHours> &hours,
                                                          const boost::gregorian::date &date) const {
        if (!hours) return defaultWindow();

        const auto dow = static_cast<std::size_t>(weekdayIndex(date));
        const std::optional<DayHours> &day = (*hours)[dow];
        if (!day) return std::nullopt;

        const auto open = parseClock(day->open);
        const auto close = parseClock(day->close);
        if (!open || !close) {
            log::warn("SlotGenerator", std::string("unusable opening hours on ") + kWeekdayNames[dow] + " '" +
                                       day->open + "'-'" + day->close + "', treating the day as closed");
            return std::nullopt;
        }

        const int step = cfg_.slotMinutes;
        OpeningWindow w;
        w.openMinute = (*open + step - 1) / step * step;
        w.closeMinute = *close / step * step;
        if (w.openMinute >= w.closeMinute) return std::nullopt;
        return w;
    }

    int SlotGenerator::lowerBound(const boost::gregorian::date &date, const LocalDateTime &now,
                                  const OpeningWindow &window) const noexcept {
        if (date != now.date) return window.openMinute;

        const int currentHourStart = (now.minutes / 60) * 60;
        return std::max(window.openMinute, currentHourStart);
    }

    std::vector<TimeSlot> SlotGenerator::generate(const boost::gregorian::date &date,
                                                  const std::vector<CourtId> &activeCourtIds,
                                                  const LocalDateTime &now,
                                                  const OpeningWindow &window) const {
        std::vector<TimeSlot> slots;

        const int from = lowerBound(date, now, window);
        if (from >= window.closeMinute) return slots;

        slots.reserve(static_cast<std::size_t>((window.closeMinute - from) / cfg_.slotMinutes));

        for (int t = from; t < window.closeMinute; t += cfg_.slotMinutes) {
            TimeSlot slot;
            slot.time = formatClock(t);
            slot.timeValue = t;
            for (const auto &id: activeCourtIds) {
                slot.courtAvailability.emplace(id, true);
            }
            slot.hasAvailableCourts = !activeCourtIds.empty();
            slots.push_back(std::move(slot));
        }

        return slots;
    }
} // namespace avail
