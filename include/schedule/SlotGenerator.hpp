#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <optional>
#include <vector>

#include "config/EngineConfig.hpp"
#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"
#include "utils/TimeUtils.hpp"

namespace avail {
    /// Bookable window of one day, [openMinute, closeMinute).
    struct OpeningWindow {
        int openMinute{0};
        int closeMinute{0};
    };

    /**
     * @brief Builds the slot skeleton of one day: every active court free.
     *
     * Window: the venue's opening hours for that weekday if it has any, otherwise
     * [cfg.openMinute, cfg.closeMinute); stepped by cfg.slotMinutes.
     * For the venue-local current day the lower bound is clamped to the start of the
     * current hour (never before the opening); earlier slots are not generated at all.
     */
    class SlotGenerator {
    public:
        explicit SlotGenerator(const EngineConfig &cfg) : cfg_(cfg) {}

        [[nodiscard]] OpeningWindow defaultWindow() const noexcept {
            return OpeningWindow{cfg_.openMinute, cfg_.closeMinute};
        }

        /**
         * Window of `date` under `hours`.
         *
         * No hours at all means the default window. A weekday without an entry, or with
         * hours that do not parse or leave no whole slot, is closed (nullopt).
         * Opening is rounded up and closing down to the slot grid.
         */
        [[nodiscard]] std::optional<OpeningWindow> windowFor(const std::optional<WeeklyHours> &hours,
                                                             const boost::gregorian::date &date) const;

        [[nodiscard]] std::vector<TimeSlot> generate(const boost::gregorian::date &date,
                                                     const std::vector<CourtId> &activeCourtIds,
                                                     const LocalDateTime &now) const {
            return generate(date, activeCourtIds, now, defaultWindow());
        }

        [[nodiscard]] std::vector<TimeSlot> generate(const boost::gregorian::date &date,
                                                     const std::vector<CourtId> &activeCourtIds,
                                                     const LocalDateTime &now,
                                                     const OpeningWindow &window) const;

        /// First minute that will be generated for `date` given `now`.
        [[nodiscard]] int lowerBound(const boost::gregorian::date &date, const LocalDateTime &now) const noexcept {
            return lowerBound(date, now, defaultWindow());
        }

        [[nodiscard]] int lowerBound(const boost::gregorian::date &date, const LocalDateTime &now,
                                     const OpeningWindow &window) const noexcept;

    private:
        EngineConfig cfg_;
    };
} // namespace avail
