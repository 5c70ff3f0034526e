#pragma once

#include <string_view>
#include <utility>
#include <vector>

#include "abstract/TimezoneProvider.hpp"
#include "config/EngineConfig.hpp"
#include "engine/AvailabilitySnapshot.hpp"
#include "model/SlotTypes.hpp"
#include "utils/TimeUtils.hpp"

namespace avail {
    /**
     * @brief Pure read-side questions over a published snapshot.
     *
     * Nothing here mutates the snapshot or touches a collaborator other than the clock.
     * Missing slot data always answers "unavailable".
     */
    class AvailabilityQueries {
    public:
        explicit AvailabilityQueries(const ITimezoneProvider &tz, EngineConfig cfg = {})
            : tz_(tz), cfg_(std::move(cfg)) {
        }

        /// Flattened {label, value, available} list with elapsed slots forced unavailable.
        [[nodiscard]] std::vector<SlotView> availableTimeSlots(const AvailabilitySnapshot &snap) const;

        /// Per-slot available / unavailable court lists; elapsed slots are skipped.
        [[nodiscard]] std::vector<TimeSlotStatus> timeSlotStatuses(const AvailabilitySnapshot &snap) const;

        /// Fail-closed: unknown slot or court -> false.
        [[nodiscard]] static bool isCourtAvailable(const AvailabilitySnapshot &snap,
                                                   const CourtId &courtId,
                                                   int minutes) noexcept;

        /// Every slot-step sub-slot of [start, start + duration) is free for the court.
        [[nodiscard]] bool isCourtAvailableForDuration(const AvailabilitySnapshot &snap,
                                                       const CourtId &courtId,
                                                       int startMinutes,
                                                       int durationMinutes) const noexcept;

        /**
         * 'startMinutes' parses a start time ("HH:MM" or ISO) against the snapshot date.
         * A start on another local day than the snapshot is OutOfRange.
         */
        [[nodiscard]] Parsed<int> startMinutes(const AvailabilitySnapshot &snap, std::string_view startTime) const;

        [[nodiscard]] bool isPast(const AvailabilitySnapshot &snap, int minutes) const;

        [[nodiscard]] const ITimezoneProvider &timezone() const noexcept { return tz_; }
        [[nodiscard]] const EngineConfig &config() const noexcept { return cfg_; }

    private:
        const ITimezoneProvider &tz_;
        EngineConfig cfg_;
    };
} // namespace avail
