#pragma once

#include <optional>
#include <string>
#include <vector>

#include "engine/AvailabilityQueries.hpp"
#include "engine/AvailabilitySnapshot.hpp"
#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"

namespace avail {
    constexpr int kDefaultCourtCheckMinutes = 30;

    /**
     * @brief Per-court availability over a requested range [start, start + duration).
     *
     * Duration resolution order: explicit argument, then the selection's start/end
     * difference, then 30 minutes. Elapsed or missing sub-slots count as unavailable.
     * A range that would run past midnight of the selected day yields no result.
     *
     * Ordering: fully available first, then more free sub-slots, then court name (stable).
     */
    class CourtAvailabilityAggregator {
    public:
        explicit CourtAvailabilityAggregator(const AvailabilityQueries &queries) : queries_(queries) {}

        [[nodiscard]] std::vector<CourtAvailabilityStatus> courtsAvailability(
            const AvailabilitySnapshot &snap,
            const std::string &startTime,
            std::optional<int> durationMinutes = std::nullopt,
            const BookingSelection *selection = nullptr) const;

        /// Fully available courts other than `currentCourtId`, in aggregator order.
        [[nodiscard]] std::vector<Court> alternativeCourts(const AvailabilitySnapshot &snap,
                                                           const std::string &startTime,
                                                           int durationMinutes,
                                                           const CourtId &currentCourtId) const;

        /// end - start of the selection in minutes, if both are present, ordered and at most a day apart.
        [[nodiscard]] std::optional<int> selectionDuration(const AvailabilitySnapshot &snap,
                                                           const BookingSelection &selection) const;

    private:
        const AvailabilityQueries &queries_;
    };
} // namespace avail
