#pragma once

#include <optional>
#include <string>
#include <vector>

#include "abstract/PricingService.hpp"
#include "engine/AvailabilityQueries.hpp"
#include "engine/AvailabilitySnapshot.hpp"
#include "model/SlotTypes.hpp"

namespace avail {
    struct DurationQuery {
        std::string startTime; ///< "HH:MM" or ISO
        std::optional<CourtId> courtId; ///< court mode if set
        std::string userId;
    };

    /**
     * @brief Enumerates bookable durations for a start time.
     *
     * Candidates run from one slot step up to cfg.maxDurationMinutes. Each candidate is
     * evaluated independently: a pricing failure or an end past midnight removes that
     * candidate only.
     *
     *  - court mode    : the court must be free for every sub-slot; its own price is used.
     *  - no-court mode : the mean price over all active courts free for the whole span.
     *
     * Never throws; an unusable or elapsed start yields an empty list.
     */
    class DurationCalculator {
    public:
        DurationCalculator(const AvailabilityQueries &queries, const IPricingService &pricing)
            : queries_(queries), pricing_(pricing) {
        }

        [[nodiscard]] std::vector<Duration> availableDurations(const AvailabilitySnapshot &snap,
                                                               const DurationQuery &query) const;

        /// Per candidate, which courts are free for the whole span. Candidates with no free court are left out.
        [[nodiscard]] std::vector<DurationAvailability> durationAvailability(const AvailabilitySnapshot &snap,
                                                                             const std::string &startTime,
                                                                             const std::string &userId = {}) const;

        [[nodiscard]] std::vector<int> candidateMinutes() const;

        /// "30m", "1h", "1.5h", ...
        [[nodiscard]] static std::string durationLabel(int minutes);

    private:
        std::optional<int> usableStart_(const AvailabilitySnapshot &snap, const std::string &startTime) const;

        std::optional<double> priceFor_(const Court &court,
                                        const AvailabilitySnapshot &snap,
                                        int startMinutes,
                                        int durationMinutes,
                                        const std::string &userId) const;

        std::optional<double> meanPrice_(const AvailabilitySnapshot &snap,
                                         const std::vector<CourtId> &courtIds,
                                         int startMinutes,
                                         int durationMinutes,
                                         const std::string &userId) const;

    private:
        const AvailabilityQueries &queries_;
        const IPricingService &pricing_;
    };
} // namespace avail
