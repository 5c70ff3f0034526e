#pragma once

#include <array>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "abstract/PricingService.hpp"
#include "abstract/TimezoneProvider.hpp"
#include "model/BookingTypes.hpp"
#include "model/SlotTypes.hpp"
#include "utils/TimeUtils.hpp"

namespace avail {
    /// Durations offered on a court's price list.
    inline constexpr std::array<int, 6> kStandardDurations{30, 60, 90, 120, 150, 180};

    /// Weekday peak window [17:00, 21:00).
    inline constexpr int kPeakStartMinute = 17 * 60;
    inline constexpr int kPeakEndMinute = 21 * 60;

    /**
     * @brief Per-court rate pricing.
     *
     * Hourly rate selection (by the start time, venue-local):
     *   - Saturday/Sunday with a weekendRate       -> weekendRate
     *   - otherwise peakHourRate in the weekday peak window, then the first matching special
     *     rate (weekday + "HH:MM" window) overrides
     *   - otherwise baseHourlyRate
     *
     * price = rate * hours, minus memberDiscount percent for members, rounded to cents,
     * never below 1.
     *
     * Throws std::invalid_argument for unparseable or inverted time ranges.
     */
    class CourtRatePricing final : public IPricingService {
    public:
        explicit CourtRatePricing(const ITimezoneProvider *tz = nullptr, std::set<std::string> members = {})
            : tz_(tz), members_(std::move(members)) {
        }

        double calculatePrice(const Court &court,
                              const std::string &startIso,
                              const std::string &endIso,
                              const std::string &userId) const override;

        /// Price list for kStandardDurations starting at `startIso`.
        [[nodiscard]] std::vector<Duration> standardDurationPrices(const Court &court,
                                                                   const std::string &startIso,
                                                                   const std::string &userId = {}) const;

        void addMember(const std::string &userId) { members_.insert(userId); }

        [[nodiscard]] bool isMember(const std::string &userId) const {
            return !userId.empty() && members_.contains(userId);
        }

        [[nodiscard]] static bool isPeakHour(const boost::gregorian::date &date, int minutes);

        /// First special rate matching the start, or nullptr.
        [[nodiscard]] static const SpecialRate *applicableSpecialRate(const Pricing &pricing,
                                                                      const boost::gregorian::date &date,
                                                                      int minutes);

        [[nodiscard]] static double hourlyRate(const Pricing &pricing, const LocalDateTime &start);

    private:
        LocalDateTime toLocal_(const std::string &iso) const;

        const ITimezoneProvider *tz_;
        std::set<std::string> members_;
    };
} // namespace avail
