#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "abstract/Subscription.hpp"
#include "model/BookingTypes.hpp"

namespace avail {
    /**
     * @brief Reactive registry of all courts, across venues.
     *
     * The engine filters by venueId and status == active itself.
     */
    struct ICourtRegistry {
        using ChangeHandler = std::function<void()>;

        virtual ~ICourtRegistry() = default;

        /// Current full set of courts.
        virtual std::vector<Court> courts() const = 0;

        /// Notified after every change of the court set.
        virtual Subscription subscribe(ChangeHandler onChange) = 0;
    };

    /**
     * @brief Reactive registry of venues.
     */
    struct IVenueRegistry {
        using ChangeHandler = std::function<void()>;

        virtual ~IVenueRegistry() = default;

        virtual std::optional<Venue> venue(const VenueId &id) const = 0;

        virtual Subscription subscribe(ChangeHandler onChange) = 0;
    };

    /// Active courts of one venue, in registry order.
    inline std::vector<Court> activeCourtsFor(const ICourtRegistry &registry, const VenueId &venueId) {
        std::vector<Court> out;
        for (auto &c: registry.courts()) {
            if (c.venueId == venueId && c.status == CourtStatus::Active) out.push_back(std::move(c));
        }
        return out;
    }
} // namespace avail
