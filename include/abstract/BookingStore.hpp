#pragma once

#include <functional>
#include <string>
#include <vector>

#include "abstract/Subscription.hpp"
#include "model/BookingTypes.hpp"

namespace avail {
    struct BookingFilter {
        std::string date; ///< "YYYY-MM-DD"
        VenueId venueId;
        std::vector<BookingStatus> statusIn{BookingStatus::Confirmed, BookingStatus::Holding};
    };

    inline bool matches(const BookingFilter &f, const Booking &b) {
        if (b.date != f.date) return false;
        if (!f.venueId.empty() && b.venueId != f.venueId) return false;
        for (auto s: f.statusIn) {
            if (s == b.status) return true;
        }
        return false;
    }

    /**
     * @brief Reactive booking source (implemented outside the engine).
     *
     * Semantics:
     *  - subscribe() emits the FULL current matching set on every change (never a delta),
     *    starting with the current set.
     *  - onError reports a data-source failure; the stream may continue afterwards.
     *  - Timeouts and retries are the store's responsibility.
     */
    struct IBookingStore {
        using BookingsHandler = std::function<void(const std::vector<Booking> &)>;
        using ErrorHandler = std::function<void(const std::string &)>;

        virtual ~IBookingStore() = default;

        virtual Subscription subscribe(const BookingFilter &filter,
                                       BookingsHandler onNext,
                                       ErrorHandler onError) = 0;
    };
} // namespace avail
