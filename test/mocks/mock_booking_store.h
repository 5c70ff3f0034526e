#pragma once
#include "abstract/BookingStore.hpp"
#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

namespace avail {

/// @brief GoogleMock test double for IBookingStore.
class MockBookingStore : public IBookingStore {
public:
    MOCK_METHOD(Subscription, subscribe, (const BookingFilter&, BookingsHandler, ErrorHandler), (override));
};

/// @brief Hand-driven booking source: the test decides when (and what) to emit.
///        Keeps every subscription so tests can poke stale ones as well.
class ManualBookingStore : public IBookingStore {
public:
    struct Entry {
        BookingFilter filter;
        BookingsHandler onNext;
        ErrorHandler onError;
        bool cancelled{false};
    };

    Subscription subscribe(const BookingFilter &filter, BookingsHandler onNext, ErrorHandler onError) override {
        entries.push_back(std::make_shared<Entry>(Entry{filter, std::move(onNext), std::move(onError)}));
        auto e = entries.back();
        return Subscription([e] { e->cancelled = true; });
    }

    /// Emits to the newest live subscription.
    void emit(const std::vector<Booking> &bookings) {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            if (!(*it)->cancelled) {
                (*it)->onNext(bookings);
                return;
            }
        }
    }

    void fail(const std::string &what) {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            if (!(*it)->cancelled) {
                (*it)->onError(what);
                return;
            }
        }
    }

    [[nodiscard]] std::size_t liveCount() const {
        std::size_t n = 0;
        for (const auto &e: entries) n += e->cancelled ? 0 : 1;
        return n;
    }

    std::vector<std::shared_ptr<Entry>> entries;
};

}
