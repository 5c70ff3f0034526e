#pragma once

#include <boost/asio/io_context.hpp>  /// External event loop

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "abstract/BookingStore.hpp"
#include "abstract/Registries.hpp"
#include "model/BookingTypes.hpp"

namespace avail {
    namespace detail {
        /// Change listeners; the Subscription only holds a weak reference so it may outlive the owner.
        struct ChangeListeners {
            std::uint64_t next_id{0};
            std::map<std::uint64_t, std::function<void()>> handlers;

            Subscription add(std::function<void()> h, const std::shared_ptr<ChangeListeners> &self);

            void notify() const;
        };
    } // namespace detail

    /// In-process court registry; listeners are notified synchronously after each change.
    class InMemoryCourtRegistry final : public ICourtRegistry {
    public:
        InMemoryCourtRegistry() : listeners_(std::make_shared<detail::ChangeListeners>()) {}

        explicit InMemoryCourtRegistry(std::vector<Court> courts);

        std::vector<Court> courts() const override { return courts_; }

        Subscription subscribe(ChangeHandler onChange) override;

        /// Insert or replace by id.
        void upsert(const Court &court);

        bool remove(const CourtId &id);

        void setStatus(const CourtId &id, CourtStatus status);

    private:
        std::vector<Court> courts_;
        std::shared_ptr<detail::ChangeListeners> listeners_;
    };

    class InMemoryVenueRegistry final : public IVenueRegistry {
    public:
        InMemoryVenueRegistry() : listeners_(std::make_shared<detail::ChangeListeners>()) {}

        explicit InMemoryVenueRegistry(std::vector<Venue> venues);

        std::optional<Venue> venue(const VenueId &id) const override;

        Subscription subscribe(ChangeHandler onChange) override;

        void upsert(const Venue &venue);

    private:
        std::map<VenueId, Venue> venues_;
        std::shared_ptr<detail::ChangeListeners> listeners_;
    };

    /**
     * @brief Reactive booking store running on an external io_context.
     *
     * Every emission (initial set, after each change, injected errors) is posted to the
     * io_context, so subscribers observe it on the next run of the loop. Emissions
     * already queued for a cancelled subscription are dropped.
     *
     * Single-threaded: call it from the io_context's thread only.
     */
    class InMemoryBookingStore final : public IBookingStore {
    public:
        explicit InMemoryBookingStore(boost::asio::io_context &ioc);

        Subscription subscribe(const BookingFilter &filter,
                               BookingsHandler onNext,
                               ErrorHandler onError) override;

        /// Insert or replace by id, then re-emit to all subscribers.
        void upsert(const Booking &booking);

        bool remove(const std::string &bookingId);

        /// Reports a data-source failure to every live subscriber.
        void injectError(const std::string &message);

        [[nodiscard]] std::vector<Booking> bookings() const;

        [[nodiscard]] std::size_t subscriberCount() const noexcept { return state_->subs.size(); }

    private:
        struct Subscriber {
            BookingFilter filter;
            BookingsHandler onNext;
            ErrorHandler onError;
            bool alive{true};
        };

        struct State {
            std::uint64_t next_id{0};
            std::map<std::uint64_t, std::shared_ptr<Subscriber>> subs;
        };

        std::vector<Booking> matching_(const BookingFilter &filter) const;

        void emit_(const std::shared_ptr<Subscriber> &sub);

        void emitAll_();

    private:
        boost::asio::io_context &ioc_;
        std::map<std::string, Booking> bookings_;
        std::shared_ptr<State> state_;
    };
} // namespace avail
