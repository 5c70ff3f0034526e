#include "store/InMemoryStores.hpp"
#include "utils/LogUtils.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace avail {
    namespace detail {
        Subscription ChangeListeners::add(std::function<void()> h, const std::shared_ptr<ChangeListeners> &self) {
            const std::uint64_t id = next_id++;
            handlers.emplace(id, std::move(h));

            std::weak_ptr<ChangeListeners> weak = self;
            return Subscription([weak, id] {
                if (auto l = weak.lock()) l->handlers.erase(id);
            });
        }

        void ChangeListeners::notify() const {
            // handlers may unsubscribe (or subscribe) while being notified
            std::vector<std::uint64_t> ids;
            ids.reserve(handlers.size());
            for (const auto &[id, _]: handlers) ids.push_back(id);

            for (const auto id: ids) {
                const auto it = handlers.find(id);
                if (it == handlers.end()) continue;
                const auto h = it->second;
                h();
            }
        }
    } // namespace detail

    // ---------------------------------------------------------------- courts

    InMemoryCourtRegistry::InMemoryCourtRegistry(std::vector<Court> courts)
        : courts_(std::move(courts)),
          listeners_(std::make_shared<detail::ChangeListeners>()) {
    }

    Subscription InMemoryCourtRegistry::subscribe(ChangeHandler onChange) {
        return listeners_->add(std::move(onChange), listeners_);
    }

    void InMemoryCourtRegistry::upsert(const Court &court) {
        const auto it = std::find_if(courts_.begin(), courts_.end(), [&](const Court &c) { return c.id == court.id; });
        if (it == courts_.end()) {
            courts_.push_back(court);
        } else {
            *it = court;
        }
        listeners_->notify();
    }

    bool InMemoryCourtRegistry::remove(const CourtId &id) {
        const auto removed = std::erase_if(courts_, [&](const Court &c) { return c.id == id; });
        if (removed == 0) return false;
        listeners_->notify();
        return true;
    }

    void InMemoryCourtRegistry::setStatus(const CourtId &id, CourtStatus status) {
        for (Court &c: courts_) {
            if (c.id != id) continue;
            if (c.status == status) return;
            c.status = status;
            listeners_->notify();
            return;
        }
        log::warn("CourtRegistry", "setStatus on unknown court '" + id + "'");
    }

    // ---------------------------------------------------------------- venues

    InMemoryVenueRegistry::InMemoryVenueRegistry(std::vector<Venue> venues)
        : listeners_(std::make_shared<detail::ChangeListeners>()) {
        for (auto &v: venues) venues_[v.id] = std::move(v);
    }

    std::optional<Venue> InMemoryVenueRegistry::venue(const VenueId &id) const {
        const auto it = venues_.find(id);
        if (it == venues_.end()) return std::nullopt;
        return it->second;
    }

    Subscription InMemoryVenueRegistry::subscribe(ChangeHandler onChange) {
        return listeners_->add(std::move(onChange), listeners_);
    }

    void InMemoryVenueRegistry::upsert(const Venue &venue) {
        venues_[venue.id] = venue;
        listeners_->notify();
    }

    // ---------------------------------------------------------------- bookings

    InMemoryBookingStore::InMemoryBookingStore(boost::asio::io_context &ioc)
        : ioc_(ioc), state_(std::make_shared<State>()) {
    }

    std::vector<Booking> InMemoryBookingStore::matching_(const BookingFilter &filter) const {
        std::vector<Booking> out;
        for (const auto &[_, b]: bookings_) {
            if (matches(filter, b)) out.push_back(b);
        }
        return out;
    }

    void InMemoryBookingStore::emit_(const std::shared_ptr<Subscriber> &sub) {
        boost::asio::post(ioc_, [sub, set = matching_(sub->filter)] {
            if (sub->alive && sub->onNext) sub->onNext(set);
        });
    }

    void InMemoryBookingStore::emitAll_() {
        for (const auto &[_, sub]: state_->subs) emit_(sub);
    }

    Subscription InMemoryBookingStore::subscribe(const BookingFilter &filter,
                                                 BookingsHandler onNext,
                                                 ErrorHandler onError) {
        auto sub = std::make_shared<Subscriber>();
        sub->filter = filter;
        sub->onNext = std::move(onNext);
        sub->onError = std::move(onError);

        const std::uint64_t id = state_->next_id++;
        state_->subs.emplace(id, sub);

        log::info("BookingStore", "subscribe #" + std::to_string(id) + " date=" + filter.date +
                                  " venue=" + filter.venueId);

        emit_(sub);

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, sub, id] {
            sub->alive = false;
            if (auto st = weak.lock()) st->subs.erase(id);
        });
    }

    void InMemoryBookingStore::upsert(const Booking &booking) {
        bookings_[booking.id] = booking;
        emitAll_();
    }

    bool InMemoryBookingStore::remove(const std::string &bookingId) {
        if (bookings_.erase(bookingId) == 0) return false;
        emitAll_();
        return true;
    }

    void InMemoryBookingStore::injectError(const std::string &message) {
        for (const auto &[_, sub]: state_->subs) {
            boost::asio::post(ioc_, [sub, message] {
                if (sub->alive && sub->onError) sub->onError(message);
            });
        }
    }

    std::vector<Booking> InMemoryBookingStore::bookings() const {
        std::vector<Booking> out;
        out.reserve(bookings_.size());
        for (const auto &[_, b]: bookings_) out.push_back(b);
        return out;
    }
} // namespace avail
