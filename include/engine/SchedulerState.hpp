#pragma once

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "abstract/BookingStore.hpp"
#include "abstract/Registries.hpp"
#include "abstract/Subscription.hpp"
#include "abstract/TimezoneProvider.hpp"
#include "config/EngineConfig.hpp"
#include "engine/AvailabilitySnapshot.hpp"
#include "schedule/OccupancyMapper.hpp"
#include "schedule/SlotGenerator.hpp"

namespace avail {
    /**
     * @brief Return code for state operations.
     *
     *  - OK    : accepted (the resulting snapshot is published synchronously or on a later emission).
     *  - ERROR : precondition failed (not started, stopped, incomplete selection).
     */
    enum class Status { OK, ERROR };

    /**
     * @brief Session-owned availability state for the current (venue, date) selection.
     *
     * Lifecycle (single-threaded, driven by the caller's event loop):
     *   1) start()            : subscribe to court/venue registry changes.
     *   2) select(date, venue): resolve flow + active courts, build the slot skeleton,
     *                           subscribe to bookings of that day.
     *   3) booking emissions  : recompute occupancy, publish a new snapshot (loading = false).
     *   4) stop()             : drop every subscription; no callback runs afterwards.
     *
     * Every trigger (selection, court change, venue change, refresh) goes through one recompute
     * path that supersedes older work: the booking subscription is replaced and emissions tagged
     * with an older generation are ignored.
     *
     * snapshot() may be called from any thread; snapshots are immutable and swapped under a lock.
     */
    class SchedulerState {
    public:
        using SnapshotHandler = std::function<void(const SnapshotPtr &)>;

        SchedulerState(ICourtRegistry &courts,
                       IVenueRegistry &venues,
                       IBookingStore &bookings,
                       const ITimezoneProvider &tz,
                       EngineConfig cfg = {});

        ~SchedulerState();

        SchedulerState(const SchedulerState &) = delete;

        SchedulerState &operator=(const SchedulerState &) = delete;

        /// Called after every publish, on the thread that triggered it.
        void setOnSnapshot(SnapshotHandler h) { on_snapshot_ = std::move(h); }

        Status start();

        /**
         * 'select' changes the (date, venue) selection.
         *
         *  - empty date or venue       -> ERROR, nothing changes
         *  - same selection as current -> OK, no recompute
         *  - unparseable date          -> venue-local today is used instead (logged)
         */
        Status select(const std::string &date, const VenueId &venueId);

        /// Forces a full recompute of the current selection.
        Status refresh();

        void stop();

        [[nodiscard]] bool isRunning() const noexcept { return running_; }

        /// Current snapshot; never null after construction.
        [[nodiscard]] SnapshotPtr snapshot() const;

        [[nodiscard]] const EngineConfig &config() const noexcept { return cfg_; }

        [[nodiscard]] const ITimezoneProvider &timezone() const noexcept { return tz_; }

    private:
        struct Selection {
            boost::gregorian::date date;
            VenueId venueId;
        };

        void recompute_();

        void onBookings_(std::uint64_t gen, const std::vector<Booking> &bookings);

        void onBookingsError_(std::uint64_t gen, const std::string &what);

        AvailabilitySnapshot baseSnapshot_() const;

        void publish_(AvailabilitySnapshot snap);

    private:
        ICourtRegistry &courts_;
        IVenueRegistry &venues_;
        IBookingStore &bookings_;
        const ITimezoneProvider &tz_;
        EngineConfig cfg_;

        SlotGenerator generator_;
        OccupancyMapper mapper_;

        bool running_{false};
        std::optional<Selection> selection_;

        /// Flow is fixed per venue selection; later settings edits are ignored until the venue changes.
        std::optional<BookingFlowType> flow_;
        VenueId flow_venue_;

        std::string venue_name_;
        std::vector<Court> active_courts_;
        std::vector<TimeSlot> skeleton_;
        std::vector<Booking> last_bookings_;

        std::uint64_t gen_{0};
        std::uint64_t version_{0};

        Subscription court_sub_;
        Subscription venue_sub_;
        Subscription booking_sub_;

        mutable std::mutex snapshot_mu_;
        SnapshotPtr current_;

        SnapshotHandler on_snapshot_;
    };
} // namespace avail
