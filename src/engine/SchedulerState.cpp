#include "engine/SchedulerState.hpp"
#include "schedule/FlowResolver.hpp"
#include "utils/LogUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <utility>

namespace avail {
    SchedulerState::SchedulerState(ICourtRegistry &courts,
                                   IVenueRegistry &venues,
                                   IBookingStore &bookings,
                                   const ITimezoneProvider &tz,
                                   EngineConfig cfg)
        : courts_(courts),
          venues_(venues),
          bookings_(bookings),
          tz_(tz),
          cfg_(std::move(cfg)),
          generator_(cfg_),
          mapper_(&tz_),
          current_(std::make_shared<const AvailabilitySnapshot>()) {
        cfg_.validate();
    }

    SchedulerState::~SchedulerState() {
        stop();
    }

    Status SchedulerState::start() {
        if (running_) return Status::ERROR;
        running_ = true;

        /// Registry changes re-run the full pipeline for the current selection
        court_sub_ = courts_.subscribe([this] {
            if (running_ && selection_) recompute_();
        });
        venue_sub_ = venues_.subscribe([this] {
            if (running_ && selection_) recompute_();
        });

        return Status::OK;
    }

    void SchedulerState::stop() {
        if (!running_) return;
        running_ = false;
        ++gen_; // anything still in flight is stale now

        booking_sub_.unsubscribe();
        court_sub_.unsubscribe();
        venue_sub_.unsubscribe();

        log::info("SchedulerState", "stopped");
    }

    Status SchedulerState::select(const std::string &date, const VenueId &venueId) {
        if (!running_) {
            log::warn("SchedulerState", "select() before start() or after stop()");
            return Status::ERROR;
        }
        if (date.empty() || venueId.empty()) return Status::ERROR;

        boost::gregorian::date day;
        const auto parsed = parseDate(date);
        if (parsed) {
            day = *parsed;
        } else {
            day = tz_.localNow().date;
            log::warn("SchedulerState", "invalid date '" + date + "' (" + to_string(parsed.error) +
                                        "), falling back to today " + formatDate(day));
        }

        if (selection_ && selection_->date == day && selection_->venueId == venueId) {
            return Status::OK;
        }

        if (selection_ && selection_->venueId != venueId) flow_.reset();

        selection_ = Selection{day, venueId};
        recompute_();
        return Status::OK;
    }

    Status SchedulerState::refresh() {
        if (!running_ || !selection_) return Status::ERROR;
        recompute_();
        return Status::OK;
    }

    SnapshotPtr SchedulerState::snapshot() const {
        std::lock_guard<std::mutex> lock(snapshot_mu_);
        return current_;
    }

    AvailabilitySnapshot SchedulerState::baseSnapshot_() const {
        AvailabilitySnapshot s;
        s.date = selection_->date;
        s.venueId = selection_->venueId;
        s.venueName = venue_name_;
        s.flowType = flow_.value_or(kDefaultFlow);
        return s;
    }

    void SchedulerState::publish_(AvailabilitySnapshot snap) {
        snap.version = ++version_;
        auto next = std::make_shared<const AvailabilitySnapshot>(std::move(snap));
        {
            std::lock_guard<std::mutex> lock(snapshot_mu_);
            current_ = next;
        }
        if (on_snapshot_) on_snapshot_(next);
    }

    void SchedulerState::recompute_() {
        if (!running_ || !selection_) return;

        const std::uint64_t gen = ++gen_;
        booking_sub_.unsubscribe();

        /// 1) Loading marker. Slot data survives only if the selection did not change.
        {
            const SnapshotPtr prev = snapshot();
            AvailabilitySnapshot loading;
            if (prev->hasDate() && prev->date == selection_->date && prev->venueId == selection_->venueId) {
                loading = *prev;
            } else {
                loading = baseSnapshot_();
            }
            loading.loading = true;
            loading.error.reset();
            loading.errorKind = AvailabilityErrorKind::None;
            publish_(std::move(loading));
        }

        /// 2) Venue + flow
        const auto venue = venues_.venue(selection_->venueId);
        venue_name_ = venue ? venue->name : std::string{};
        if (!flow_ || flow_venue_ != selection_->venueId) {
            flow_ = FlowResolver::resolve(venue);
            flow_venue_ = selection_->venueId;
        }

        /// 3) Active courts
        active_courts_ = activeCourtsFor(courts_, selection_->venueId);
        last_bookings_.clear();

        if (active_courts_.empty()) {
            skeleton_.clear();

            AvailabilitySnapshot snap = baseSnapshot_();
            snap.loading = false;
            snap.error = std::string(kNoActiveCourtsMessage);
            snap.errorKind = AvailabilityErrorKind::NoActiveCourts;

            log::warn("SchedulerState", "venue '" + selection_->venueId + "' has no active courts");
            publish_(std::move(snap));
            return;
        }

        /// 4) Slot skeleton over the venue's opening window; a closed day has none
        std::vector<CourtId> ids;
        ids.reserve(active_courts_.size());
        for (const auto &c: active_courts_) ids.push_back(c.id);

        const auto window = generator_.windowFor(venue ? venue->operatingHours : std::nullopt, selection_->date);
        if (window) {
            skeleton_ = generator_.generate(selection_->date, ids, tz_.localNow(), *window);
        } else {
            skeleton_.clear();
            log::info("SchedulerState", "venue '" + selection_->venueId + "' is closed on " +
                                        formatDate(selection_->date));
        }

        /// 5) Bookings of the day; every emission is the full set
        BookingFilter filter;
        filter.date = formatDate(selection_->date);
        filter.venueId = selection_->venueId;

        log::info("SchedulerState", "subscribing to bookings of " + filter.date + " @ " + filter.venueId);

        Subscription sub = bookings_.subscribe(
            filter,
            [this, gen](const std::vector<Booking> &bookings) { onBookings_(gen, bookings); },
            [this, gen](const std::string &what) { onBookingsError_(gen, what); });

        // A synchronous emission may already have triggered a newer recompute
        if (gen == gen_) booking_sub_ = std::move(sub);
    }

    void SchedulerState::onBookings_(std::uint64_t gen, const std::vector<Booking> &bookings) {
        if (!running_ || gen != gen_ || !selection_) return;

        last_bookings_.clear();
        for (const Booking &b: bookings) {
            if (OccupancyMapper::occupies(b, selection_->date)) last_bookings_.push_back(b);
        }

        AvailabilitySnapshot snap = baseSnapshot_();
        snap.activeCourts = active_courts_;
        snap.activeCourtIds.reserve(active_courts_.size());
        for (const auto &c: active_courts_) snap.activeCourtIds.push_back(c.id);
        snap.timeSlots = mapper_.apply(skeleton_, last_bookings_, selection_->date);
        snap.bookings = last_bookings_;
        snap.loading = false;

        publish_(std::move(snap));
    }

    void SchedulerState::onBookingsError_(std::uint64_t gen, const std::string &what) {
        if (!running_ || gen != gen_ || !selection_) return;

        log::error("SchedulerState", "booking subscription failed: " + what);

        /// Keep the last known slot data (stale but present) so views are not blanked
        AvailabilitySnapshot snap = *snapshot();
        if (snap.timeSlots.empty() && !skeleton_.empty()) {
            snap.activeCourts = active_courts_;
            snap.activeCourtIds.clear();
            for (const auto &c: active_courts_) snap.activeCourtIds.push_back(c.id);
            snap.timeSlots = mapper_.apply(skeleton_, last_bookings_, selection_->date);
            snap.bookings = last_bookings_;
        }
        snap.loading = false;
        snap.error = std::string(kDataSourceFailureMessage);
        snap.errorKind = AvailabilityErrorKind::DataSourceFailure;

        publish_(std::move(snap));
    }
} // namespace avail
