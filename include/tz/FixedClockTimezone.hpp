#pragma once

#include "abstract/TimezoneProvider.hpp"

namespace avail {
    /// Zone of `zone`, but localNow() is pinned (CLI --now, replays).
    class FixedClockTimezone final : public ITimezoneProvider {
    public:
        FixedClockTimezone(const ITimezoneProvider &zone, LocalDateTime now) : zone_(zone), now_(now) {}

        std::string userTimezone() const override { return zone_.userTimezone(); }

        LocalDateTime localNow() const override { return now_; }

        LocalDateTime toLocal(const boost::posix_time::ptime &utc) const override { return zone_.toLocal(utc); }

        void setNow(LocalDateTime now) { now_ = now; }

    private:
        const ITimezoneProvider &zone_;
        LocalDateTime now_;
    };
} // namespace avail
