#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace avail {
    using CourtId = std::string;
    using VenueId = std::string;

    /**
     * @brief Booking lifecycle state as stored by the booking store.
     *
     *  - Holding   : temporary hold while the user completes payment ("pending").
     *  - Confirmed : payment successful, booking is active.
     *  - Completed : session finished / checked in.
     *  - Cancelled : payment failed, timed out or cancelled by the user.
     */
    enum class BookingStatus { Holding, Confirmed, Completed, Cancelled, Unknown };

    inline const char *to_string(BookingStatus s) {
        switch (s) {
            case BookingStatus::Holding: return "holding";
            case BookingStatus::Confirmed: return "confirmed";
            case BookingStatus::Completed: return "completed";
            case BookingStatus::Cancelled: return "cancelled";
            default: return "unknown";
        }
    }

    inline BookingStatus parse_booking_status(std::string_view s) {
        if (s == "holding" || s == "pending") return BookingStatus::Holding;
        if (s == "confirmed") return BookingStatus::Confirmed;
        if (s == "completed") return BookingStatus::Completed;
        if (s == "cancelled") return BookingStatus::Cancelled;
        return BookingStatus::Unknown;
    }

    /// Only confirmed and held bookings block a court.
    inline bool is_occupying(BookingStatus s) noexcept {
        return s == BookingStatus::Confirmed || s == BookingStatus::Holding;
    }

    enum class CourtStatus { Active, Maintenance, Inactive };

    inline const char *to_string(CourtStatus s) {
        switch (s) {
            case CourtStatus::Active: return "active";
            case CourtStatus::Maintenance: return "maintenance";
            default: return "inactive";
        }
    }

    inline CourtStatus parse_court_status(std::string_view s) {
        if (s == "active") return CourtStatus::Active;
        if (s == "maintenance") return CourtStatus::Maintenance;
        return CourtStatus::Inactive;
    }

    struct SpecialRate {
        std::string name;
        double rate{0.0};
        std::optional<std::vector<std::string>> applyDays; ///< lowercase weekday names; absent = every day, empty = never
        std::string startTime; ///< "HH:MM", empty = whole day
        std::string endTime; ///< "HH:MM", exclusive
    };

    struct Pricing {
        double baseHourlyRate{30.0};
        std::optional<double> peakHourRate;
        std::optional<double> weekendRate;
        std::optional<double> memberDiscount; ///< percentage
        std::vector<SpecialRate> specialRates;
    };

    struct Court {
        CourtId id;
        VenueId venueId;
        std::string name;
        CourtStatus status{CourtStatus::Active};
        Pricing pricing;
    };

    /**
     * Read-only view of a booking owned by the booking store.
     * startTime / endTime are either "HH:MM" wall-clock times or ISO-8601 instants.
     */
    struct Booking {
        std::string id;
        std::string userId;
        CourtId courtId;
        VenueId venueId;
        std::string date; ///< "YYYY-MM-DD"
        std::string startTime;
        std::string endTime;
        BookingStatus status{BookingStatus::Confirmed};
    };

    struct VenueSettings {
        std::optional<std::string> bookingFlow; ///< raw identifier, resolved by FlowResolver
    };

    /// Opening hours of one weekday as "HH:MM"; close may be "24:00".
    struct DayHours {
        std::string open;
        std::string close;
    };

    /// Indexed by day of week (0 = Sunday); an empty entry means closed that day.
    using WeeklyHours = std::array<std::optional<DayHours>, 7>;

    struct Venue {
        VenueId id;
        std::string name;
        std::optional<VenueSettings> settings;
        std::optional<WeeklyHours> operatingHours; ///< absent = engine default window every day
    };

    /// The user's in-progress booking as held by the booking wizard.
    struct BookingSelection {
        std::string date;
        VenueId venueId;
        CourtId courtId;
        std::string startTime;
        std::string endTime;
        std::string userId;
    };
} // namespace avail
