#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "model/BookingTypes.hpp"
#include "utils/TimeUtils.hpp"

namespace avail {
    /// Step orderings of the booking wizard. Adding a flow means adding a variant here.
    enum class BookingFlowType : std::uint8_t {
        DateCourtTimeDuration,
        DateTimeDurationCourt,
        DateTimeCourtDuration
    };

    enum class StepLabel : std::uint8_t { Date, Court, Time, Duration, Payment };

    struct BookingFlowStep {
        int step{0}; ///< 1-based position in the wizard
        StepLabel label{StepLabel::Date};
    };

    using BookingFlowSteps = std::array<BookingFlowStep, 5>;

    constexpr BookingFlowType kDefaultFlow = BookingFlowType::DateCourtTimeDuration;

    /// Wire identifier, e.g. "date_court_time_duration".
    const char *to_string(BookingFlowType f);

    const char *to_string(StepLabel s);

    Parsed<BookingFlowType> parseFlowType(std::string_view id);

    /// Fixed lookup table: flow -> ordered steps.
    const BookingFlowSteps &flowSteps(BookingFlowType f) noexcept;

    /// Step number following `current`, or nothing if `current` is last (or absent).
    std::optional<int> nextStep(BookingFlowType f, StepLabel current) noexcept;

    /**
     * @brief Picks the booking flow of a venue.
     *
     * The venue's settings.bookingFlow wins when it names a supported flow; otherwise the
     * Date -> Court -> Time -> Duration -> Payment ordering is used. A present-but-unknown
     * identifier is logged before the default is substituted.
     */
    class FlowResolver {
    public:
        [[nodiscard]] static BookingFlowType resolve(const std::optional<Venue> &venue);

        [[nodiscard]] static BookingFlowType resolve(const std::optional<VenueSettings> &settings);
    };
} // namespace avail
