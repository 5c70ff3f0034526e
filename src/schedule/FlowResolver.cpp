#include "schedule/FlowResolver.hpp"
#include "utils/LogUtils.hpp"

#include <string>

namespace avail {
    namespace {
        constexpr BookingFlowSteps kDateCourtTimeDuration{{
            {1, StepLabel::Date},
            {2, StepLabel::Court},
            {3, StepLabel::Time},
            {4, StepLabel::Duration},
            {5, StepLabel::Payment},
        }};

        constexpr BookingFlowSteps kDateTimeDurationCourt{{
            {1, StepLabel::Date},
            {2, StepLabel::Time},
            {3, StepLabel::Duration},
            {4, StepLabel::Court},
            {5, StepLabel::Payment},
        }};

        constexpr BookingFlowSteps kDateTimeCourtDuration{{
            {1, StepLabel::Date},
            {2, StepLabel::Time},
            {3, StepLabel::Court},
            {4, StepLabel::Duration},
            {5, StepLabel::Payment},
        }};
    }

    const char *to_string(BookingFlowType f) {
        switch (f) {
            case BookingFlowType::DateCourtTimeDuration: return "date_court_time_duration";
            case BookingFlowType::DateTimeDurationCourt: return "date_time_duration_court";
            case BookingFlowType::DateTimeCourtDuration: return "date_time_court_duration";
            default: return "unknown";
        }
    }

    const char *to_string(StepLabel s) {
        switch (s) {
            case StepLabel::Date: return "Date";
            case StepLabel::Court: return "Court";
            case StepLabel::Time: return "Time";
            case StepLabel::Duration: return "Duration";
            case StepLabel::Payment: return "Payment";
            default: return "Unknown";
        }
    }

    Parsed<BookingFlowType> parseFlowType(std::string_view id) {
        if (id.empty()) return Parsed<BookingFlowType>::fail(ParseError::Empty);
        if (id == "date_court_time_duration") return Parsed<BookingFlowType>::ok(BookingFlowType::DateCourtTimeDuration);
        if (id == "date_time_duration_court") return Parsed<BookingFlowType>::ok(BookingFlowType::DateTimeDurationCourt);
        if (id == "date_time_court_duration") return Parsed<BookingFlowType>::ok(BookingFlowType::DateTimeCourtDuration);
        return Parsed<BookingFlowType>::fail(ParseError::Malformed);
    }

    const BookingFlowSteps &flowSteps(BookingFlowType f) noexcept {
        switch (f) {
            case BookingFlowType::DateTimeDurationCourt: return kDateTimeDurationCourt;
            case BookingFlowType::DateTimeCourtDuration: return kDateTimeCourtDuration;
            case BookingFlowType::DateCourtTimeDuration:
            default: return kDateCourtTimeDuration;
        }
    }

    std::optional<int> nextStep(BookingFlowType f, StepLabel current) noexcept {
        const auto &steps = flowSteps(f);
        for (std::size_t i = 0; i + 1 < steps.size(); ++i) {
            if (steps[i].label == current) return steps[i + 1].step;
        }
        return std::nullopt;
    }

    BookingFlowType FlowResolver::resolve(const std::optional<VenueSettings> &settings) {
        if (!settings || !settings->bookingFlow) return kDefaultFlow;

        const auto parsed = parseFlowType(*settings->bookingFlow);
        if (!parsed) {
            log::warn("FlowResolver", "unsupported bookingFlow '" + *settings->bookingFlow +
                                      "', using " + std::string(to_string(kDefaultFlow)));
            return kDefaultFlow;
        }
        return *parsed;
    }

    BookingFlowType FlowResolver::resolve(const std::optional<Venue> &venue) {
        if (!venue) return kDefaultFlow;
        return resolve(venue->settings);
    }
} // namespace avail
