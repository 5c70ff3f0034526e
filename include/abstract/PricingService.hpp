#pragma once

#include <string>

#include "model/BookingTypes.hpp"

namespace avail {
    /**
     * @brief Prices a booking of `court` over [startIso, endIso).
     *
     * May throw for invalid inputs. Callers treat any exception as
     * "not priceable" for that court/duration and never propagate it.
     */
    struct IPricingService {
        virtual ~IPricingService() = default;

        virtual double calculatePrice(const Court &court,
                                      const std::string &startIso,
                                      const std::string &endIso,
                                      const std::string &userId) const = 0;
    };
} // namespace avail
