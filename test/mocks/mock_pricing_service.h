#pragma once
#include "abstract/PricingService.hpp"
#include <gmock/gmock.h>

namespace avail {

/// @brief GoogleMock test double for IPricingService.
class MockPricingService : public IPricingService {
public:
    /// @brief (court, startIso, endIso, userId) -> price; may be told to Throw().
    MOCK_METHOD(double, calculatePrice,
                (const Court&, const std::string&, const std::string&, const std::string&), (const, override));
};

}
