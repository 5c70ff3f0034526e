#include "config/EngineConfig.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace avail {
    void EngineConfig::validate() const {
        if (slotMinutes <= 0 || 60 % slotMinutes != 0) {
            throw std::invalid_argument("slotMinutes must divide an hour (got " + std::to_string(slotMinutes) + ")");
        }
        if (openMinute < 0 || closeMinute > 24 * 60 || openMinute >= closeMinute) {
            throw std::invalid_argument("opening window must satisfy 0 <= open < close <= 1440");
        }
        if (openMinute % slotMinutes != 0 || closeMinute % slotMinutes != 0) {
            throw std::invalid_argument("opening window must be aligned to slotMinutes");
        }
        if (graceMinutes < 0) {
            throw std::invalid_argument("graceMinutes must be >= 0");
        }
        if (maxDurationMinutes < slotMinutes) {
            throw std::invalid_argument("maxDurationMinutes must be >= slotMinutes");
        }
    }

    EngineConfig engineConfigFromJson(const json &j, EngineConfig base) {
        if (!j.is_object()) throw std::invalid_argument("engine config must be a JSON object");

        base.openMinute = j.value("openMinute", base.openMinute);
        base.closeMinute = j.value("closeMinute", base.closeMinute);
        base.slotMinutes = j.value("slotMinutes", base.slotMinutes);
        base.graceMinutes = j.value("graceMinutes", base.graceMinutes);
        base.maxDurationMinutes = j.value("maxDurationMinutes", base.maxDurationMinutes);
        base.defaultTimezone = j.value("defaultTimezone", base.defaultTimezone);

        base.validate();
        return base;
    }

    json engineConfigToJson(const EngineConfig &cfg) {
        return json{
            {"openMinute", cfg.openMinute},
            {"closeMinute", cfg.closeMinute},
            {"slotMinutes", cfg.slotMinutes},
            {"graceMinutes", cfg.graceMinutes},
            {"maxDurationMinutes", cfg.maxDurationMinutes},
            {"defaultTimezone", cfg.defaultTimezone}
        };
    }
} // namespace avail
