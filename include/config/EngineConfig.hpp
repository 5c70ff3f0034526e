#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace avail {
    /**
     * @brief Engine tunables.
     *
     * Defaults:
     *  - bookable window 08:00 (inclusive) .. 22:00 (exclusive)
     *  - 30 minute slots, 10 minute grace for "already started" slots
     *  - duration candidates 30 .. 300 minutes in slot steps
     */
    struct EngineConfig {
        int openMinute{8 * 60};
        int closeMinute{22 * 60};
        int slotMinutes{30};
        int graceMinutes{10};
        int maxDurationMinutes{300};
        std::string defaultTimezone{"Europe/Berlin"};

        /// Throws std::invalid_argument if the window/step combination is unusable.
        void validate() const;
    };

    /// Reads the keys present in `j` over `base`; unknown keys are ignored.
    EngineConfig engineConfigFromJson(const nlohmann::json &j, EngineConfig base = {});

    nlohmann::json engineConfigToJson(const EngineConfig &cfg);
} // namespace avail
