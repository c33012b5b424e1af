/**
 * @file channel_display.hpp
 * @brief Human-readable rendering of memory channels
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <string>

#include "radio_configuration.hpp"

namespace tefmem {

    /**
     * @brief Display strings for one channel row
     */
    struct ChannelDisplay {
        int channel = 0;
        std::string frequency_mhz;  ///< "%.3f", "0.000" when skipped
        std::string bandwidth;      ///< Table label, or "Code N" fallback
        std::string mode;           ///< "Mono", "Stereo" or "N/A"
        std::string pi;
        std::string ps;
        bool skipped = false;

        std::string status() const { return skipped ? "SKIP" : "OK"; }
    };

    /**
     * @brief Bandwidth label for a code in a band
     *
     * FM and AM use separate tables. Unknown codes render as "FM Code N" or
     * "AM Code N", and any code in Band::UNKNOWN renders as "Code N".
     */
    std::string describe_bandwidth(Band band, int bandwidth_code);

    /**
     * @brief Render a channel against the configuration it came from
     */
    ChannelDisplay describe_channel(const RadioConfiguration& config, const ChannelRecord& record);

} // namespace tefmem
