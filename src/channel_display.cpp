/**
 * @file channel_display.cpp
 * @brief Channel display formatting
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/model/channel_display.hpp"
#include "../include/model/skip_state.hpp"

#include <iomanip>
#include <sstream>

namespace tefmem {

    std::string describe_bandwidth(Band band, int bandwidth_code) {
        const std::map<int, std::string>* table = nullptr;
        std::string fallback_prefix;
        switch (band) {
        case Band::FM:
            table = &fm_bandwidths();
            fallback_prefix = "FM ";
            break;
        case Band::AM:
            table = &am_bandwidths();
            fallback_prefix = "AM ";
            break;
        default:
            break;
        }

        if (table) {
            auto it = table->find(bandwidth_code);
            if (it != table->end()) {
                return it->second;
            }
        }
        return fallback_prefix + "Code " + std::to_string(bandwidth_code);
    }

    ChannelDisplay describe_channel(const RadioConfiguration& config, const ChannelRecord& record) {
        ChannelDisplay display;
        display.channel = record.channel;
        display.skipped = is_skipped(&config, &record);
        display.pi = record.pi_or_empty();
        display.ps = record.ps_or_empty();

        if (display.skipped) {
            display.frequency_mhz = "0.000";
            // Code 0 is "auto" in both tables, the only label that still means something
            display.bandwidth = record.bandwidth_code == 0 ? fm_bandwidths().at(0)
                                                           : describe_bandwidth(Band::UNKNOWN,
                record.bandwidth_code);
        } else {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << (record.freq_khz / 1000.0);
            display.frequency_mhz = oss.str();
            display.bandwidth = describe_bandwidth(config.classify_band(record.freq_khz),
                record.bandwidth_code);
        }

        switch (record.mono_stereo_code) {
        case static_cast<int>(MonoStereo::MONO):
            display.mode = "Mono";
            break;
        case static_cast<int>(MonoStereo::STEREO):
            display.mode = "Stereo";
            break;
        default:
            display.mode = "N/A";
            break;
        }
        return display;
    }

} // namespace tefmem
