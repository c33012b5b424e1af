/**
 * @file radio_configuration.cpp
 * @brief RadioConfiguration lookups
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/model/radio_configuration.hpp"

#include <algorithm>

namespace tefmem {

    const ChannelRecord* RadioConfiguration::find_channel(int channel) const {
        auto it = std::find_if(channels.begin(), channels.end(),
            [channel](const ChannelRecord& rec) { return rec.channel == channel; });
        return it == channels.end() ? nullptr : &*it;
    }

    std::vector<ChannelRecord> RadioConfiguration::sorted_channels() const {
        std::vector<ChannelRecord> sorted = channels;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const ChannelRecord& a, const ChannelRecord& b) { return a.channel < b.channel; });
        return sorted;
    }

    Band RadioConfiguration::classify_band(int freq_khz) const {
        if (am_range_khz && am_range_khz->first <= freq_khz && freq_khz <= am_range_khz->second) {
            return Band::AM;
        }
        if (fm_range_khz && fm_range_khz->first <= freq_khz && freq_khz <= fm_range_khz->second) {
            return Band::FM;
        }
        return Band::UNKNOWN;
    }

} // namespace tefmem
