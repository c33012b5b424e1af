/**
 * @file radio_configuration.hpp
 * @brief Snapshot of a radio's memory channel configuration
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../enums/protocol.hpp"

namespace tefmem {

    /**
     * @brief One memory slot as reported by the radio or requested by a caller
     */
    struct ChannelRecord {
        int channel = 0;                ///< 1-based slot number
        int freq_khz = 0;               ///< 0 or the skip value marks an unused slot
        int bandwidth_code = 0;         ///< Meaning depends on band, 0 = auto
        int mono_stereo_code = 1;       ///< 0 = mono, 1 = stereo
        std::optional<std::string> pi;  ///< RDS PI, up to 4 upper-case characters
        std::optional<std::string> ps;  ///< RDS PS, up to 8 characters

        std::string pi_or_empty() const { return pi.value_or(""); }
        std::string ps_or_empty() const { return ps.value_or(""); }

        bool operator==(const ChannelRecord& other) const {
            return channel == other.channel && freq_khz == other.freq_khz &&
                   bandwidth_code == other.bandwidth_code &&
                   mono_stereo_code == other.mono_stereo_code &&
                   pi_or_empty() == other.pi_or_empty() &&
                   ps_or_empty() == other.ps_or_empty();
        }

        bool operator!=(const ChannelRecord& other) const { return !(*this == other); }
    };

    using FrequencyRange = std::pair<int, int>;

    /**
     * @brief Complete result of one `s` dump
     *
     * Channels are kept in arrival order. Use sorted_channels() for display order.
     */
    struct RadioConfiguration {
        std::optional<std::string> model_id;
        std::optional<std::string> version;
        std::optional<int> memory_positions;
        std::optional<int> skip_frequency_value;
        std::optional<int> fm_offset_khz;
        std::optional<FrequencyRange> am_range_khz;
        std::optional<FrequencyRange> fm_range_khz;
        std::vector<ChannelRecord> channels;

        /**
         * @brief Find a channel by number
         * @return const ChannelRecord* First matching record, or nullptr
         */
        const ChannelRecord* find_channel(int channel) const;

        /**
         * @brief Channels ordered by channel number (stable for duplicates)
         */
        std::vector<ChannelRecord> sorted_channels() const;

        /**
         * @brief Skip frequency the radio uses, 0 when it never reported one
         */
        int effective_skip_frequency() const { return skip_frequency_value.value_or(0); }

        /**
         * @brief Band of a frequency against the reported AM/FM ranges (inclusive)
         * @return Band::UNKNOWN when no range contains it or ranges are absent
         */
        Band classify_band(int freq_khz) const;
    };

} // namespace tefmem
