/**
 * @file skip_state.hpp
 * @brief The single rule deciding whether a channel is "skipped"
 * @version 0.1
 * @date 2026-10-18
 *
 * Display formatting, CSV export, write validation and import diffing all call
 * into these functions instead of comparing frequencies themselves.
 */

#pragma once

#include "radio_configuration.hpp"

namespace tefmem {

    /**
     * @brief Whether a channel is in the skipped state on the radio
     *
     * False without a configuration or a record. Otherwise compares the record's
     * frequency with the configured skip value, or with 0 when the radio never
     * reported one.
     *
     * @param config Current configuration, may be null
     * @param record Channel to test, may be null
     */
    bool is_skipped(const RadioConfiguration* config, const ChannelRecord* record);

    /**
     * @brief Look the channel up in config and test it
     */
    bool is_skipped(const RadioConfiguration* config, int channel);

    /**
     * @brief Whether a frequency denotes "skip" when written
     *
     * Both 0 and the configured skip value are accepted by the radio as a skip
     * request, so both count here.
     */
    bool is_skip_frequency(const RadioConfiguration* config, int freq_khz);

    /**
     * @brief Frequency to send when marking a slot skipped
     */
    int skip_frequency_for(const RadioConfiguration* config);

    /**
     * @brief Canonical record written by skip_channel(): skip freq, bw 0, stereo, no PI/PS
     */
    ChannelRecord make_skip_record(const RadioConfiguration* config, int channel);

} // namespace tefmem
