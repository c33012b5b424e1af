/**
 * @file skip_state.cpp
 * @brief Skip-state resolution
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/model/skip_state.hpp"

namespace tefmem {

    bool is_skipped(const RadioConfiguration* config, const ChannelRecord* record) {
        if (config == nullptr || record == nullptr) {
            return false;
        }
        return record->freq_khz == config->effective_skip_frequency();
    }

    bool is_skipped(const RadioConfiguration* config, int channel) {
        if (config == nullptr) {
            return false;
        }
        return is_skipped(config, config->find_channel(channel));
    }

    bool is_skip_frequency(const RadioConfiguration* config, int freq_khz) {
        if (freq_khz == 0) {
            return true;
        }
        return config != nullptr && config->skip_frequency_value &&
               freq_khz == *config->skip_frequency_value;
    }

    int skip_frequency_for(const RadioConfiguration* config) {
        return config ? config->effective_skip_frequency() : 0;
    }

    ChannelRecord make_skip_record(const RadioConfiguration* config, int channel) {
        ChannelRecord record;
        record.channel = channel;
        record.freq_khz = skip_frequency_for(config);
        record.bandwidth_code = 0;
        record.mono_stereo_code = static_cast<int>(MonoStereo::STEREO);
        record.pi = std::string();
        record.ps = std::string();
        return record;
    }

} // namespace tefmem
