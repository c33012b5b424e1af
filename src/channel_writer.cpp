/**
 * @file channel_writer.cpp
 * @brief Channel write validation and the `S` command exchange
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/protocol/channel_writer.hpp"
#include "../include/protocol/response_interpreter.hpp"
#include "../include/model/skip_state.hpp"
#include "../include/enums/protocol.hpp"
#include "../include/interface/text_helpers.hpp"

namespace tefmem {

    namespace {

        std::string join(const std::vector<std::string>& parts, const std::string& sep) {
            std::string out;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) out += sep;
                out += parts[i];
            }
            return out;
        }

    } // namespace

    // === Validation ===

    std::optional<WriteOutcome> validate_write(bool connected, const RadioConfiguration* config,
        const ChannelRecord& record, const Callbacks& callbacks) {
        if (!connected) {
            return WriteOutcome::failure(Status::WNOT_CONNECTED, "ERROR: Not connected.");
        }

        const std::optional<int> max_channels = config ? config->memory_positions : std::nullopt;
        if (record.channel < 1 || (max_channels && record.channel > *max_channels)) {
            return WriteOutcome::failure(Status::WBAD_CHANNEL, "Invalid channel number (1-" +
                (max_channels ? std::to_string(*max_channels) : std::string("?")) + ").");
        }

        if (record.freq_khz < 0) {
            return WriteOutcome::failure(Status::WBAD_FREQUENCY,
                "Invalid frequency (must be >= 0 kHz).");
        }

        if (record.channel == 1 && is_skip_frequency(config, record.freq_khz)) {
            return WriteOutcome::failure(Status::WCHANNEL1_SKIP,
                "ERROR: Channel 1 cannot be set to skip.");
        }

        if (record.freq_khz == 0 && config && config->skip_frequency_value &&
            *config->skip_frequency_value != 0) {
            callbacks.notify_status("Info: Sending frequency 0 for skip, but radio uses " +
                std::to_string(*config->skip_frequency_value) + " kHz.");
        }

        if (record.bandwidth_code < 0) {
            return WriteOutcome::failure(Status::WBAD_BANDWIDTH, "Invalid bandwidth code.");
        }

        if (record.mono_stereo_code != static_cast<int>(MonoStereo::MONO) &&
            record.mono_stereo_code != static_cast<int>(MonoStereo::STEREO)) {
            return WriteOutcome::failure(Status::WBAD_MONO_STEREO,
                "Invalid mono/stereo code (must be 0 or 1).");
        }

        return std::nullopt;
    }

    ChannelRecord normalize_write(const ChannelRecord& record, const Callbacks& callbacks) {
        ChannelRecord normalized = record;

        std::string pi = TextHelper::to_upper(record.pi_or_empty());
        if (TextHelper::truncate(pi, MAX_PI_LENGTH)) {
            callbacks.notify_status("Warning: PI code truncated.");
        }
        normalized.pi = pi;

        std::string ps = record.ps_or_empty();
        if (TextHelper::truncate(ps, MAX_PS_LENGTH)) {
            callbacks.notify_status("Warning: PS text truncated.");
        }
        normalized.ps = ps;

        return normalized;
    }

    std::string encode_write_command(const ChannelRecord& record) {
        std::string command(1, WRITE_CHANNEL_PREFIX);
        command += std::to_string(record.channel) + ",";
        command += std::to_string(record.freq_khz) + ",";
        command += std::to_string(record.bandwidth_code) + ",";
        command += std::to_string(record.mono_stereo_code) + ",";
        command += record.pi_or_empty() + ",";
        command += record.ps_or_empty();
        return command;
    }

    // === Exchange ===

    WriteOutcome write_channel(LineTransport* transport, const RadioConfiguration* config,
        const ChannelRecord& record, const Callbacks& callbacks) {
        const bool connected = transport != nullptr && transport->is_open();
        if (auto rejected = validate_write(connected, config, record, callbacks)) {
            return *rejected;
        }

        const std::string command = encode_write_command(normalize_write(record, callbacks));

        callbacks.notify_status("Sending: " + command);
        if (!transport->send_line(command)) {
            return WriteOutcome::failure(Status::DWRITE_ERROR, "Failed to send 'S' command.");
        }

        auto reply = transport->read_line();
        if (!reply) {
            return WriteOutcome::failure(Status::WNO_RESPONSE,
                "No response received after 'S' command.");
        }

        if (reply->rfind(WRITE_RESPONSE_PREFIX, 0) != 0) {
            std::string msg = "Unexpected response format: " + *reply;
            callbacks.notify_status("ERROR: " + msg);
            return WriteOutcome::failure(Status::WBAD_RESPONSE, msg);
        }

        auto code = parse_write_response(*reply);
        if (!code) {
            std::string msg = "Could not parse return code: " + *reply;
            callbacks.notify_status("ERROR: " + msg);
            return WriteOutcome::failure(Status::WBAD_RESPONSE, msg);
        }

        ResponseInterpretation interpretation = interpret_write_response(*code);
        callbacks.notify_status("Write Ch " + std::to_string(record.channel) + " Response: " +
            join(interpretation.messages, ", "));

        WriteOutcome outcome;
        outcome.success = interpretation.success;
        outcome.messages = std::move(interpretation.messages);
        outcome.status = outcome.success ? Status::SUCCESS : Status::DREJECTED;
        return outcome;
    }

} // namespace tefmem
