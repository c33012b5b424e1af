/**
 * @file channel_writer.hpp
 * @brief Validate, encode and send one memory channel write
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../enums/error.hpp"
#include "../model/radio_configuration.hpp"
#include "../pattern/callbacks.hpp"
#include "../pattern/line_transport.hpp"

namespace tefmem {

    /**
     * @brief Result of a single write attempt
     *
     * messages is never empty: it holds either the validation error, the transport
     * failure, or the decoded reply bits.
     */
    struct WriteOutcome {
        bool success = false;
        std::vector<std::string> messages;
        Status status = Status::UNKNOWN;  ///< SUCCESS, a W* validation code, DREJECTED, ...

        static WriteOutcome failure(Status status, std::string message) {
            WriteOutcome outcome;
            outcome.status = status;
            outcome.messages.push_back(std::move(message));
            return outcome;
        }
    };

    /**
     * @brief Pre-flight checks, in order, without any I/O
     *
     * Once the channel 1 check passes, a frequency of 0 sent to a radio with a
     * non-zero skip value is announced on the status callback.
     *
     * @param connected Whether the session has an open transport
     * @param config Last configuration read, nullptr when unknown
     * @return std::optional<WriteOutcome> The failure, or nullopt when the write may proceed
     */
    std::optional<WriteOutcome> validate_write(bool connected, const RadioConfiguration* config,
        const ChannelRecord& record, const Callbacks& callbacks = {});

    /**
     * @brief Upper-case and truncate PI, truncate PS
     *
     * Each truncation is reported as a status warning.
     */
    ChannelRecord normalize_write(const ChannelRecord& record, const Callbacks& callbacks = {});

    /**
     * @brief Encode `S<ch>,<freq>,<bw>,<ms>,<PI>,<PS>`
     *
     * Absent PI or PS are sent as empty fields.
     */
    std::string encode_write_command(const ChannelRecord& record);

    /**
     * @brief Validate, send and interpret one write
     *
     * @param transport Open transport, or nullptr when disconnected
     * @param config Last configuration read, used for the channel range and skip value
     */
    WriteOutcome write_channel(LineTransport* transport, const RadioConfiguration* config,
        const ChannelRecord& record, const Callbacks& callbacks = {});

} // namespace tefmem
