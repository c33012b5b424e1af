/**
 * @file configuration_reader.hpp
 * @brief Parse the radio's `s` configuration dump
 * @version 0.1
 * @date 2026-10-18
 *
 * Dump layout, one item per line:
 *   r:<model>  v:<version>  m:<memory positions>  s:<skip frequency>
 *   o:<fm offset>  a:<am min>,<am max>  f:<fm min>,<fm max>
 *   <ch>,<freq>,<bw>,<ms>,<pi>,<ps>
 * Anything else is boot banner noise or an unexpected line.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../model/radio_configuration.hpp"
#include "../pattern/callbacks.hpp"
#include "../pattern/line_transport.hpp"
#include "../pattern/session_config.hpp"
#include "../template/result.hpp"

namespace tefmem {

    /**
     * @brief Incremental parser for dump lines
     *
     * Lines are fed one at a time. Parse problems never abort: they become
     * warnings, which are also forwarded to the status callback.
     */
    class ConfigDumpParser {
        private:
            const Callbacks& callbacks_;
            RadioConfiguration config_;
            std::vector<std::string> warnings_;
            std::size_t lines_read_ = 0;
            std::optional<int> expected_channels_;

            void warn(const std::string& message);
            void parse_channel_row(const std::string& line);

        public:
            explicit ConfigDumpParser(const Callbacks& callbacks) : callbacks_(callbacks) {}

            void consume(const std::string& line);

            /**
             * @brief true once the declared number of channel rows has arrived
             */
            bool complete() const {
                return expected_channels_.has_value() &&
                       static_cast<int>(config_.channels.size()) >= *expected_channels_;
            }

            std::size_t lines_read() const { return lines_read_; }

            const std::optional<int>& expected_channels() const { return expected_channels_; }

            const RadioConfiguration& configuration() const { return config_; }

            const std::vector<std::string>& warnings() const { return warnings_; }

            RadioConfiguration take_configuration() { return std::move(config_); }

            std::vector<std::string> take_warnings() { return std::move(warnings_); }
    };

    struct ConfigurationReadReport {
        RadioConfiguration configuration;
        std::vector<std::string> warnings;
        bool partial = false;  ///< Timed out before all declared channels arrived
    };

    /**
     * @brief Send `s` and collect the dump
     *
     * The first line gets read_timeout_ms, each following line stream_timeout_ms.
     * After the last declared channel one short drain read (drain_timeout_ms)
     * swallows any trailer.
     *
     * @return Result holding the report, or an error when the command could not be
     * sent (DWRITE_ERROR) or no line arrived at all (WNO_RESPONSE)
     */
    Result<ConfigurationReadReport> read_configuration(LineTransport& transport,
        const SessionConfig& config, const Callbacks& callbacks = {});

} // namespace tefmem
