/**
 * @file session_config.hpp
 * @brief Configuration structure for a radio session
 * @version 0.1
 * @date 2026-10-18
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (e.g. tef_memory.json)
 * 2. Environment variables (TEFMEM_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"

namespace tefmem {

    /**
     * @brief Connection, timeout and pacing settings for RadioSession
     *
     * Environment Variables:
     *
     * - TEFMEM_DEVICE: Serial device path (default: "/dev/ttyUSB0")
     *
     * - TEFMEM_BAUD: Serial baud rate in bps (default: 115200)
     *
     * - TEFMEM_READ_TIMEOUT: Default line timeout in ms, also used for the first dump line (default: 2000)
     *
     * - TEFMEM_STREAM_TIMEOUT: Timeout for dump lines after the first, in ms (default: 500)
     *
     * - TEFMEM_DRAIN_TIMEOUT: Final drain read after a complete dump, in ms (default: 200)
     *
     * - TEFMEM_BOOT_DELAY: Wait after opening the port before flushing, in ms (default: 2000)
     *
     * - TEFMEM_SETTLE_DELAY: Wait after every line sent, in ms (default: 100)
     *
     * - TEFMEM_WRITE_PACING: Batch delay after a write command, in ms (default: 150)
     *
     * - TEFMEM_CHECK_PACING: Batch delay after a status-only check, in ms (default: 10)
     */
    struct SessionConfig {
        // === Port ===
        std::string device_path = "/dev/ttyUSB0";
        SerialBaud baud_rate = DEFAULT_SERIAL_BAUD;

        // === Timeouts (milliseconds) ===
        std::uint32_t read_timeout_ms = 2000;
        std::uint32_t stream_timeout_ms = 500;
        std::uint32_t drain_timeout_ms = 200;

        // === Delays (milliseconds) ===
        std::uint32_t boot_delay_ms = 2000;
        std::uint32_t settle_delay_ms = 100;
        std::uint32_t write_pacing_ms = 150;
        std::uint32_t check_pacing_ms = 10;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        static SessionConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file
         * @return SessionConfig loaded from JSON file
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static SessionConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing a "session_config" member
         * @throws std::invalid_argument if a value is malformed
         */
        static SessionConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         */
        static SessionConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        nlohmann::json to_json() const;

        private:
            static void apply_config_map(SessionConfig& config,
                const std::map<std::string, std::string>& vars);
    };

} // namespace tefmem
