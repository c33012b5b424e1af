/**
 * @file session_config.cpp
 * @brief Session configuration implementation
 * @version 0.1
 * @date 2026-10-18
 */

#include <array>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "../include/pattern/session_config.hpp"

using json = nlohmann::json;

namespace tefmem {

    namespace {

        // JSON member name -> environment variable name
        const std::array<std::pair<const char*, const char*>, 9> CONFIG_KEYS = {{
            {"device_path", "TEFMEM_DEVICE"},
            {"baud_rate", "TEFMEM_BAUD"},
            {"read_timeout_ms", "TEFMEM_READ_TIMEOUT"},
            {"stream_timeout_ms", "TEFMEM_STREAM_TIMEOUT"},
            {"drain_timeout_ms", "TEFMEM_DRAIN_TIMEOUT"},
            {"boot_delay_ms", "TEFMEM_BOOT_DELAY"},
            {"settle_delay_ms", "TEFMEM_SETTLE_DELAY"},
            {"write_pacing_ms", "TEFMEM_WRITE_PACING"},
            {"check_pacing_ms", "TEFMEM_CHECK_PACING"}
        }};

        std::uint32_t parse_ms(const std::string& key, const std::string& value) {
            try {
                std::size_t pos = 0;
                unsigned long ms = std::stoul(value, &pos);
                if (pos != value.size() || value.find('-') != std::string::npos) {
                    throw std::invalid_argument(value);
                }
                return static_cast<std::uint32_t>(ms);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid value for " + key + ": " + value);
            }
        }

    } // namespace

    // === Configuration Validation ===

    void SessionConfig::validate() const {
        if (device_path.empty()) {
            throw std::invalid_argument("Serial device path cannot be empty");
        }

        if (read_timeout_ms == 0) {
            throw std::invalid_argument("Read timeout must be > 0");
        }
        if (stream_timeout_ms == 0) {
            throw std::invalid_argument("Stream timeout must be > 0");
        }
        if (read_timeout_ms > 60000 || stream_timeout_ms > 60000 || drain_timeout_ms > 60000) {
            throw std::invalid_argument("Timeout too large (max 60000ms)");
        }
        if (boot_delay_ms > 30000) {
            throw std::invalid_argument("Boot delay too large (max 30000ms)");
        }
        if (settle_delay_ms > 5000 || write_pacing_ms > 5000 || check_pacing_ms > 5000) {
            throw std::invalid_argument("Pacing delay too large (max 5000ms)");
        }
    }

    // === Factory Methods ===

    SessionConfig SessionConfig::create_default() {
        return SessionConfig{};
    }

    // === JSON Parsing ===

    SessionConfig SessionConfig::from_json(const json& j) {
        SessionConfig config = create_default();

        // Convert JSON fields to TEFMEM_* form to reuse the env parsing logic
        std::map<std::string, std::string> config_map;

        if (j.contains("session_config")) {
            const auto& sc = j["session_config"];
            try {
                for (const auto& [json_key, env_key] : CONFIG_KEYS) {
                    if (!sc.contains(json_key)) {
                        continue;
                    }
                    const auto& val = sc[json_key];
                    config_map[env_key] = val.is_string() ? val.get<std::string>()
                                                          : std::to_string(val.get<long long>());
                }
            } catch (const json::exception& e) {
                throw std::invalid_argument(std::string("Malformed session_config: ") + e.what());
            }
        }

        apply_config_map(config, config_map);
        return config;
    }

    json SessionConfig::to_json() const {
        return json{
            {"session_config", {
                {"device_path", device_path},
                {"baud_rate", static_cast<std::uint32_t>(baud_rate)},
                {"read_timeout_ms", read_timeout_ms},
                {"stream_timeout_ms", stream_timeout_ms},
                {"drain_timeout_ms", drain_timeout_ms},
                {"boot_delay_ms", boot_delay_ms},
                {"settle_delay_ms", settle_delay_ms},
                {"write_pacing_ms", write_pacing_ms},
                {"check_pacing_ms", check_pacing_ms}
            }}
        };
    }

    // === Configuration Application ===

    void SessionConfig::apply_config_map(SessionConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("TEFMEM_DEVICE")) {
            config.device_path = *val;
        }

        if (auto val = get_val("TEFMEM_BAUD")) {
            bool use_default = false;
            config.baud_rate = serialbaud_from_int(
                static_cast<int>(parse_ms("TEFMEM_BAUD", *val)), use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid serial baud rate: " + *val);
            }
        }

        if (auto val = get_val("TEFMEM_READ_TIMEOUT")) {
            config.read_timeout_ms = parse_ms("TEFMEM_READ_TIMEOUT", *val);
        }
        if (auto val = get_val("TEFMEM_STREAM_TIMEOUT")) {
            config.stream_timeout_ms = parse_ms("TEFMEM_STREAM_TIMEOUT", *val);
        }
        if (auto val = get_val("TEFMEM_DRAIN_TIMEOUT")) {
            config.drain_timeout_ms = parse_ms("TEFMEM_DRAIN_TIMEOUT", *val);
        }
        if (auto val = get_val("TEFMEM_BOOT_DELAY")) {
            config.boot_delay_ms = parse_ms("TEFMEM_BOOT_DELAY", *val);
        }
        if (auto val = get_val("TEFMEM_SETTLE_DELAY")) {
            config.settle_delay_ms = parse_ms("TEFMEM_SETTLE_DELAY", *val);
        }
        if (auto val = get_val("TEFMEM_WRITE_PACING")) {
            config.write_pacing_ms = parse_ms("TEFMEM_WRITE_PACING", *val);
        }
        if (auto val = get_val("TEFMEM_CHECK_PACING")) {
            config.check_pacing_ms = parse_ms("TEFMEM_CHECK_PACING", *val);
        }
    }

    // === Load Methods ===

    SessionConfig SessionConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    SessionConfig SessionConfig::load(const std::optional<std::string>& config_file_path) {
        SessionConfig config = create_default();

        // A missing optional file just means defaults
        if (config_file_path.has_value()) {
            std::ifstream probe(*config_file_path);
            if (probe.is_open()) {
                config = from_file(*config_file_path);
            }
        }

        // Environment variables have the highest priority
        std::map<std::string, std::string> env_vars;
        for (const auto& key : CONFIG_KEYS) {
            if (const char* val = std::getenv(key.second)) {
                env_vars[key.second] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace tefmem
