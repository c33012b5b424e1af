/**
 * @file radio_session.hpp
 * @brief Caller-owned session with one TEF radio
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../csv/channel_csv.hpp"
#include "../model/radio_configuration.hpp"
#include "../protocol/channel_writer.hpp"
#include "../protocol/configuration_reader.hpp"
#include "../template/result.hpp"
#include "callbacks.hpp"
#include "line_transport.hpp"
#include "session_config.hpp"

namespace tefmem {

    enum class ConnectionState {
        DISCONNECTED,
        CONNECTED,
        FAILED  ///< A configuration read failed while connected; connect() again
    };

    inline const char* to_string(ConnectionState state) {
        switch (state) {
        case ConnectionState::DISCONNECTED:
            return "Disconnected";
        case ConnectionState::CONNECTED:
            return "Connected";
        case ConnectionState::FAILED:
            return "Failed";
        default:
            return "Unknown";
        }
    }

    /**
     * @brief Outcome of execute_write_list() or skip_all()
     */
    struct BatchReport {
        int successes = 0;
        int failures = 0;
        int already_skipped = 0;
        bool changes_made = false;  ///< At least one write command was attempted
        bool cancelled = false;     ///< Stopped early; unattempted items are in failures
        std::optional<std::string> error;  ///< Batch could not start at all
        std::vector<std::string> failure_messages;  ///< "Ch N: ..." per failed item

        int total() const { return successes + failures + already_skipped; }
    };

    /**
     * @brief Collaborator API for reading and programming memory channels
     *
     * The session exclusively owns its transport and the last configuration read.
     * All calls block, with explicit timeouts from SessionConfig, and report to
     * optional callbacks synchronously. Only the constructor throws (on an invalid
     * SessionConfig); failures come back as Result, WriteOutcome, ImportPlan or
     * BatchReport values.
     *
     * @code
     * RadioSession session(SessionConfig::load("tef_memory.json"));
     * if (session.connect() && session.read_configuration()) {
     *     auto outcome = session.write_channel(2, 98300, 0, 1, "D3A2", "RADIO 1");
     * }
     * @endcode
     *
     * @note request_stop() may be called from another thread (e.g. a signal
     * handler's flag watcher) to end a running batch.
     */
    class RadioSession {
        public:
            explicit RadioSession(SessionConfig config = SessionConfig::create_default(),
                PortOpener opener = real_port_opener());

            ~RadioSession();

            RadioSession(const RadioSession&) = delete;
            RadioSession& operator=(const RadioSession&) = delete;

            // === Connection ===

            /**
             * @brief Open the configured port and wait for the radio to boot
             *
             * Drops any cached configuration. Connecting while connected is a no-op.
             *
             * @return Result<ConnectionState> CONNECTED, or DNOT_FOUND / DCONFIG_ERROR
             */
            Result<ConnectionState> connect(const Callbacks& callbacks = {});

            /**
             * @brief Connect to another device, baud rate or timeout
             */
            Result<ConnectionState> connect(const std::string& device, SerialBaud baud,
                std::uint32_t read_timeout_ms, const Callbacks& callbacks = {});

            void disconnect(const Callbacks& callbacks = {});

            ConnectionState state() const { return state_; }

            bool is_connected() const {
                return state_ == ConnectionState::CONNECTED && transport_ && transport_->is_open();
            }

            const SessionConfig& config() const { return config_; }

            // === Configuration ===

            /**
             * @brief Run the `s` dump and cache the result
             *
             * The cached configuration is dropped first. A hard failure leaves it
             * absent and moves the session to FAILED. A partial read is cached and
             * flagged in the report.
             */
            Result<ConfigurationReadReport> read_configuration(const Callbacks& callbacks = {});

            /**
             * @brief Last configuration read, nullptr when there is none
             */
            const RadioConfiguration* configuration() const {
                return configuration_ ? &*configuration_ : nullptr;
            }

            // === Channel writes ===

            WriteOutcome write_channel(const ChannelRecord& record, const Callbacks& callbacks = {});

            WriteOutcome write_channel(int channel, int freq_khz, int bandwidth_code,
                int mono_stereo_code, const std::string& pi = "", const std::string& ps = "",
                const Callbacks& callbacks = {});

            /**
             * @brief Mark a channel unused by writing the radio's skip frequency
             *
             * Channel 1 is rejected without I/O.
             */
            WriteOutcome skip_channel(int channel, const Callbacks& callbacks = {});

            /**
             * @brief Skip state from the cached configuration
             * @param record Channel data to test instead of looking the channel up
             */
            bool is_channel_skipped(int channel, const ChannelRecord* record = nullptr) const;

            // === CSV ===

            /**
             * @brief Export the cached configuration
             * @return Result<std::size_t> Rows written, CSV_NO_DATA without a configuration
             */
            Result<std::size_t> export_csv(const std::string& path) const;

            /**
             * @brief Parse an import file and diff it against the cached configuration
             */
            ImportPlan plan_import(const std::string& path) const;

            // === Batches ===

            /**
             * @brief Write records in channel order with pacing between writes
             */
            BatchReport execute_write_list(std::vector<ChannelRecord> records,
                const Callbacks& callbacks = {});

            /**
             * @brief Skip every channel from 2 to memory_positions that is not skipped yet
             */
            BatchReport skip_all(const Callbacks& callbacks = {});

            /**
             * @brief Ask a running batch to stop before its next item
             */
            void request_stop() { stop_requested_.store(true); }

            bool stop_requested() const { return stop_requested_.load(); }

        private:
            // === Configuration ===
            SessionConfig config_;
            PortOpener opener_;

            // === State ===
            std::unique_ptr<LineTransport> transport_;
            std::optional<RadioConfiguration> configuration_;
            ConnectionState state_ = ConnectionState::DISCONNECTED;
            std::atomic<bool> stop_requested_{false};

            /**
             * @brief true while a batch may continue with its next item
             */
            bool batch_may_continue() const {
                return is_connected() && !stop_requested_.load();
            }

            void pace(std::uint32_t delay_ms) const;

            void enter_failed_state(const std::string& reason, const Callbacks& callbacks);
    };

} // namespace tefmem
