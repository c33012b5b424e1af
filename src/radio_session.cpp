/**
 * @file radio_session.cpp
 * @brief Radio session implementation
 * @version 0.1
 * @date 2026-10-18
 */

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "../include/pattern/radio_session.hpp"
#include "../include/model/skip_state.hpp"

namespace tefmem {

    namespace {

        std::string join_messages(const std::vector<std::string>& messages) {
            std::string out;
            for (std::size_t i = 0; i < messages.size(); ++i) {
                if (i > 0) out += "; ";
                out += messages[i];
            }
            return out;
        }

    } // namespace

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RadioSession::RadioSession(SessionConfig config, PortOpener opener)
        : config_(std::move(config)), opener_(std::move(opener)) {
        config_.validate();
    }

    RadioSession::~RadioSession() {
        if (transport_) {
            transport_->close();
        }
    }

    // ===================================================================
    // Connection
    // ===================================================================

    Result<ConnectionState> RadioSession::connect(const Callbacks& callbacks) {
        using ConnectResult = Result<ConnectionState>;

        if (is_connected()) {
            callbacks.notify_status("Already connected.");
            return ConnectResult::success(state_);
        }

        // A failed session may still hold a transport
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
        configuration_.reset();
        stop_requested_.store(false);

        callbacks.notify_status("Attempting to connect to " + config_.device_path + "...");
        callbacks.notify_status("Waiting for device initialization...");

        auto opened = LineTransport::open(config_, opener_);
        if (opened.fail()) {
            state_ = ConnectionState::DISCONNECTED;
            callbacks.notify_status("ERROR connecting to " + config_.device_path + ": " +
                opened.message());
            return ConnectResult::error(opened, "connect");
        }

        transport_ = std::move(opened.value());
        state_ = ConnectionState::CONNECTED;
        callbacks.notify_status("Connected to " + config_.device_path + " at " +
            std::to_string(static_cast<std::uint32_t>(config_.baud_rate)) + " baud.");
        return ConnectResult::success(state_);
    }

    Result<ConnectionState> RadioSession::connect(const std::string& device, SerialBaud baud,
        std::uint32_t read_timeout_ms, const Callbacks& callbacks) {
        SessionConfig updated = config_;
        updated.device_path = device;
        updated.baud_rate = baud;
        updated.read_timeout_ms = read_timeout_ms;
        try {
            updated.validate();
        } catch (const std::invalid_argument& e) {
            callbacks.notify_status(std::string("ERROR: ") + e.what());
            return Result<ConnectionState>::error(Status::DCONFIG_ERROR, e.what());
        }

        if (is_connected() && (device != config_.device_path || baud != config_.baud_rate)) {
            disconnect(callbacks);
        }
        config_ = updated;
        return connect(callbacks);
    }

    void RadioSession::disconnect(const Callbacks& callbacks) {
        if (transport_) {
            transport_->close();
            transport_.reset();
            callbacks.notify_status("Disconnected.");
        }
        configuration_.reset();
        state_ = ConnectionState::DISCONNECTED;
    }

    void RadioSession::enter_failed_state(const std::string& reason, const Callbacks& callbacks) {
        configuration_.reset();
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
        state_ = ConnectionState::FAILED;
        callbacks.notify_status("Connection failed: " + reason + " Reconnect to continue.");
    }

    // ===================================================================
    // Configuration
    // ===================================================================

    Result<ConfigurationReadReport> RadioSession::read_configuration(const Callbacks& callbacks) {
        using ReadResult = Result<ConfigurationReadReport>;

        configuration_.reset();

        if (!is_connected()) {
            callbacks.notify_status("ERROR: Not connected.");
            return ReadResult::error(Status::WNOT_CONNECTED, "read_configuration");
        }

        auto report = tefmem::read_configuration(*transport_, config_, callbacks);
        if (report.fail()) {
            enter_failed_state(report.message(), callbacks);
            return ReadResult::error(report, "read_configuration");
        }

        configuration_ = report.value().configuration;
        return report;
    }

    // ===================================================================
    // Channel writes
    // ===================================================================

    WriteOutcome RadioSession::write_channel(const ChannelRecord& record,
        const Callbacks& callbacks) {
        LineTransport* transport = is_connected() ? transport_.get() : nullptr;
        return tefmem::write_channel(transport, configuration(), record, callbacks);
    }

    WriteOutcome RadioSession::write_channel(int channel, int freq_khz, int bandwidth_code,
        int mono_stereo_code, const std::string& pi, const std::string& ps,
        const Callbacks& callbacks) {
        ChannelRecord record;
        record.channel = channel;
        record.freq_khz = freq_khz;
        record.bandwidth_code = bandwidth_code;
        record.mono_stereo_code = mono_stereo_code;
        record.pi = pi;
        record.ps = ps;
        return write_channel(record, callbacks);
    }

    WriteOutcome RadioSession::skip_channel(int channel, const Callbacks& callbacks) {
        if (channel == 1) {
            return WriteOutcome::failure(Status::WCHANNEL1_SKIP,
                "Error: Channel 1 cannot be skipped.");
        }

        ChannelRecord record = make_skip_record(configuration(), channel);
        callbacks.notify_status("Attempting skip for Ch " + std::to_string(channel) +
            " using freq " + std::to_string(record.freq_khz) + "...");
        return write_channel(record, callbacks);
    }

    bool RadioSession::is_channel_skipped(int channel, const ChannelRecord* record) const {
        const RadioConfiguration* config = configuration();
        if (config == nullptr || config->channels.empty()) {
            return false;
        }
        if (record == nullptr) {
            record = config->find_channel(channel);
        }
        return is_skipped(config, record);
    }

    // ===================================================================
    // CSV
    // ===================================================================

    Result<std::size_t> RadioSession::export_csv(const std::string& path) const {
        const RadioConfiguration* config = configuration();
        if (config == nullptr) {
            return Result<std::size_t>::error(Status::CSV_NO_DATA,
                "No channel data found in configuration.");
        }
        return export_csv_file(path, *config);
    }

    ImportPlan RadioSession::plan_import(const std::string& path) const {
        const RadioConfiguration* config = configuration();
        if (config == nullptr) {
            ImportPlan plan;
            plan.error = "No configuration loaded. Read the radio configuration first.";
            plan.status = Status::CSV_NO_DATA;
            return plan;
        }
        return plan_import_file(path, *config);
    }

    // ===================================================================
    // Batches
    // ===================================================================

    void RadioSession::pace(std::uint32_t delay_ms) const {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    BatchReport RadioSession::execute_write_list(std::vector<ChannelRecord> records,
        const Callbacks& callbacks) {
        BatchReport report;
        if (!is_connected()) {
            report.error = "Radio became unavailable before writing.";
            report.failures = static_cast<int>(records.size());
            return report;
        }

        std::stable_sort(records.begin(), records.end(),
            [](const ChannelRecord& a, const ChannelRecord& b) { return a.channel < b.channel; });

        const int total = static_cast<int>(records.size());
        for (int i = 0; i < total; ++i) {
            if (!batch_may_continue()) {
                report.cancelled = true;
                report.failures += total - i;
                break;
            }

            report.changes_made = true;
            const ChannelRecord& record = records[static_cast<std::size_t>(i)];
            callbacks.notify_status("Import: Writing Ch " + std::to_string(record.channel) + " (" +
                std::to_string(i + 1) + "/" + std::to_string(total) + ")...");

            WriteOutcome outcome = write_channel(record, callbacks);
            if (outcome.success) {
                ++report.successes;
            } else {
                ++report.failures;
                report.failure_messages.push_back("Ch " + std::to_string(record.channel) + ": " +
                    join_messages(outcome.messages));
            }

            callbacks.notify_progress(i + 1, total);
            pace(config_.write_pacing_ms);
        }

        stop_requested_.store(false);
        return report;
    }

    BatchReport RadioSession::skip_all(const Callbacks& callbacks) {
        BatchReport report;
        const RadioConfiguration* config = configuration();
        if (!is_connected() || config == nullptr || !config->memory_positions) {
            report.error = "Radio/Config became unavailable.";
            return report;
        }

        const int max_channel = *config->memory_positions;
        const int total = std::max(0, max_channel - 1);

        for (int channel = 2; channel <= max_channel; ++channel) {
            const int index = channel - 2;
            if (!batch_may_continue()) {
                report.cancelled = true;
                report.failures += total - index;
                break;
            }

            callbacks.notify_progress(index + 1, total);

            if (is_channel_skipped(channel)) {
                ++report.already_skipped;
                pace(config_.check_pacing_ms);
                continue;
            }

            report.changes_made = true;
            WriteOutcome outcome = skip_channel(channel, callbacks);
            if (outcome.success) {
                ++report.successes;
            } else {
                ++report.failures;
                report.failure_messages.push_back("Ch " + std::to_string(channel) + ": " +
                    join_messages(outcome.messages));
            }
            pace(config_.write_pacing_ms);
        }

        stop_requested_.store(false);
        return report;
    }

} // namespace tefmem
