/**
 * @file line_transport.cpp
 * @brief Line transport implementation
 * @version 0.1
 * @date 2026-10-18
 */

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#include "../include/pattern/line_transport.hpp"
#include "../include/io/real_serial_port.hpp"
#include "../include/interface/text_helpers.hpp"

namespace tefmem {

    PortOpener real_port_opener() {
        return [](const std::string& device, SerialBaud baud) -> std::unique_ptr<ISerialPort> {
                   return std::make_unique<RealSerialPort>(device, baud);
        };
    }

    // ===================================================================
    // Constructor / Factory
    // ===================================================================

    LineTransport::LineTransport(std::unique_ptr<ISerialPort> serial_port, std::string device,
        SerialBaud baudrate, const SessionConfig& config)
        : serial_port_(std::move(serial_port)), device_(std::move(device)), baudrate_(baudrate),
        read_timeout_ms_(config.read_timeout_ms), settle_delay_ms_(config.settle_delay_ms) {

        if (!serial_port_ || !serial_port_->is_open()) {
            throw DeviceException(Status::DNOT_OPEN, "LineTransport: serial port not open");
        }
    }

    Result<std::unique_ptr<LineTransport> > LineTransport::open(const SessionConfig& config,
        const PortOpener& opener) {
        using TransportResult = Result<std::unique_ptr<LineTransport> >;

        std::unique_ptr<LineTransport> transport;
        try {
            auto port = opener(config.device_path, config.baud_rate);
            transport = std::make_unique<LineTransport>(std::move(port), config.device_path,
                config.baud_rate, config);
        } catch (const TefMemException& e) {
            return TransportResult::error(e.status(), e.what());
        } catch (const std::exception& e) {
            return TransportResult::error(Status::DCONFIG_ERROR,
                "open " + config.device_path + ": " + e.what());
        }

        // The radio reboots on open; let the banner pass before flushing it
        std::this_thread::sleep_for(std::chrono::milliseconds(config.boot_delay_ms));

        if (!transport->flush()) {
            std::string reason = transport->last_error();
            transport->close();
            return TransportResult::error(Status::DCONFIG_ERROR, reason);
        }

        std::fprintf(stdout, "[TRANSPORT] Connected to %s at %u baud\n",
            config.device_path.c_str(), static_cast<unsigned>(config.baud_rate));
        return TransportResult::success(std::move(transport));
    }

    LineTransport::~LineTransport() {
        close();
    }

    void LineTransport::close() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (serial_port_ && serial_port_->is_open()) {
            serial_port_->close();
            std::fprintf(stdout, "[TRANSPORT] Closed %s\n", device_.c_str());
        }
        pending_.clear();
    }

    // === Thread-safe I/O operations ===

    void LineTransport::write_bytes(const std::uint8_t* data, std::size_t size) {
        if (!serial_port_ || !serial_port_->is_open()) {
            throw DeviceException(Status::DNOT_OPEN, "write_bytes: port not open");
        }

        ssize_t bytes_written = serial_port_->write(data, size);
        if (bytes_written < 0) {
            throw DeviceException(Status::DWRITE_ERROR,
                "write_bytes: " + std::string(std::strerror(errno)));
        }
        if (static_cast<std::size_t>(bytes_written) != size) {
            throw ProtocolException(Status::DWRITE_ERROR,
                "write_bytes: wrote " + std::to_string(bytes_written) + " of " +
                std::to_string(size) + " bytes");
        }
    }

    std::size_t LineTransport::read_bytes(int timeout_ms) {
        if (!serial_port_ || !serial_port_->is_open()) {
            throw DeviceException(Status::DNOT_OPEN, "read_bytes: port not open");
        }

        std::uint8_t buffer[READ_CHUNK];
        ssize_t bytes_read = serial_port_->read(buffer, sizeof(buffer), timeout_ms);
        if (bytes_read < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 0;
            }
            throw DeviceException(Status::DREAD_ERROR,
                "read_bytes: " + std::string(std::strerror(errno)));
        }

        pending_.insert(pending_.end(), buffer, buffer + bytes_read);
        return static_cast<std::size_t>(bytes_read);
    }

    std::optional<std::string> LineTransport::take_line() {
        auto newline = std::find(pending_.begin(), pending_.end(), static_cast<std::uint8_t>('\n'));
        if (newline == pending_.end()) {
            return std::nullopt;
        }

        std::size_t length = static_cast<std::size_t>(newline - pending_.begin());
        std::string line = TextHelper::decode_permissive(
            boost::span<const std::uint8_t>(pending_.data(), length));
        pending_.erase(pending_.begin(), newline + 1);
        return TextHelper::trim(line);
    }

    // === Line-Level API ===

    bool LineTransport::send_line(const std::string& text) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        last_error_.clear();

        std::string framed = text;
        if (framed.empty() || framed.back() != '\n') {
            framed.push_back('\n');
        }

        try {
            write_bytes(reinterpret_cast<const std::uint8_t*>(framed.data()), framed.size());
        } catch (const TefMemException& e) {
            last_error_ = std::string("Error sending data: ") + e.what();
            std::fprintf(stderr, "[TRANSPORT] %s\n", last_error_.c_str());
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(settle_delay_ms_));
        return true;
    }

    std::optional<std::string> LineTransport::read_line(
        std::optional<std::uint32_t> timeout_override_ms) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        last_error_.clear();

        const auto timeout = std::chrono::milliseconds(timeout_override_ms.value_or(
            read_timeout_ms_));
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            if (auto line = take_line()) {
                return line;
            }

            if (pending_.size() > MAX_LINE_BYTES) {
                last_error_ = "Error reading data: line exceeds " +
                    std::to_string(MAX_LINE_BYTES) + " bytes";
                pending_.clear();
                return std::nullopt;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                // Partial data stays buffered for the next call
                return std::nullopt;
            }

            try {
                read_bytes(static_cast<int>(remaining));
            } catch (const TefMemException& e) {
                last_error_ = std::string("Error reading data: ") + e.what();
                std::fprintf(stderr, "[TRANSPORT] %s\n", last_error_.c_str());
                return std::nullopt;
            }
        }
    }

    bool LineTransport::flush() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        pending_.clear();
        if (!serial_port_ || !serial_port_->is_open()) {
            last_error_ = "flush: port not open";
            return false;
        }
        if (!serial_port_->flush_buffers()) {
            last_error_ = "flush: " + std::string(std::strerror(errno));
            return false;
        }
        return true;
    }

} // namespace tefmem
