/**
 * @file line_transport.hpp
 * @brief Newline framed text transport over a serial port
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"
#include "../exception/tefmem_exception.hpp"
#include "../io/serial_port.hpp"
#include "../template/result.hpp"
#include "session_config.hpp"

namespace tefmem {

    /**
     * @brief Creates the serial port for a device path
     *
     * May throw DeviceException. RealSerialPort is used by default; tests inject mocks.
     */
    using PortOpener = std::function<std::unique_ptr<ISerialPort>(const std::string&, SerialBaud)>;

    /**
     * @brief Default PortOpener backed by RealSerialPort
     */
    PortOpener real_port_opener();

    /**
     * @brief Line-oriented transport for the radio's text protocol
     *
     * Owns the serial port exclusively. Every sent line gets a trailing newline and
     * is followed by a settle delay, since the radio needs time to consume it.
     * Received bytes are split on '\n', decoded permissively as UTF-8 and trimmed.
     * Bytes following a newline are kept for the next read_line().
     *
     * Neither send_line() nor read_line() throw: failures are returned and the
     * reason is kept in last_error().
     */
    class LineTransport {

        private:
            // # I/O abstraction
            std::unique_ptr<ISerialPort> serial_port_;

            // # Internal State
            std::string device_;
            SerialBaud baudrate_;
            std::uint32_t read_timeout_ms_;
            std::uint32_t settle_delay_ms_;
            std::vector<std::uint8_t> pending_;  // Bytes received past the last newline
            std::string last_error_;

            std::mutex io_mutex_;

            static constexpr std::size_t READ_CHUNK = 256;
            static constexpr std::size_t MAX_LINE_BYTES = 4096;

            /**
             * @brief Write all bytes to the port
             * @throws DeviceException if port not open or write fails
             * @throws ProtocolException on partial write
             */
            void write_bytes(const std::uint8_t* data, std::size_t size);

            /**
             * @brief Read whatever is available within timeout_ms
             * @return std::size_t Bytes appended to pending_, 0 on timeout
             * @throws DeviceException if port not open or read fails
             */
            std::size_t read_bytes(int timeout_ms);

            /**
             * @brief Pop one complete line from pending_ if there is one
             */
            std::optional<std::string> take_line();

        public:
            /**
             * @brief Constructor with dependency injection
             * @param serial_port Injected serial port (real or mock), must be open
             * @param device Device path for identification
             * @param baudrate Serial baud rate (for logging/reference)
             * @param config Timeout and settle delay source
             * @throws DeviceException if serial_port is null or closed
             */
            LineTransport(std::unique_ptr<ISerialPort> serial_port, std::string device,
                SerialBaud baudrate, const SessionConfig& config);

            /**
             * @brief Open the configured device, wait for the radio to boot and flush
             *
             * The radio resets when the port opens and prints a boot banner. The boot
             * delay lets it finish before stale input and output are discarded.
             *
             * @param config Device, baud, boot delay and timeouts
             * @param opener Port factory
             * @return Result holding the ready transport, or DNOT_FOUND / DCONFIG_ERROR
             */
            static Result<std::unique_ptr<LineTransport> > open(const SessionConfig& config,
                const PortOpener& opener = real_port_opener());

            ~LineTransport();

            LineTransport(const LineTransport&) = delete;
            LineTransport& operator=(const LineTransport&) = delete;

            /**
             * @brief Send one command line
             * @param text Line content, a newline is appended when missing
             * @return true if every byte was written
             */
            bool send_line(const std::string& text);

            /**
             * @brief Wait for one newline-terminated line
             * @param timeout_override_ms Timeout for this call, default read timeout otherwise
             * @return std::optional<std::string> Trimmed line, or nullopt on timeout or I/O error
             */
            std::optional<std::string> read_line(std::optional<std::uint32_t> timeout_override_ms =
                std::nullopt);

            /**
             * @brief Discard buffered input on both sides
             * @return true on success
             */
            bool flush();

            void close();

            bool is_open() const {
                return serial_port_ && serial_port_->is_open();
            }

            std::string get_device() const { return device_; }

            SerialBaud get_baudrate() const { return baudrate_; }

            std::uint32_t get_read_timeout_ms() const { return read_timeout_ms_; }

            /**
             * @brief Reason for the most recent failed send or read (empty after a timeout)
             */
            const std::string& last_error() const { return last_error_; }

            std::string to_string() const {
                std::ostringstream oss;
                oss << "LineTransport(";
                oss << "Device: " << device_ << ", ";
                oss << "Baudrate: " << static_cast<std::uint32_t>(baudrate_) << ", ";
                oss << "FD: " << (serial_port_ ? serial_port_->get_fd() : -1) << ", ";
                oss << "Open: " << (is_open() ? "Yes" : "No");
                oss << ")";
                return oss.str();
            }
    };

} // namespace tefmem
