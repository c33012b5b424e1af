/**
 * @file real_serial_port.hpp
 * @brief Real serial port implementation using termios2/ioctl
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include "serial_port.hpp"
#include "../enums/protocol.hpp"
#include "../exception/tefmem_exception.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <asm/termbits.h>
#include <cstring>
#include <cerrno>

namespace tefmem {

    /**
     * @brief tty device opened raw 8N1, no flow control, exclusive
     *
     * The ESP32 resets when the port opens (DTR toggles), so the caller is
     * expected to wait for the boot banner before talking to it. TIOCEXCL keeps
     * a second session from opening the same radio.
     */
    class RealSerialPort : public ISerialPort {
        private:
            std::string device_path_;
            SerialBaud baud_rate_;
            int fd_ = -1;
            struct termios2 tty_ {};
            bool is_open_ = false;

        public:
            /**
             * @throws DeviceException DNOT_FOUND when the device cannot be opened,
             * DCONFIG_ERROR when it rejects the line settings
             */
            RealSerialPort(const std::string& device_path, SerialBaud baud_rate);

            ~RealSerialPort() override;

            RealSerialPort(const RealSerialPort&) = delete;
            RealSerialPort& operator=(const RealSerialPort&) = delete;

            ssize_t write(const void* data, std::size_t len) override;
            ssize_t read(void* data, std::size_t len, int timeout_ms) override;
            bool flush_buffers() override;
            bool is_open() const override { return is_open_; }
            void close() override;
            std::string get_device_path() const override { return device_path_; }
            int get_fd() const override { return fd_; }

        private:
            void open_port();
            void claim_exclusive();
            void configure_port();
    };

} // namespace tefmem
