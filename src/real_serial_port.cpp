/**
 * @file real_serial_port.cpp
 * @brief Real serial port implementation
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/io/real_serial_port.hpp"
#include <poll.h>
#include <cstdio>

namespace tefmem {

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealSerialPort::RealSerialPort(const std::string& device_path, SerialBaud baud_rate)
        : device_path_(device_path), baud_rate_(baud_rate) {
        open_port();
        try {
            claim_exclusive();
            configure_port();
        } catch (const DeviceException&) {
            close();
            throw;
        }
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    ssize_t RealSerialPort::write(const void* data, std::size_t len) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        // The fd is non-blocking: keep writing until the whole line is queued
        const auto* bytes = static_cast<const std::uint8_t*>(data);
        std::size_t total = 0;
        while (total < len) {
            ssize_t n = ::write(fd_, bytes + total, len - total);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd { fd_, POLLOUT, 0 };
                    if (::poll(&pfd, 1, 100) < 0 && errno != EINTR) {
                        return -1;
                    }
                    continue;
                }
                if (errno == EINTR) {
                    continue;
                }
                return -1;
            }
            total += static_cast<std::size_t>(n);
        }
        return static_cast<ssize_t>(total);
    }

    ssize_t RealSerialPort::read(void* data, std::size_t len, int timeout_ms) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        struct pollfd pfd { fd_, POLLIN, 0 };
        int ready = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
        if (ready < 0) {
            return -1;  // errno set by poll()
        }
        if (ready == 0) {
            errno = EAGAIN;
            return -1;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            errno = EIO;
            return -1;
        }

        return ::read(fd_, data, len);  // Returns -1 on error, errno set by read()
    }

    bool RealSerialPort::flush_buffers() {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return false;
        }
        return ::ioctl(fd_, TCFLSH, TCIOFLUSH) == 0;
    }

    void RealSerialPort::close() {
        if (is_open_ && fd_ >= 0) {
            ::close(fd_);
            std::fprintf(stdout, "[SERIAL] %s closed.\n", device_path_.c_str());
        }
        fd_ = -1;
        is_open_ = false;
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void RealSerialPort::open_port() {
        fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            throw DeviceException(Status::DNOT_FOUND,
                "RealSerialPort::open_port: " + device_path_ + ": " +
                std::string(std::strerror(errno)));
        }
        is_open_ = true;
        std::fprintf(stdout, "[SERIAL] %s opened.\n", device_path_.c_str());
    }

    void RealSerialPort::claim_exclusive() {
        if (::ioctl(fd_, TIOCEXCL) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::claim_exclusive: " + device_path_ + ": " +
                std::string(std::strerror(errno)));
        }
    }

    void RealSerialPort::configure_port() {
        if (!is_open_ || fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN,
                "RealSerialPort::configure_port: port not open");
        }

        int result = ::ioctl(fd_, TCGETS2, &tty_);
        if (result != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCGETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        auto baud = static_cast<speed_t>(baud_rate_);

        tty_.c_cflag = BOTHER    // Use custom baud rate
            | CS8                // 8 data bits, 1 stop bit, no parity
            | CLOCAL             // Ignore modem control lines
            | CREAD;             // Enable receiver
        tty_.c_iflag = IGNPAR;   // Ignore framing and parity errors
        tty_.c_oflag = 0;        // No output processing
        tty_.c_lflag = 0;        // Non-canonical mode, no echo, no signals
        tty_.c_ispeed = baud;
        tty_.c_ospeed = baud;
        tty_.c_cc[VTIME] = 0;    // poll() handles timeouts
        tty_.c_cc[VMIN] = 0;

        result = ::ioctl(fd_, TCSETS2, &tty_);
        if (result != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCSETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        std::fprintf(stdout, "[SERIAL] %s at %u baud, 8N1 raw.\n",
            device_path_.c_str(), static_cast<unsigned>(baud_rate_));
    }

} // namespace tefmem
