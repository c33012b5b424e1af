/**
 * @file serial_port.hpp
 * @brief Abstract interface for serial port I/O operations
 * @version 0.1
 * @date 2026-10-18
 *
 * LineTransport talks to the radio only through this interface, so tests can
 * swap the hardware for a scripted MockSerialPort. Bytes only; newline framing
 * and text decoding happen one layer up.
 */

#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace tefmem {

    /**
     * @brief Byte pipe to the radio's USB serial bridge
     *
     * RealSerialPort drives a tty with termios2 and poll(). MockSerialPort
     * replays scripted replies in tests.
     */
    class ISerialPort {
        public:
            virtual ~ISerialPort() = default;

            /**
             * @brief Queue all of len bytes for transmission
             * @return ssize_t len, or -1 with errno set
             */
            virtual ssize_t write(const void* data, std::size_t len) = 0;

            /**
             * @brief Wait up to timeout_ms for input and read what is there
             * @return ssize_t Bytes read (at most len), or -1 with errno set.
             * errno is EAGAIN when nothing arrived in time.
             */
            virtual ssize_t read(void* data, std::size_t len, int timeout_ms) = 0;

            /**
             * @brief Discard pending input and output bytes
             * @return bool True on success
             */
            virtual bool flush_buffers() = 0;

            virtual bool is_open() const = 0;

            virtual void close() = 0;

            virtual std::string get_device_path() const = 0;

            /**
             * @brief Underlying descriptor, -1 when closed or simulated
             */
            virtual int get_fd() const = 0;
    };

} // namespace tefmem
