/**
 * @file protocol.hpp
 * @brief Protocol definitions and helper functions for the TEF memory channel protocol.
 * @version 0.1
 * @date 2026-10-18
 *
 * Constants and enum definitions for the line-oriented serial protocol spoken by
 * TEF668x based ESP32 receivers:
 *
 * - `s` requests a full configuration dump (header lines plus one row per channel)
 *
 * - `S<ch>,<freq>,<bw>,<ms>,<PI>,<PS>` stores a channel and is answered with `S:<code>`
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <map>
#include <string>

namespace tefmem {
    // === Command Constants ===

    static constexpr char READ_CONFIG_COMMAND[] = "s";
    static constexpr char WRITE_CHANNEL_PREFIX = 'S';
    static constexpr char WRITE_RESPONSE_PREFIX[] = "S:";

    // === Configuration Dump Line Prefixes ===

    /**
     * @brief Header line types of the `s` dump, keyed by their first character.
     * @note Every header line has the form `<key>:<value>`. Lines without a known
     * prefix are treated as channel rows.
     */
    enum class DumpLine : char {
        MODEL = 'r',
        VERSION = 'v',
        MEMORY_POSITIONS = 'm',
        SKIP_FREQUENCY = 's',
        FM_OFFSET = 'o',
        AM_RANGE = 'a',
        FM_RANGE = 'f'
    };

    /// Number of comma separated fields in a channel row (dump and CSV alike)
    static constexpr std::size_t CHANNEL_FIELD_COUNT = 6;
    /// Lines at the start of a dump that may carry boot banner noise
    static constexpr std::size_t BANNER_LINE_ALLOWANCE = 7;

    static constexpr std::size_t MAX_PI_LENGTH = 4;
    static constexpr std::size_t MAX_PS_LENGTH = 8;

    // === Write Response Bits ===

    /**
     * @brief Bit positions of the status code returned for an `S` command.
     * @note Bit 7 is the only success flag, bits 0..6 each flag one failure.
     */
    enum class ResponseBit : std::uint8_t {
        FREQUENCY_RANGE = 0,
        CHANNEL_RANGE = 1,
        BANDWIDTH_RANGE = 2,
        STEREO_RANGE = 3,
        CHANNEL1_SKIP = 4,
        BAD_PI = 5,
        RESERVED = 6,
        STORED = 7
    };

    static constexpr std::array<const char*, 8> RESPONSE_BIT_MESSAGES = {
        "Frequency out of range",
        "Memory channel out of range",
        "Bandwidth out of range",
        "Mono/auto stereo out of range",
        "Memory channel 1 can't be set to skip",
        "Incorrect PI code",
        "Reserved (X)",
        "All ok, channel stored"
    };

    constexpr std::uint8_t response_mask(ResponseBit bit) {
        return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(bit));
    }

    // === Mono / Stereo ===

    enum class MonoStereo : int {
        MONO = 0,
        STEREO = 1
    };

    // === Bands and Bandwidth Tables ===

    /**
     * @brief Band a frequency falls into, given the ranges the radio reported.
     */
    enum class Band {
        AM,
        FM,
        UNKNOWN
    };

    inline const std::map<int, std::string>& fm_bandwidths() {
        static const std::map<int, std::string> table = {
            {0, "auto"}, {1, "56kHz"}, {2, "64kHz"}, {3, "72kHz"}, {4, "84kHz"},
            {5, "97kHz"}, {6, "114kHz"}, {7, "133kHz"}, {8, "151kHz"}, {9, "168kHz"},
            {10, "184kHz"}, {11, "200kHz"}, {12, "217kHz"}, {13, "236kHz"},
            {14, "254kHz"}, {15, "287kHz"}, {16, "311kHz"}
        };
        return table;
    }

    inline const std::map<int, std::string>& am_bandwidths() {
        static const std::map<int, std::string> table = {
            {1, "3kHz"}, {2, "4kHz"}, {3, "6kHz"}, {4, "8kHz"}
        };
        return table;
    }

    inline std::string to_string(Band band) {
        switch (band) {
        case Band::AM: return "AM";
        case Band::FM: return "FM";
        default:       return "Unknown";
        }
    }

    // === Serial Baud Rates ===

    /**
     * @brief Serial baud rates commonly used with ESP32 USB bridges.
     */
    enum class SerialBaud : std::uint32_t {
        BAUD_9600 = 9600,
        BAUD_19200 = 19200,
        BAUD_38400 = 38400,
        BAUD_57600 = 57600,
        BAUD_115200 = 115200,
        BAUD_230400 = 230400,
        BAUD_460800 = 460800,
        BAUD_921600 = 921600
    };
    static constexpr SerialBaud DEFAULT_SERIAL_BAUD = SerialBaud::BAUD_115200;

    /**
     * @brief Get the SerialBaud enum from an integer value.
     * @param baud The baud rate in bps
     * @param use_default Set to true if the value is not supported
     * @return SerialBaud The corresponding value, or DEFAULT_SERIAL_BAUD
     */
    inline SerialBaud serialbaud_from_int(int baud, bool& use_default) {
        use_default = false;
        switch (baud) {
        case 9600:   return SerialBaud::BAUD_9600;
        case 19200:  return SerialBaud::BAUD_19200;
        case 38400:  return SerialBaud::BAUD_38400;
        case 57600:  return SerialBaud::BAUD_57600;
        case 115200: return SerialBaud::BAUD_115200;
        case 230400: return SerialBaud::BAUD_230400;
        case 460800: return SerialBaud::BAUD_460800;
        case 921600: return SerialBaud::BAUD_921600;
        default:
            use_default = true;
            return DEFAULT_SERIAL_BAUD;
        }
    }

} // namespace tefmem
