/**
 * @file response_interpreter.hpp
 * @brief Decode the status bitmask returned after an `S` write
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tefmem {

    /**
     * @brief Decoded `S:<code>` reply
     */
    struct ResponseInterpretation {
        int code = 0;
        bool success = false;               ///< Bit 7 set
        std::vector<std::string> messages;  ///< Success first, then failure bits 0..6
    };

    /**
     * @brief Decode a write status code
     *
     * Every set bit is reported, so a caller sees all violations at once.
     * A code with no bits set yields "No status bits set (Code 0)".
     *
     * @param code Integer after the `S:` prefix
     */
    ResponseInterpretation interpret_write_response(int code);

    /**
     * @brief Extract the code from a reply line of the form `S:<code>`
     * @return std::optional<int> nullopt when the prefix is missing or the code
     * is not an integer
     */
    std::optional<int> parse_write_response(const std::string& line);

} // namespace tefmem
