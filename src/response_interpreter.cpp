/**
 * @file response_interpreter.cpp
 * @brief Write status decoding
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/protocol/response_interpreter.hpp"
#include "../include/enums/protocol.hpp"
#include "../include/interface/text_helpers.hpp"

namespace tefmem {

    namespace {

        // At least 8 binary digits, more when the code does not fit a byte
        std::string to_binary(unsigned int value) {
            std::string bits;
            while (value != 0 || bits.size() < 8) {
                bits.insert(bits.begin(), (value & 1u) ? '1' : '0');
                value >>= 1;
            }
            return bits;
        }

    } // namespace

    ResponseInterpretation interpret_write_response(int code) {
        ResponseInterpretation result;
        result.code = code;
        result.success = (code & response_mask(ResponseBit::STORED)) != 0;

        if (result.success) {
            result.messages.emplace_back(
                RESPONSE_BIT_MESSAGES[static_cast<std::size_t>(ResponseBit::STORED)]);
        }
        for (std::size_t bit = 0; bit < static_cast<std::size_t>(ResponseBit::STORED); ++bit) {
            if (code & (1 << bit)) {
                result.messages.emplace_back(RESPONSE_BIT_MESSAGES[bit]);
            }
        }

        if (result.messages.empty()) {
            if (code == 0) {
                result.messages.emplace_back("No status bits set (Code 0)");
            } else {
                result.messages.push_back("Unknown response code: " + std::to_string(code) +
                    " (Binary: " + to_binary(static_cast<unsigned int>(code)) + ")");
            }
        }
        return result;
    }

    std::optional<int> parse_write_response(const std::string& line) {
        std::string trimmed = TextHelper::trim(line);
        if (trimmed.rfind(WRITE_RESPONSE_PREFIX, 0) != 0) {
            return std::nullopt;
        }
        return TextHelper::parse_int(trimmed.substr(std::char_traits<char>::length(
            WRITE_RESPONSE_PREFIX)));
    }

} // namespace tefmem
