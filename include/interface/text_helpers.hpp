/**
 * @file text_helpers.hpp
 * @brief Pure static helpers for the line protocol and CSV text handling
 * @version 0.1
 * @date 2026-10-18
 *
 * - TextHelper::decode_permissive: bytes to UTF-8, invalid sequences replaced
 * - TextHelper::trim / to_upper / split / truncate
 * - TextHelper::parse_int: strict integer parsing with surrounding whitespace allowed
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/core/span.hpp>

namespace tefmem {

    /**
     * @brief Static helper for text decoding and field handling
     *
     * Pure static class with no state.
     */
    class TextHelper {
        public:
            /// U+FFFD REPLACEMENT CHARACTER encoded as UTF-8
            static constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

            /**
             * @brief Decode raw serial bytes as UTF-8, replacing malformed sequences
             *
             * Each byte that does not start a well-formed sequence (overlongs,
             * surrogates and code points above U+10FFFF included) becomes one U+FFFD.
             *
             * @param bytes Received bytes
             * @return std::string Valid UTF-8 text
             */
            static std::string decode_permissive(boost::span<const std::uint8_t> bytes) {
                std::string out;
                out.reserve(bytes.size());
                std::size_t i = 0;
                while (i < bytes.size()) {
                    std::uint8_t b = bytes[i];
                    if (b < 0x80) {
                        out.push_back(static_cast<char>(b));
                        ++i;
                        continue;
                    }

                    std::size_t len = 0;
                    std::uint8_t lo = 0x80;
                    std::uint8_t hi = 0xBF;
                    if (b >= 0xC2 && b <= 0xDF) {
                        len = 2;
                    } else if (b >= 0xE0 && b <= 0xEF) {
                        len = 3;
                        if (b == 0xE0) lo = 0xA0;
                        if (b == 0xED) hi = 0x9F;
                    } else if (b >= 0xF0 && b <= 0xF4) {
                        len = 4;
                        if (b == 0xF0) lo = 0x90;
                        if (b == 0xF4) hi = 0x8F;
                    }

                    bool valid = len != 0 && i + len <= bytes.size();
                    if (valid) {
                        // Only the second byte has a narrowed range
                        if (bytes[i + 1] < lo || bytes[i + 1] > hi) {
                            valid = false;
                        }
                        for (std::size_t k = 2; valid && k < len; ++k) {
                            if (bytes[i + k] < 0x80 || bytes[i + k] > 0xBF) {
                                valid = false;
                            }
                        }
                    }

                    if (valid) {
                        out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
                        i += len;
                    } else {
                        out.append(REPLACEMENT);
                        ++i;
                    }
                }
                return out;
            }

            static std::string trim(const std::string& text) {
                auto not_space = [](unsigned char c) { return !std::isspace(c); };
                auto begin = std::find_if(text.begin(), text.end(), not_space);
                auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
                return begin < end ? std::string(begin, end) : std::string();
            }

            /// ASCII upper-casing; multi-byte UTF-8 sequences pass through unchanged
            static std::string to_upper(std::string text) {
                std::transform(text.begin(), text.end(), text.begin(),
                    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                return text;
            }

            static std::vector<std::string> split(const std::string& text, char sep) {
                std::vector<std::string> parts;
                std::size_t start = 0;
                while (true) {
                    std::size_t pos = text.find(sep, start);
                    if (pos == std::string::npos) {
                        parts.push_back(text.substr(start));
                        break;
                    }
                    parts.push_back(text.substr(start, pos - start));
                    start = pos + 1;
                }
                return parts;
            }

            /**
             * @brief Truncate UTF-8 text to at most max_chars code points
             * @return true if the text was shortened
             */
            static bool truncate(std::string& text, std::size_t max_chars) {
                std::size_t chars = 0;
                for (std::size_t i = 0; i < text.size(); ++i) {
                    // Continuation bytes do not start a new character
                    if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
                        continue;
                    }
                    if (chars == max_chars) {
                        text.resize(i);
                        return true;
                    }
                    ++chars;
                }
                return false;
            }

            /**
             * @brief Parse a base-10 integer, whitespace around it allowed
             * @return std::optional<int> Parsed value, or nullopt if malformed
             */
            static std::optional<int> parse_int(const std::string& text) {
                std::string trimmed = trim(text);
                if (trimmed.empty()) {
                    return std::nullopt;
                }
                try {
                    std::size_t pos = 0;
                    int value = std::stoi(trimmed, &pos, 10);
                    if (pos != trimmed.size()) {
                        return std::nullopt;
                    }
                    return value;
                } catch (const std::invalid_argument&) {
                    return std::nullopt;
                } catch (const std::out_of_range&) {
                    return std::nullopt;
                }
            }
    };

} // namespace tefmem
