/**
 * @file error.hpp
 * @brief Status codes for the TEF memory manager, usable as std::error_code.
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace tefmem {

/**
 * @enum Status
 * @brief Enumeration of result codes for radio session operations.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'W' it is a validation or protocol level problem.
 * If starts with 'D' it is a device-related error.
 * If starts with 'CSV' it is a CSV import/export error.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,        /**< No error */
        WNOT_CONNECTED = 1, /**< Operation requires an open session */
        WBAD_CHANNEL = 2,   /**< Channel number out of range */
        WBAD_FREQUENCY = 3, /**< Negative frequency */
        WCHANNEL1_SKIP = 4, /**< Channel 1 combined with a skip frequency */
        WBAD_BANDWIDTH = 5, /**< Negative bandwidth code */
        WBAD_MONO_STEREO = 6, /**< Mono/stereo code not 0 or 1 */
        WBAD_RESPONSE = 7,  /**< Reply line has an unexpected shape */
        WNO_RESPONSE = 8,   /**< Device never answered */
        DNOT_FOUND = 10,    /**< Device not found */
        DNOT_OPEN = 11,     /**< Device not open */
        DREAD_ERROR = 12,   /**< Device read error */
        DWRITE_ERROR = 13,  /**< Device write error */
        DCONFIG_ERROR = 14, /**< Device configuration error */
        DREJECTED = 15,     /**< Device replied with failure bits */
        CSV_EMPTY = 16,     /**< CSV file has no header */
        CSV_BAD_HEADER = 17, /**< CSV header does not match */
        CSV_IO_ERROR = 18,  /**< CSV file could not be read or written */
        CSV_NO_DATA = 19,   /**< No configuration available to export or diff */
        UNKNOWN = 255       /**< Unknown error */
    };

/**
 * @class TefMemErrorCategory
 * @brief Custom error category for TEF memory manager status codes.
 */
    class TefMemErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "tefmem::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::WNOT_CONNECTED:
                    return "Not connected";
                case Status::WBAD_CHANNEL:
                    return "Bad channel number";
                case Status::WBAD_FREQUENCY:
                    return "Bad frequency";
                case Status::WCHANNEL1_SKIP:
                    return "Channel 1 cannot be skipped";
                case Status::WBAD_BANDWIDTH:
                    return "Bad bandwidth code";
                case Status::WBAD_MONO_STEREO:
                    return "Bad mono/stereo code";
                case Status::WBAD_RESPONSE:
                    return "Bad response";
                case Status::WNO_RESPONSE:
                    return "No response";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::DREJECTED:
                    return "Device rejected command";
                case Status::CSV_EMPTY:
                    return "CSV file is empty";
                case Status::CSV_BAD_HEADER:
                    return "Invalid CSV header";
                case Status::CSV_IO_ERROR:
                    return "CSV file error";
                case Status::CSV_NO_DATA:
                    return "No channel data";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &tefmem_category() {
        static TefMemErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), tefmem_category()};
    }

} // namespace tefmem

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<tefmem::Status> : true_type {};
} // namespace std
