/**
 * @file tefmem_exception.hpp
 * @brief Exception hierarchy for the TEF memory manager library
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace tefmem {

    /**
     * @class TefMemException
     * @brief Base exception class for all TEF memory manager errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class TefMemException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            TefMemException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                TefMemErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ValidationException
     * @brief Caller input rejected before any I/O (WBAD_CHANNEL .. WBAD_MONO_STEREO)
     */
    class ValidationException : public TefMemException {
        public:
            using TefMemException::TefMemException;
    };

    /**
     * @class ProtocolException
     * @brief Reply from the radio did not follow the line protocol
     */
    class ProtocolException : public TefMemException {
        public:
            using TefMemException::TefMemException;
    };

    /**
     * @class DeviceException
     * @brief Serial device I/O, configuration and rejection errors (D* codes)
     */
    class DeviceException : public TefMemException {
        public:
            using TefMemException::TefMemException;
    };

    /**
     * @class TimeoutException
     * @brief No reply within the allowed time (WNO_RESPONSE)
     */
    class TimeoutException : public TefMemException {
        public:
            using TefMemException::TefMemException;
    };

    /**
     * @class CsvException
     * @brief CSV import/export failures (CSV_* codes)
     */
    class CsvException : public TefMemException {
        public:
            using TefMemException::TefMemException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::WNOT_CONNECTED:
        case Status::WBAD_CHANNEL:
        case Status::WBAD_FREQUENCY:
        case Status::WCHANNEL1_SKIP:
        case Status::WBAD_BANDWIDTH:
        case Status::WBAD_MONO_STEREO:
            throw ValidationException(status, context);

        case Status::WBAD_RESPONSE:
            throw ProtocolException(status, context);

        case Status::WNO_RESPONSE:
            throw TimeoutException(status, context);

        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
        case Status::DREJECTED:
            throw DeviceException(status, context);

        case Status::CSV_EMPTY:
        case Status::CSV_BAD_HEADER:
        case Status::CSV_IO_ERROR:
        case Status::CSV_NO_DATA:
            throw CsvException(status, context);

        default:
            throw TefMemException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace tefmem
