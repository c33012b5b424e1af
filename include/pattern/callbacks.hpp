/**
 * @file callbacks.hpp
 * @brief Status and progress callbacks for long-running session operations
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <cstdio>
#include <exception>
#include <functional>
#include <string>

namespace tefmem {

    using StatusCallback = std::function<void(const std::string&)>;
    using ProgressCallback = std::function<void(int value, int maximum)>;

    /**
     * @brief Optional observers passed into session operations
     *
     * Both run synchronously on the caller's thread. An observer that throws is
     * logged to stderr and the operation continues.
     */
    struct Callbacks {
        StatusCallback status;
        ProgressCallback progress;

        void notify_status(const std::string& message) const {
            if (!status) {
                return;
            }
            try {
                status(message);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[CALLBACK] status callback failed: %s\n", e.what());
            } catch (...) {
                std::fprintf(stderr, "[CALLBACK] status callback failed: unknown error\n");
            }
        }

        void notify_progress(int value, int maximum) const {
            if (!progress) {
                return;
            }
            try {
                progress(value, maximum);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[CALLBACK] progress callback failed: %s\n", e.what());
            } catch (...) {
                std::fprintf(stderr, "[CALLBACK] progress callback failed: unknown error\n");
            }
        }
    };

} // namespace tefmem
