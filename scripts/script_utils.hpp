/**
 * @file script_utils.hpp
 * @brief Shared utilities for the TEF memory manager command line
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include "../include/tefmem.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>

namespace tefmem {

// === Common Utility Functions ===

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt = *std::localtime(&timer);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

/**
 * @brief Callbacks printing status lines and batch progress to stdout
 */
    inline Callbacks console_callbacks() {
        Callbacks callbacks;
        callbacks.status = [](const std::string& message) {
                std::cout << "[" << get_timestamp() << "] " << message << "\n";
            };
        callbacks.progress = [](int value, int max) {
                if (max > 0) {
                    std::cout << "[PROGRESS] " << value << "/" << max << "\n";
                }
            };
        return callbacks;
    }

// === Command-Line Argument Parsing ===

/**
 * @brief Subcommand selected on the command line
 */
    enum class Command {
        PORTS,
        READ,
        WRITE,
        SKIP,
        ERASE_ALL,
        EXPORT,
        IMPORT
    };

/**
 * @brief Program configuration structure
 */
    struct ScriptConfig {
        std::optional<std::string> config_file;
        std::optional<std::string> device;
        std::optional<SerialBaud> baudrate;
        std::optional<std::uint32_t> read_timeout_ms;
        bool assume_yes = false;

        Command command = Command::READ;
        std::vector<std::string> arguments;  ///< Positional arguments after the command
    };

/**
 * @brief Display help message for script usage
 * @param program_name The name of the program (argv[0])
 */
    inline void display_help(const std::string& program_name) {
        std::cout << "Usage: " << program_name << " [OPTIONS] <command> [ARGS]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  ports                          List candidate serial ports\n";
        std::cout << "  read                           Read and print the channel table\n";
        std::cout << "  write <ch> <freq> <bw> <ms> [pi] [ps]\n";
        std::cout << "                                 Program one channel (freq in kHz)\n";
        std::cout << "  skip <ch>                      Mark a channel unused\n";
        std::cout << "  erase-all                      Skip every channel except 1\n";
        std::cout << "  export <file>                  Save the channel table as CSV\n";
        std::cout << "  import <file>                  Write the CSV rows that differ\n\n";
        std::cout << "Options:\n";
        std::cout << "  -d <device>     Serial device path (default: /dev/ttyUSB0)\n";
        std::cout << "  -s <baudrate>   Serial baudrate (default: 115200)\n";
        std::cout <<
            "                  Supported: 9600, 19200, 38400, 57600, 115200, 230400, 460800, 921600\n";
        std::cout << "  -t <ms>         Read timeout in milliseconds (default: 2000)\n";
        std::cout << "  -c <file>       JSON configuration file\n";
        std::cout << "  -y              Do not ask before writing imported or erased channels\n";
        std::cout << "  -h              Display this help message\n";
        std::cout << "\n";
        std::cout << "Settings are taken from TEFMEM_* environment variables, then the JSON file,\n";
        std::cout << "then the defaults. Command-line options override all of them.\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name << " -d /dev/ttyUSB0 read\n";
        std::cout << "  " << program_name << " write 2 98300 0 1 D3A2 \"RADIO 1\"\n";
        std::cout << "  " << program_name << " -y import channels.csv\n";
    }

/**
 * @brief Parse a decimal integer argument
 * @throws std::invalid_argument if the string is not a complete integer
 */
    inline int parse_int_argument(const std::string& value_str, const std::string& what) {
        auto value = TextHelper::parse_int(value_str);
        if (!value) {
            throw std::invalid_argument("Invalid " + what + ": " + value_str);
        }
        return *value;
    }

/**
 * @brief Map a command word to a Command
 * @throws std::invalid_argument for unknown words
 */
    inline Command command_from_string(const std::string& word) {
        if (word == "ports") return Command::PORTS;
        if (word == "read") return Command::READ;
        if (word == "write") return Command::WRITE;
        if (word == "skip") return Command::SKIP;
        if (word == "erase-all") return Command::ERASE_ALL;
        if (word == "export") return Command::EXPORT;
        if (word == "import") return Command::IMPORT;
        throw std::invalid_argument("Unknown command: " + word);
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[]) {
        ScriptConfig config;
        int opt;

        while ((opt = getopt(argc, argv, "hd:s:t:c:y")) != -1) {
            switch (opt) {
            case 'h':
                display_help(argv[0]);
                std::exit(0);

            case 'd':
                config.device = optarg;
                break;

            case 's': {
                bool baud_not_found = false;
                SerialBaud baud = serialbaud_from_int(
                    parse_int_argument(optarg, "serial baudrate"), baud_not_found);
                if (baud_not_found) {
                    std::cerr << "Invalid serial baudrate: " << optarg << "\n";
                    std::cerr << "Supported: 9600, 19200, 38400, 57600, 115200, 230400, "
                        "460800, 921600\n";
                    throw std::invalid_argument("Unsupported serial baudrate: " +
                        std::string(optarg));
                }
                config.baudrate = baud;
                break;
            }

            case 't': {
                int timeout = parse_int_argument(optarg, "read timeout");
                if (timeout <= 0) {
                    std::cerr << "Use positive integer (milliseconds)\n";
                    throw std::invalid_argument("Invalid read timeout: " + std::string(optarg));
                }
                config.read_timeout_ms = static_cast<std::uint32_t>(timeout);
                break;
            }

            case 'c':
                config.config_file = optarg;
                break;

            case 'y':
                config.assume_yes = true;
                break;

            case '?':
                if (optopt == 'd' || optopt == 's' || optopt == 't' || optopt == 'c') {
                    std::cerr << "Option -" << static_cast<char>(optopt) <<
                        " requires an argument.\n";
                } else {
                    std::cerr << "Unknown option: -" << static_cast<char>(optopt) << "\n";
                }
                throw std::invalid_argument("Invalid command-line option");

            default:
                display_help(argv[0]);
                throw std::invalid_argument("Invalid command-line arguments");
            }
        }

        if (optind >= argc) {
            display_help(argv[0]);
            throw std::invalid_argument("Missing command");
        }

        config.command = command_from_string(argv[optind++]);
        for (int i = optind; i < argc; ++i) {
            config.arguments.emplace_back(argv[i]);
        }

        std::size_t required = 0;
        switch (config.command) {
        case Command::WRITE:
            required = 4;
            break;
        case Command::SKIP:
        case Command::EXPORT:
        case Command::IMPORT:
            required = 1;
            break;
        default:
            break;
        }
        if (config.arguments.size() < required) {
            throw std::invalid_argument("Command '" + std::string(argv[optind - 1]) +
                "' needs " + std::to_string(required) + " argument(s)");
        }

        return config;
    }

// === Session Setup ===

/**
 * @brief Merge environment, JSON file and command-line settings
 * @throws std::invalid_argument / std::runtime_error on bad configuration
 */
    inline SessionConfig build_session_config(const ScriptConfig& script) {
        SessionConfig config = SessionConfig::load(script.config_file);
        if (script.device) {
            config.device_path = *script.device;
        }
        if (script.baudrate) {
            config.baud_rate = *script.baudrate;
        }
        if (script.read_timeout_ms) {
            config.read_timeout_ms = *script.read_timeout_ms;
        }
        config.validate();
        return config;
    }

// === Failure Reporting ===

/**
 * @brief Throw the exception matching a failed write
 * @throws ValidationException, TimeoutException, ProtocolException or DeviceException
 */
    inline void require_success(const WriteOutcome& outcome, const std::string& context) {
        if (outcome.success) {
            return;
        }
        std::string detail = context;
        for (const auto& message : outcome.messages) {
            detail += ": " + message;
        }
        throw_error(outcome.status == Status::SUCCESS ? Status::DREJECTED : outcome.status, detail);
    }

/**
 * @brief Unwrap a Result, throwing the exception matching its Status on failure
 */
    template<typename T>
    T require_success(Result<T> result, const std::string& context) {
        if (result.fail()) {
            throw_error(result.error(), context + ": " + result.describe());
        }
        return std::move(result.value());
    }

/**
 * @brief Throw a CsvException when an import plan could not be built
 */
    inline void require_success(const ImportPlan& plan, const std::string& context) {
        if (!plan.ok()) {
            throw_if_error(plan.status == Status::SUCCESS ? Status::CSV_IO_ERROR : plan.status,
                context + ": " + *plan.error);
        }
    }

/**
 * @brief Output tag and process exit code for a failure
 */
    struct FailureKind {
        const char* tag;
        int exit_code;
    };

    inline FailureKind classify_failure(const TefMemException& e) {
        if (dynamic_cast<const ValidationException*>(&e)) return {"INVALID", 2};
        if (dynamic_cast<const TimeoutException*>(&e)) return {"TIMEOUT", 3};
        if (dynamic_cast<const ProtocolException*>(&e)) return {"PROTOCOL", 4};
        if (dynamic_cast<const DeviceException*>(&e)) return {"DEVICE", 5};
        if (dynamic_cast<const CsvException*>(&e)) return {"CSV", 6};
        return {"ERROR", 1};
    }

/**
 * @brief Ask a yes/no question on stdin
 * @return true only for an answer starting with 'y' or 'Y'
 */
    inline bool confirm(const std::string& question) {
        std::cout << question << " [y/N] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        answer = TextHelper::trim(answer);
        return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
    }

} // namespace tefmem
