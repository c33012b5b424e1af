/**
 * @file tef_memory_manager.cpp
 * @brief Command-line front end for reading and programming TEF radio memory channels
 * @version 0.1
 * @date 2026-10-18
 */
#include "script_utils.hpp"

using namespace tefmem;

namespace {

    // Global session pointer for signal handler
    RadioSession* g_session = nullptr;

    void signal_handler(int signal) {
        if (signal == SIGINT && g_session != nullptr) {
            g_session->request_stop();
        }
    }

    /**
     * @brief Routes SIGINT to the session for its lifetime
     */
    struct StopOnSigint {
        explicit StopOnSigint(RadioSession& session) {
            g_session = &session;
            std::signal(SIGINT, signal_handler);
        }
        ~StopOnSigint() {
            std::signal(SIGINT, SIG_DFL);
            g_session = nullptr;
        }
    };

    void print_configuration(const RadioConfiguration& config) {
        std::cout << "\n=== Radio Configuration ===\n";
        std::cout << "  Model:            " << config.model_id.value_or("?") << "\n";
        std::cout << "  Version:          " << config.version.value_or("?") << "\n";
        std::cout << "  Memory positions: " <<
            (config.memory_positions ? std::to_string(*config.memory_positions) :
            std::string("?")) << "\n";
        std::cout << "  Skip frequency:   " << config.effective_skip_frequency() << " kHz\n";
        if (config.fm_range_khz) {
            std::cout << "  FM range:         " << config.fm_range_khz->first << "-" <<
                config.fm_range_khz->second << " kHz\n";
        }
        if (config.am_range_khz) {
            std::cout << "  AM range:         " << config.am_range_khz->first << "-" <<
                config.am_range_khz->second << " kHz\n";
        }
        std::cout << "\n";

        std::cout << std::left << std::setw(4) << "Ch" << std::setw(10) << "MHz" <<
            std::setw(18) << "Bandwidth" << std::setw(8) << "Mode" << std::setw(6) << "PI" <<
            std::setw(10) << "PS" << "Status\n";
        for (const auto& record : config.sorted_channels()) {
            ChannelDisplay row = describe_channel(config, record);
            std::cout << std::left << std::setw(4) << row.channel << std::setw(10) <<
                row.frequency_mhz << std::setw(18) << row.bandwidth << std::setw(8) <<
                row.mode << std::setw(6) << row.pi << std::setw(10) << row.ps <<
                row.status() << "\n";
        }
        std::cout << std::right;
    }

    void print_batch_report(const std::string& tag, const BatchReport& report) {
        if (report.error) {
            std::cerr << "[" << tag << "] " << *report.error << "\n";
        }
        std::cout << "[" << tag << "] " << report.successes << " succeeded, " <<
            report.failures << " failed";
        if (report.already_skipped > 0) {
            std::cout << ", " << report.already_skipped << " already skipped";
        }
        std::cout << (report.cancelled ? " (cancelled)" : "") << "\n";
        for (const auto& message : report.failure_messages) {
            std::cerr << "[" << tag << "] " << message << "\n";
        }
    }

    void report_write(const WriteOutcome& outcome, const std::string& context) {
        require_success(outcome, context);
        for (const auto& message : outcome.messages) {
            std::cout << "[WRITE] " << message << "\n";
        }
    }

    int run_ports() {
        auto ports = list_serial_ports();
        if (ports.empty()) {
            std::cout << "[PORTS] No serial ports found.\n";
            return 0;
        }
        for (const auto& port : ports) {
            std::cout << "[PORTS] " << port << "\n";
        }
        return 0;
    }

    /**
     * @brief Connect and read the configuration, needed by every radio command
     */
    void open_session(RadioSession& session, const Callbacks& callbacks) {
        require_success(session.connect(callbacks), "connect " + session.config().device_path);

        ConfigurationReadReport report =
            require_success(session.read_configuration(callbacks), "read configuration");
        for (const auto& warning : report.warnings) {
            std::cerr << "[READ] " << warning << "\n";
        }
        if (report.partial) {
            std::cerr << "[READ] Configuration is incomplete; channel data may be missing.\n";
        }
    }

    int run_import(RadioSession& session, const ScriptConfig& script,
        const Callbacks& callbacks) {
        ImportPlan plan = session.plan_import(script.arguments[0]);
        require_success(plan, "import " + script.arguments[0]);
        for (const auto& warning : plan.warnings) {
            std::cerr << "[IMPORT] " << warning << "\n";
        }
        if (plan.writes.empty()) {
            std::cout << "[IMPORT] No changes detected. Radio already matches the file.\n";
            return 0;
        }

        std::cout << "[IMPORT] " << plan.writes.size() << " channel(s) differ:\n";
        for (const auto& record : plan.writes) {
            std::cout << "  " << encode_write_command(record) << "\n";
        }
        if (!script.assume_yes && !confirm("Write these channels to the radio?")) {
            std::cout << "[IMPORT] Aborted.\n";
            return 0;
        }

        BatchReport report = session.execute_write_list(plan.writes, callbacks);
        print_batch_report("IMPORT", report);
        return report.failures == 0 && !report.error ? 0 : 1;
    }

    int run_erase_all(RadioSession& session, const ScriptConfig& script,
        const Callbacks& callbacks) {
        if (!script.assume_yes && !confirm("Skip every channel except channel 1?")) {
            std::cout << "[ERASE] Aborted.\n";
            return 0;
        }
        BatchReport report = session.skip_all(callbacks);
        print_batch_report("ERASE", report);
        return report.failures == 0 && !report.error ? 0 : 1;
    }

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Parse command-line arguments
        ScriptConfig script = parse_arguments(argc, argv);

        if (script.command == Command::PORTS) {
            return run_ports();
        }

        RadioSession session(build_session_config(script));
        StopOnSigint stop_on_sigint(session);

        Callbacks callbacks = console_callbacks();
        open_session(session, callbacks);

        int rc = 0;
        switch (script.command) {
        case Command::READ:
            print_configuration(*session.configuration());
            break;

        case Command::WRITE: {
            const auto& args = script.arguments;
            report_write(session.write_channel(
                parse_int_argument(args[0], "channel"),
                parse_int_argument(args[1], "frequency"),
                parse_int_argument(args[2], "bandwidth code"),
                parse_int_argument(args[3], "mono/stereo code"),
                args.size() > 4 ? args[4] : std::string(),
                args.size() > 5 ? args[5] : std::string(),
                callbacks), "write Ch " + args[0]);
            break;
        }

        case Command::SKIP:
            report_write(session.skip_channel(
                parse_int_argument(script.arguments[0], "channel"), callbacks),
                "skip Ch " + script.arguments[0]);
            break;

        case Command::ERASE_ALL:
            rc = run_erase_all(session, script, callbacks);
            break;

        case Command::EXPORT: {
            std::size_t written = require_success(session.export_csv(script.arguments[0]),
                "export " + script.arguments[0]);
            std::cout << "[EXPORT] Wrote " << written << " channel(s) to " <<
                script.arguments[0] << "\n";
            break;
        }

        case Command::IMPORT:
            rc = run_import(session, script, callbacks);
            break;

        default:
            break;
        }

        session.disconnect(callbacks);
        return rc;
    } catch (const TefMemException& e) {
        FailureKind kind = classify_failure(e);
        std::cerr << "[" << kind.tag << "] " << e.what() << "\n";
        return kind.exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
