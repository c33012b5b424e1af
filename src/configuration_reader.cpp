/**
 * @file configuration_reader.cpp
 * @brief Configuration dump parsing and read loop
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/protocol/configuration_reader.hpp"
#include "../include/enums/protocol.hpp"
#include "../include/interface/text_helpers.hpp"

namespace tefmem {

    namespace {

        bool has_prefix(const std::string& line, DumpLine kind) {
            return line.size() >= 2 && line[0] == static_cast<char>(kind) && line[1] == ':';
        }

        std::optional<FrequencyRange> parse_range(const std::string& text) {
            auto parts = TextHelper::split(text, ',');
            if (parts.size() < 2) {
                return std::nullopt;
            }
            auto low = TextHelper::parse_int(parts[0]);
            auto high = TextHelper::parse_int(parts[1]);
            if (!low || !high) {
                return std::nullopt;
            }
            return FrequencyRange{*low, *high};
        }

    } // namespace

    // ===================================================================
    // ConfigDumpParser
    // ===================================================================

    void ConfigDumpParser::warn(const std::string& message) {
        warnings_.push_back(message);
        callbacks_.notify_status("Warning: " + message);
    }

    void ConfigDumpParser::consume(const std::string& line) {
        ++lines_read_;
        const std::string value = line.size() >= 2 ? TextHelper::trim(line.substr(2)) : "";

        if (has_prefix(line, DumpLine::MODEL)) {
            config_.model_id = value;
        } else if (has_prefix(line, DumpLine::VERSION)) {
            config_.version = value;
        } else if (has_prefix(line, DumpLine::MEMORY_POSITIONS)) {
            if (auto positions = TextHelper::parse_int(value)) {
                config_.memory_positions = *positions;
                expected_channels_ = *positions;
            } else {
                warn("Could not parse memory positions: " + line);
            }
        } else if (has_prefix(line, DumpLine::SKIP_FREQUENCY)) {
            if (auto skip = TextHelper::parse_int(value)) {
                config_.skip_frequency_value = *skip;
            } else {
                warn("Could not parse skip frequency: " + line);
            }
        } else if (has_prefix(line, DumpLine::FM_OFFSET)) {
            if (auto offset = TextHelper::parse_int(TextHelper::split(value, ',').front())) {
                config_.fm_offset_khz = *offset;
            } else {
                warn("Could not parse FM offset: " + line);
            }
        } else if (has_prefix(line, DumpLine::AM_RANGE)) {
            if (auto range = parse_range(value)) {
                config_.am_range_khz = *range;
            } else {
                warn("Could not parse AM range: " + line);
            }
        } else if (has_prefix(line, DumpLine::FM_RANGE)) {
            if (auto range = parse_range(value)) {
                config_.fm_range_khz = *range;
            } else {
                warn("Could not parse FM range: " + line);
            }
        } else {
            parse_channel_row(line);
        }
    }

    void ConfigDumpParser::parse_channel_row(const std::string& line) {
        auto parts = TextHelper::split(line, ',');
        if (parts.size() != CHANNEL_FIELD_COUNT) {
            // The first lines after `s` may still be boot banner
            if (lines_read_ > BANNER_LINE_ALLOWANCE) {
                warn("Ignoring unexpected line: " + line);
            }
            return;
        }

        auto channel = TextHelper::parse_int(parts[0]);
        auto freq = TextHelper::parse_int(parts[1]);
        auto bandwidth = TextHelper::parse_int(parts[2]);
        auto mono_stereo = TextHelper::parse_int(parts[3]);
        if (!channel || !freq || !bandwidth || !mono_stereo) {
            warn("Could not parse channel data: " + line);
            return;
        }

        ChannelRecord record;
        record.channel = *channel;
        record.freq_khz = *freq;
        record.bandwidth_code = *bandwidth;
        record.mono_stereo_code = *mono_stereo;
        if (!parts[4].empty()) {
            record.pi = TextHelper::to_upper(parts[4]);
        }
        if (!parts[5].empty()) {
            record.ps = parts[5];
        }
        config_.channels.push_back(std::move(record));

        if (expected_channels_ && *expected_channels_ > 0) {
            callbacks_.notify_progress(static_cast<int>(config_.channels.size()),
                *expected_channels_);
        }
    }

    // ===================================================================
    // Read loop
    // ===================================================================

    Result<ConfigurationReadReport> read_configuration(LineTransport& transport,
        const SessionConfig& config, const Callbacks& callbacks) {
        using ReadResult = Result<ConfigurationReadReport>;

        if (!transport.send_line(READ_CONFIG_COMMAND)) {
            const std::string msg = "Failed to send configuration read command ('s').";
            callbacks.notify_status(msg);
            return ReadResult::error(Status::DWRITE_ERROR, msg);
        }

        callbacks.notify_status("Reading configuration from radio...");

        ConfigDumpParser parser(callbacks);
        ConfigurationReadReport report;

        while (true) {
            const std::uint32_t timeout = parser.lines_read() == 0 ? config.read_timeout_ms
                                                                   : config.stream_timeout_ms;
            auto line = transport.read_line(timeout);

            if (!line) {
                if (parser.lines_read() == 0) {
                    const std::string msg = "ERROR: No response received from radio for 's' command.";
                    callbacks.notify_status(msg);
                    return ReadResult::error(Status::WNO_RESPONSE, msg);
                }
                const auto& expected = parser.expected_channels();
                if (expected && !parser.complete()) {
                    const std::string msg = "Warning: Read timeout before receiving all expected channels (" +
                        std::to_string(parser.configuration().channels.size()) + "/" +
                        std::to_string(*expected) + ").";
                    callbacks.notify_status(msg);
                    report.warnings.push_back(msg.substr(std::char_traits<char>::length("Warning: ")));
                    report.partial = true;
                }
                break;
            }

            parser.consume(*line);

            if (parser.complete()) {
                // Swallow whatever trails the last channel row
                transport.read_line(config.drain_timeout_ms);
                break;
            }
        }

        auto parser_warnings = parser.take_warnings();
        parser_warnings.insert(parser_warnings.end(), report.warnings.begin(),
            report.warnings.end());
        report.warnings = std::move(parser_warnings);
        report.configuration = parser.take_configuration();

        const auto& positions = report.configuration.memory_positions;
        callbacks.notify_status("Configuration read complete. Found " +
            (positions ? std::to_string(*positions) : std::string("?")) + " channels.");

        return ReadResult::success(std::move(report));
    }

} // namespace tefmem
