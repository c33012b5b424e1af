/**
 * @file channel_csv.cpp
 * @brief Channel CSV codec and import diff
 * @version 0.1
 * @date 2026-10-18
 */

#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include "../include/csv/channel_csv.hpp"
#include "../include/enums/protocol.hpp"
#include "../include/interface/text_helpers.hpp"
#include "../include/model/skip_state.hpp"

namespace tefmem {

    namespace {

        constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

        std::string header_text() {
            std::string out;
            for (std::size_t i = 0; i < CSV_HEADER.size(); ++i) {
                if (i > 0) out += ",";
                out += CSV_HEADER[i];
            }
            return out;
        }

        std::string record_text(const CsvRecord& record) {
            std::string out;
            for (std::size_t i = 0; i < record.size(); ++i) {
                if (i > 0) out += ",";
                out += record[i];
            }
            return out;
        }

        bool is_blank(const CsvRecord& record) {
            for (const auto& field : record) {
                if (!TextHelper::trim(field).empty()) {
                    return false;
                }
            }
            return true;
        }

        std::string row_prefix(std::size_t row_number) {
            return "Row " + std::to_string(row_number) + ": ";
        }

        bool fields_match_except_freq(const ChannelRecord& imported, const ChannelRecord& live) {
            return imported.bandwidth_code == live.bandwidth_code &&
                   imported.mono_stereo_code == live.mono_stereo_code &&
                   imported.pi_or_empty() == TextHelper::to_upper(live.pi_or_empty()) &&
                   imported.ps_or_empty() == live.ps_or_empty();
        }

    } // namespace

    // ===================================================================
    // CsvCodec
    // ===================================================================

    std::string CsvCodec::quote_field(const std::string& field) {
        if (field.find_first_of(",\"\r\n") == std::string::npos) {
            return field;
        }
        std::string quoted = "\"";
        for (char c : field) {
            if (c == '"') {
                quoted += "\"\"";
            } else {
                quoted += c;
            }
        }
        quoted += "\"";
        return quoted;
    }

    std::string CsvCodec::format_record(const CsvRecord& fields) {
        std::string line;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) line += ",";
            line += quote_field(fields[i]);
        }
        line += "\r\n";
        return line;
    }

    std::vector<CsvRecord> CsvCodec::parse(const std::string& text) {
        std::vector<CsvRecord> records;
        std::size_t pos = 0;
        if (text.compare(0, std::strlen(UTF8_BOM), UTF8_BOM) == 0) {
            pos = std::strlen(UTF8_BOM);
        }

        CsvRecord record;
        std::string field;
        bool in_quotes = false;
        bool field_started = false;  // Anything seen since the last record break

        auto end_field = [&]() {
                record.push_back(std::move(field));
                field.clear();
            };
        auto end_record = [&]() {
                if (field_started) {
                    end_field();
                }
                records.push_back(std::move(record));
                record.clear();
                field_started = false;
            };

        while (pos < text.size()) {
            char c = text[pos];

            if (in_quotes) {
                if (c == '"') {
                    if (pos + 1 < text.size() && text[pos + 1] == '"') {
                        field += '"';
                        ++pos;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
                ++pos;
                continue;
            }

            switch (c) {
            case '"':
                if (field.empty()) {
                    in_quotes = true;
                } else {
                    field += c;
                }
                field_started = true;
                break;
            case ',':
                end_field();
                field_started = true;
                break;
            case '\r':
                end_record();
                if (pos + 1 < text.size() && text[pos + 1] == '\n') {
                    ++pos;
                }
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                field_started = true;
                break;
            }
            ++pos;
        }

        if (field_started || !record.empty()) {
            end_record();
        }
        return records;
    }

    // ===================================================================
    // Export
    // ===================================================================

    Result<std::size_t> export_csv(std::ostream& out, const RadioConfiguration& config) {
        out << CsvCodec::format_record(CsvRecord(CSV_HEADER.begin(), CSV_HEADER.end()));

        std::size_t count = 0;
        for (const auto& channel : config.sorted_channels()) {
            out << CsvCodec::format_record({
                std::to_string(channel.channel),
                std::to_string(channel.freq_khz),
                std::to_string(channel.bandwidth_code),
                std::to_string(channel.mono_stereo_code),
                channel.pi_or_empty(),
                channel.ps_or_empty()
            });
            ++count;
        }

        if (!out) {
            return Result<std::size_t>::error(Status::CSV_IO_ERROR, "File Write Error");
        }
        return Result<std::size_t>::success(count);
    }

    Result<std::size_t> export_csv_file(const std::string& path,
        const RadioConfiguration& config) {
        std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            return Result<std::size_t>::error(Status::CSV_IO_ERROR,
                "File Write Error: cannot open " + path);
        }

        auto result = export_csv(file, config);
        if (result.fail()) {
            return Result<std::size_t>::error(result, path);
        }
        file.close();
        if (file.fail()) {
            return Result<std::size_t>::error(Status::CSV_IO_ERROR,
                "File Write Error: cannot finish " + path);
        }
        return result;
    }

    // ===================================================================
    // Import
    // ===================================================================

    Result<ImportRows> parse_import(std::istream& in, const RadioConfiguration& config) {
        using ImportResult = Result<ImportRows>;

        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return ImportResult::error(Status::CSV_IO_ERROR, "File Read Error");
        }

        const auto* raw = reinterpret_cast<const std::uint8_t*>(text.data());
        if (TextHelper::decode_permissive(boost::span<const std::uint8_t>(raw, text.size())) !=
            text) {
            return ImportResult::error(Status::CSV_IO_ERROR,
                "File Encoding Error: Could not decode as UTF-8. "
                "Ensure the file is saved with UTF-8 encoding.");
        }

        std::vector<CsvRecord> records = CsvCodec::parse(text);
        if (records.empty()) {
            return ImportResult::error(Status::CSV_EMPTY, "CSV file is empty.");
        }

        const CsvRecord& header = records.front();
        if (header != CsvRecord(CSV_HEADER.begin(), CSV_HEADER.end())) {
            return ImportResult::error(Status::CSV_BAD_HEADER, "Invalid CSV header. Expected: " +
                header_text() + ", Found: " + record_text(header));
        }

        const std::optional<int>& max_channels = config.memory_positions;
        ImportRows result;

        for (std::size_t i = 1; i < records.size(); ++i) {
            const CsvRecord& row = records[i];
            const std::string prefix = row_prefix(i + 1);

            if (is_blank(row)) {
                result.warnings.push_back(prefix + "Skipped (Empty row).");
                continue;
            }
            if (row.size() != CSV_HEADER.size()) {
                result.warnings.push_back(prefix + "Skipped (Expected " +
                    std::to_string(CSV_HEADER.size()) + " columns, found " +
                    std::to_string(row.size()) + ").");
                continue;
            }

            auto channel = TextHelper::parse_int(row[0]);
            auto freq = TextHelper::parse_int(row[1]);
            auto bandwidth = TextHelper::parse_int(row[2]);
            auto mono_stereo = TextHelper::parse_int(row[3]);
            if (!channel || !freq || !bandwidth || !mono_stereo) {
                result.warnings.push_back(prefix +
                    "Skipped (Invalid number format in one or more fields: " +
                    record_text(CsvRecord(row.begin(), row.begin() + 4)) + ").");
                continue;
            }

            if (*channel < 1 || (max_channels && *channel > *max_channels)) {
                result.warnings.push_back(prefix + "Skipped (Channel " +
                    std::to_string(*channel) + " out of valid range 1-" +
                    (max_channels ? std::to_string(*max_channels) : std::string("?")) + ").");
                continue;
            }
            if (*freq < 0) {
                result.warnings.push_back(prefix + "Skipped (Frequency " +
                    std::to_string(*freq) + " cannot be negative).");
                continue;
            }
            if (*bandwidth < 0) {
                result.warnings.push_back(prefix + "Skipped (Bandwidth code " +
                    std::to_string(*bandwidth) + " cannot be negative).");
                continue;
            }
            if (*mono_stereo != static_cast<int>(MonoStereo::MONO) &&
                *mono_stereo != static_cast<int>(MonoStereo::STEREO)) {
                result.warnings.push_back(prefix + "Skipped (Invalid Mono/Stereo code " +
                    std::to_string(*mono_stereo) + ", must be 0 or 1).");
                continue;
            }

            std::string pi = TextHelper::to_upper(TextHelper::trim(row[4]));
            std::string ps = row[5];

            const std::string original_pi = pi;
            if (TextHelper::truncate(pi, MAX_PI_LENGTH)) {
                result.warnings.push_back(prefix + "PI '" + original_pi + "' truncated to '" +
                    pi + "' (max 4 chars).");
            }
            const std::string original_ps = ps;
            if (TextHelper::truncate(ps, MAX_PS_LENGTH)) {
                result.warnings.push_back(prefix + "PS '" + original_ps + "' truncated to '" +
                    ps + "' (max 8 chars).");
            }

            if (*channel == 1 && is_skip_frequency(&config, *freq)) {
                result.warnings.push_back(prefix + "Skipped (Channel 1 cannot be set to skip "
                    "frequency " + std::to_string(*freq) + " via import).");
                continue;
            }

            ChannelRecord record;
            record.channel = *channel;
            record.freq_khz = *freq;
            record.bandwidth_code = *bandwidth;
            record.mono_stereo_code = *mono_stereo;
            record.pi = pi;
            record.ps = ps;
            result.rows[*channel] = std::move(record);
        }

        return ImportResult::success(std::move(result));
    }

    std::vector<ChannelRecord> diff_import(const RadioConfiguration& config,
        const std::map<int, ChannelRecord>& imported) {
        std::vector<ChannelRecord> writes;

        for (const auto& [channel, row] : imported) {
            const ChannelRecord* live = config.find_channel(channel);
            const bool skip_in_file = is_skip_frequency(&config, row.freq_khz);

            if (live == nullptr) {
                if (!skip_in_file) {
                    writes.push_back(row);
                }
                continue;
            }

            const bool differs = row.freq_khz != live->freq_khz ||
                                 !fields_match_except_freq(row, *live);
            if (!differs) {
                continue;
            }

            // 0 vs the radio's own skip value is the same empty slot
            if (skip_in_file && is_skipped(&config, live) && fields_match_except_freq(row, *live)) {
                continue;
            }
            writes.push_back(row);
        }

        return writes;
    }

    ImportPlan plan_import(std::istream& in, const RadioConfiguration& config) {
        ImportPlan plan;
        auto parsed = parse_import(in, config);
        if (parsed.fail()) {
            plan.error = parsed.message();
            plan.status = parsed.error();
            return plan;
        }

        plan.warnings = std::move(parsed.value().warnings);
        plan.writes = diff_import(config, parsed.value().rows);
        return plan;
    }

    ImportPlan plan_import_file(const std::string& path, const RadioConfiguration& config) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            ImportPlan plan;
            plan.error = "File Read Error: cannot open " + path;
            plan.status = Status::CSV_IO_ERROR;
            return plan;
        }
        return plan_import(file, config);
    }

} // namespace tefmem
