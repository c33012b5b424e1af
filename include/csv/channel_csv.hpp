/**
 * @file channel_csv.hpp
 * @brief Channel table CSV export, import and import diffing
 * @version 0.1
 * @date 2026-10-18
 *
 * File format (UTF-8, CRLF, RFC 4180 quoting):
 *   Channel,Frequency kHz,Bandwidth Code,Mono/Stereo Code,PI Code,PS Text
 *   1,87500,0,1,,
 *   2,98300,0,1,D3A2,RADIO 1
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../enums/error.hpp"
#include "../model/radio_configuration.hpp"
#include "../template/result.hpp"

namespace tefmem {

    static constexpr std::array<const char*, 6> CSV_HEADER = {
        "Channel", "Frequency kHz", "Bandwidth Code", "Mono/Stereo Code", "PI Code", "PS Text"
    };

    using CsvRecord = std::vector<std::string>;

    /**
     * @brief Static helper for the RFC 4180 subset used by the channel files
     */
    class CsvCodec {
        public:
            /**
             * @brief Quote a field when it holds a comma, a quote or a line break
             */
            static std::string quote_field(const std::string& field);

            /**
             * @brief Join fields into one line terminated by CRLF
             */
            static std::string format_record(const CsvRecord& fields);

            /**
             * @brief Split text into records
             *
             * A leading UTF-8 BOM is dropped. Records end at CRLF, LF or CR outside
             * quotes. A blank line yields an empty record. Quotes are only special at
             * the start of a field; "" inside a quoted field is a literal quote.
             */
            static std::vector<CsvRecord> parse(const std::string& text);
    };

    /**
     * @brief Write the header and every channel sorted by number
     * @return Result<std::size_t> Number of rows written, or CSV_IO_ERROR
     */
    Result<std::size_t> export_csv(std::ostream& out, const RadioConfiguration& config);

    /**
     * @brief Export to a file, overwriting it
     * @return Result<std::size_t> Number of rows written, or CSV_IO_ERROR
     */
    Result<std::size_t> export_csv_file(const std::string& path,
        const RadioConfiguration& config);

    /**
     * @brief Rows that passed validation, keyed by channel (last row wins)
     */
    struct ImportRows {
        std::map<int, ChannelRecord> rows;
        std::vector<std::string> warnings;
    };

    /**
     * @brief Parse and validate an import file against the live configuration
     *
     * Bad rows are skipped with a "Row N: ..." warning, N counting the header as row 1.
     *
     * @return Result<ImportRows> Rows and warnings, or CSV_EMPTY / CSV_BAD_HEADER /
     * CSV_IO_ERROR for problems with the file as a whole
     */
    Result<ImportRows> parse_import(std::istream& in, const RadioConfiguration& config);

    /**
     * @brief Minimal set of writes that makes the radio match the imported rows
     *
     * A row is written when its channel is missing from the radio, unless it encodes
     * a skip frequency, or when any field differs (PI compared case-insensitively).
     * A row encoding a skip frequency for a channel the radio already skips is not
     * written when every other field matches.
     *
     * @return std::vector<ChannelRecord> Writes ordered by channel
     */
    std::vector<ChannelRecord> diff_import(const RadioConfiguration& config,
        const std::map<int, ChannelRecord>& imported);

    struct ImportPlan {
        std::vector<ChannelRecord> writes;
        std::vector<std::string> warnings;
        std::optional<std::string> error;  ///< Set on a fatal problem, writes is then empty
        Status status = Status::SUCCESS;

        bool ok() const { return !error.has_value(); }
    };

    ImportPlan plan_import(std::istream& in, const RadioConfiguration& config);

    ImportPlan plan_import_file(const std::string& path, const RadioConfiguration& config);

} // namespace tefmem
