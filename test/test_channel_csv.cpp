/**
 * @file test_channel_csv.cpp
 * @brief CSV export, import validation and import diff tests
 * @version 0.1
 * @date 2026-10-18
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "../include/csv/channel_csv.hpp"
#include "test_utils.hpp"

using namespace tefmem;
using namespace tefmem::test;
using Catch::Matchers::ContainsSubstring;

namespace {

    const std::string HEADER_LINE =
        "Channel,Frequency kHz,Bandwidth Code,Mono/Stereo Code,PI Code,PS Text\r\n";

    ChannelRecord make_record(int ch, int freq, int bw = 0, int ms = 1,
        const std::string& pi = "", const std::string& ps = "") {
        ChannelRecord record;
        record.channel = ch;
        record.freq_khz = freq;
        record.bandwidth_code = bw;
        record.mono_stereo_code = ms;
        if (!pi.empty()) record.pi = pi;
        if (!ps.empty()) record.ps = ps;
        return record;
    }

    RadioConfiguration make_config() {
        RadioConfiguration config;
        config.memory_positions = 5;
        config.skip_frequency_value = 500;
        config.am_range_khz = FrequencyRange{144, 27000};
        config.fm_range_khz = FrequencyRange{64000, 108000};
        config.channels = {
            make_record(1, 87500),
            make_record(3, 500),
            make_record(2, 98300, 5, 1, "D3A2", "A,\"B\""),
            make_record(4, 500),
            make_record(5, 1017, 2, 0)
        };
        return config;
    }

    ImportPlan plan_from(const std::string& body, const RadioConfiguration& config) {
        std::istringstream in(HEADER_LINE + body);
        return plan_import(in, config);
    }

    Result<ImportRows> rows_from(const std::string& body, const RadioConfiguration& config) {
        std::istringstream in(HEADER_LINE + body);
        return parse_import(in, config);
    }

} // namespace

// ===================================================================
// Codec
// ===================================================================

TEST_CASE("CsvCodec - Quoting and parsing", "[csv][codec]") {
    SECTION("Plain fields are not quoted") {
        REQUIRE(CsvCodec::quote_field("RADIO 1") == "RADIO 1");
    }

    SECTION("Commas and quotes are quoted") {
        REQUIRE(CsvCodec::quote_field("A,B") == "\"A,B\"");
        REQUIRE(CsvCodec::quote_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
    }

    SECTION("Records end with CRLF") {
        REQUIRE(CsvCodec::format_record({"1", "87500", "", ""}) == "1,87500,,\r\n");
    }

    SECTION("Parser handles quotes, line endings and blank lines") {
        auto records = CsvCodec::parse("\xEF\xBB\xBF" "a,\"b,\"\"c\"\"\"\r\n\r\nx,y\ncr\r");

        REQUIRE(records.size() == 4);
        REQUIRE(records[0] == CsvRecord{"a", "b,\"c\""});
        REQUIRE(records[1].empty());
        REQUIRE(records[2] == CsvRecord{"x", "y"});
        REQUIRE(records[3] == CsvRecord{"cr"});
    }

    SECTION("Trailing empty fields are kept") {
        auto records = CsvCodec::parse("1,87500,0,1,,");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].size() == 6);
    }
}

// ===================================================================
// Export
// ===================================================================

TEST_CASE("export_csv - Sorted rows with quoting", "[csv][export]") {
    std::ostringstream out;

    auto written = export_csv(out, make_config());

    REQUIRE(written.ok());
    REQUIRE(written.value() == 5);
    REQUIRE(out.str() ==
        HEADER_LINE +
        "1,87500,0,1,,\r\n"
        "2,98300,5,1,D3A2,\"A,\"\"B\"\"\"\r\n"
        "3,500,0,1,,\r\n"
        "4,500,0,1,,\r\n"
        "5,1017,2,0,,\r\n");
}

TEST_CASE("export_csv_file - Unwritable path", "[csv][export]") {
    auto written = export_csv_file("/nonexistent_dir_tefmem/out.csv", make_config());

    REQUIRE(written.fail());
    REQUIRE(written.error() == Status::CSV_IO_ERROR);
}

TEST_CASE("plan_import - Exported file plans no writes", "[csv][import]") {
    const auto config = make_config();
    std::stringstream buffer;
    REQUIRE(export_csv(buffer, config).ok());

    auto plan = plan_import(buffer, config);

    REQUIRE(plan.ok());
    REQUIRE(plan.writes.empty());
    REQUIRE(plan.warnings.empty());
}

TEST_CASE("plan_import - PS spaces survive the round trip", "[csv][import]") {
    auto config = make_config();
    config.channels[1] = make_record(3, 93500, 0, 1, "C204", " BBC R4");
    config.channels[3] = make_record(4, 94100, 0, 1, "", "A  B ");
    std::stringstream buffer;
    REQUIRE(export_csv(buffer, config).ok());

    auto plan = plan_import(buffer, config);

    REQUIRE(plan.ok());
    REQUIRE(plan.writes.empty());

    auto rows = rows_from("3,93500,0,1,C204, BBC R4\r\n4,94100,0,1,,A  B \r\n", config);
    REQUIRE(rows.ok());
    REQUIRE(rows.value().rows.at(3).ps == std::optional<std::string>(" BBC R4"));
    REQUIRE(rows.value().rows.at(4).ps == std::optional<std::string>("A  B "));
}

// ===================================================================
// Import diff
// ===================================================================

TEST_CASE("plan_import - Diff against the live configuration", "[csv][import][diff]") {
    const auto config = make_config();

    SECTION("Frequency 0 for a channel skipped at 500 is not a change") {
        auto plan = plan_from("3,0,0,1,,\r\n", config);
        REQUIRE(plan.ok());
        REQUIRE(plan.writes.empty());
    }

    SECTION("PI compares case-insensitively") {
        auto plan = plan_from("2,98300,5,1,d3a2,\"A,\"\"B\"\"\"\r\n", config);
        REQUIRE(plan.writes.empty());
    }

    SECTION("Changed fields are written") {
        auto plan = plan_from("5,1017,2,1,,\r\n2,98300,5,1,D3A2,RADIO 2\r\n", config);

        REQUIRE(plan.writes.size() == 2);
        REQUIRE(plan.writes[0].channel == 2);
        REQUIRE(plan.writes[0].ps == std::optional<std::string>("RADIO 2"));
        REQUIRE(plan.writes[1].channel == 5);
        REQUIRE(plan.writes[1].mono_stereo_code == 1);
    }

    SECTION("Skipping a tuned channel is written") {
        auto plan = plan_from("5,0,0,1,,\r\n", config);
        REQUIRE(plan.writes.size() == 1);
        REQUIRE(plan.writes[0].freq_khz == 0);
    }

    SECTION("Skip with other fields changed is written") {
        auto plan = plan_from("3,500,0,1,ABCD,\r\n", config);
        REQUIRE(plan.writes.size() == 1);
    }

    SECTION("Last row for a channel wins") {
        auto plan = plan_from("5,99000,0,1,,\r\n5,101200,0,1,,\r\n", config);
        REQUIRE(plan.writes.size() == 1);
        REQUIRE(plan.writes[0].freq_khz == 101200);
    }
}

TEST_CASE("diff_import - Channels absent from the radio", "[csv][import][diff]") {
    RadioConfiguration config = make_config();
    config.channels.pop_back();  // Drop channel 5

    std::map<int, ChannelRecord> imported;
    imported[5] = make_record(5, 500);
    REQUIRE(diff_import(config, imported).empty());

    imported[5] = make_record(5, 0);
    REQUIRE(diff_import(config, imported).empty());

    imported[5] = make_record(5, 99000);
    auto writes = diff_import(config, imported);
    REQUIRE(writes.size() == 1);
    REQUIRE(writes[0].freq_khz == 99000);
}

// ===================================================================
// Import validation
// ===================================================================

TEST_CASE("parse_import - Row warnings", "[csv][import][validation]") {
    const auto config = make_config();

    SECTION("Wrong column count") {
        auto rows = rows_from("1,2,3\r\n", config);
        REQUIRE(rows.ok());
        REQUIRE(rows.value().rows.empty());
        REQUIRE(rows.value().warnings ==
            std::vector<std::string>{"Row 2: Skipped (Expected 6 columns, found 3)."});
    }

    SECTION("Blank row") {
        auto rows = rows_from("\r\n5,99000,0,1,,\r\n", config);
        REQUIRE(rows.value().warnings ==
            std::vector<std::string>{"Row 2: Skipped (Empty row)."});
        REQUIRE(rows.value().rows.count(5) == 1);
    }

    SECTION("Invalid numbers") {
        auto rows = rows_from("x,98300,0,1,,\r\n", config);
        REQUIRE_THAT(rows.value().warnings.at(0),
            ContainsSubstring("Row 2: Skipped (Invalid number format"));
    }

    SECTION("Range checks") {
        auto rows = rows_from(
            "9,98300,0,1,,\r\n"
            "2,-5,0,1,,\r\n"
            "2,98300,-1,1,,\r\n"
            "2,98300,0,3,,\r\n", config);

        const auto& warnings = rows.value().warnings;
        REQUIRE(warnings.size() == 4);
        REQUIRE(warnings[0] == "Row 2: Skipped (Channel 9 out of valid range 1-5).");
        REQUIRE(warnings[1] == "Row 3: Skipped (Frequency -5 cannot be negative).");
        REQUIRE(warnings[2] == "Row 4: Skipped (Bandwidth code -1 cannot be negative).");
        REQUIRE(warnings[3] == "Row 5: Skipped (Invalid Mono/Stereo code 3, must be 0 or 1).");
        REQUIRE(rows.value().rows.empty());
    }

    SECTION("Channel 1 cannot be skipped by import") {
        auto rows = rows_from("1,500,0,1,,\r\n1,0,0,1,,\r\n", config);
        REQUIRE(rows.value().warnings.size() == 2);
        REQUIRE_THAT(rows.value().warnings[0], ContainsSubstring("Channel 1 cannot be set to skip"));
        REQUIRE(rows.value().rows.empty());
    }

    SECTION("Long PI and PS are truncated and kept") {
        auto rows = rows_from("2,98300,0,1,d3a2ff,RADIO 538 NL\r\n", config);

        const auto& warnings = rows.value().warnings;
        REQUIRE(warnings.size() == 2);
        REQUIRE(warnings[0] == "Row 2: PI 'D3A2FF' truncated to 'D3A2' (max 4 chars).");
        REQUIRE(warnings[1] == "Row 2: PS 'RADIO 538 NL' truncated to 'RADIO 53' (max 8 chars).");

        const ChannelRecord& row = rows.value().rows.at(2);
        REQUIRE(row.pi == std::optional<std::string>("D3A2"));
        REQUIRE(row.ps == std::optional<std::string>("RADIO 53"));
    }

    SECTION("Unknown channel count only checks the lower bound") {
        RadioConfiguration open_config = config;
        open_config.memory_positions.reset();

        auto rows = rows_from("40,98300,0,1,,\r\n0,98300,0,1,,\r\n", open_config);
        REQUIRE(rows.value().rows.count(40) == 1);
        REQUIRE(rows.value().warnings ==
            std::vector<std::string>{"Row 3: Skipped (Channel 0 out of valid range 1-?)."});
    }
}

TEST_CASE("plan_import - Fatal file problems", "[csv][import][validation]") {
    const auto config = make_config();

    SECTION("Empty file") {
        std::istringstream in("");
        auto plan = plan_import(in, config);
        REQUIRE_FALSE(plan.ok());
        REQUIRE(plan.status == Status::CSV_EMPTY);
        REQUIRE_THAT(*plan.error, ContainsSubstring("CSV file is empty."));
    }

    SECTION("BOM only") {
        std::istringstream in("\xEF\xBB\xBF");
        REQUIRE(plan_import(in, config).status == Status::CSV_EMPTY);
    }

    SECTION("Wrong header") {
        std::istringstream in("Channel,Freq\r\n1,87500\r\n");
        auto plan = plan_import(in, config);
        REQUIRE(plan.status == Status::CSV_BAD_HEADER);
        REQUIRE_THAT(*plan.error, ContainsSubstring("Found: Channel,Freq"));
        REQUIRE(plan.writes.empty());
    }

    SECTION("Header after a BOM is accepted") {
        std::istringstream in("\xEF\xBB\xBF" + HEADER_LINE + "5,99000,0,1,,\r\n");
        auto plan = plan_import(in, config);
        REQUIRE(plan.ok());
        REQUIRE(plan.writes.size() == 1);
    }

    SECTION("Invalid UTF-8") {
        std::istringstream in(HEADER_LINE + "2,98300,0,1,,R\xFF\r\n");
        auto plan = plan_import(in, config);
        REQUIRE(plan.status == Status::CSV_IO_ERROR);
        REQUIRE_THAT(*plan.error, ContainsSubstring("UTF-8"));
    }

    SECTION("Missing file") {
        auto plan = plan_import_file("/tmp/tefmem_no_such_file.csv", config);
        REQUIRE(plan.status == Status::CSV_IO_ERROR);
    }
}

// ===================================================================
// Through the session
// ===================================================================

TEST_CASE("RadioSession - Export and import through a file", "[csv][session]") {
    const std::string path = "/tmp/test_tefmem_channels.csv";
    MockRadioRig rig(10, 500);
    rig.radio.set_channel(2, 98300, 5, 1, "D3A2", "RADIO 1");
    REQUIRE(rig.connect_and_read());

    auto exported = rig.session.export_csv(path);
    REQUIRE(exported.ok());
    REQUIRE(exported.value() == 10);

    SECTION("Unchanged file") {
        auto plan = rig.session.plan_import(path);
        REQUIRE(plan.ok());
        REQUIRE(plan.writes.empty());
    }

    SECTION("Edited file is applied") {
        {
            std::ofstream out(path, std::ios::app | std::ios::binary);
            out << "7,101200,0,1,,NPO R2\r\n";
        }

        auto plan = rig.session.plan_import(path);
        REQUIRE(plan.writes.size() == 1);

        auto report = rig.session.execute_write_list(plan.writes);
        REQUIRE(report.successes == 1);
        REQUIRE(rig.radio.channels.at(7).freq_khz == 101200);

        REQUIRE(rig.session.read_configuration().ok());
        REQUIRE(rig.session.plan_import(path).writes.empty());
    }

    std::remove(path.c_str());
}

TEST_CASE("RadioSession - CSV needs a configuration", "[csv][session]") {
    MockRadioRig rig;

    auto exported = rig.session.export_csv("/tmp/test_tefmem_unused.csv");
    REQUIRE(exported.fail());
    REQUIRE(exported.error() == Status::CSV_NO_DATA);

    auto plan = rig.session.plan_import("/tmp/test_tefmem_unused.csv");
    REQUIRE(plan.status == Status::CSV_NO_DATA);
}
