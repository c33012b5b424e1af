/**
 * @file test_configuration_reader.cpp
 * @brief Configuration dump parsing and read loop tests
 * @version 0.1
 * @date 2026-10-18
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../include/protocol/configuration_reader.hpp"
#include "test_utils.hpp"

using namespace tefmem;
using namespace tefmem::test;
using Catch::Matchers::ContainsSubstring;

namespace {

    struct ReaderRig {
        FakeTefRadio radio;
        std::shared_ptr<MockSerialLink> link = std::make_shared<MockSerialLink>();
        std::unique_ptr<LineTransport> transport;
        std::vector<std::string> statuses;
        std::vector<std::pair<int, int> > progress;
        Callbacks callbacks;

        explicit ReaderRig(int positions = 20, int skip = 500) : radio(positions, skip) {
            link->set_responder(radio.responder());
            transport = create_transport_with_mock(link);
            callbacks.status = [this](const std::string& msg) { statuses.push_back(msg); };
            callbacks.progress = [this](int value, int max) { progress.emplace_back(value, max); };
        }

        Result<ConfigurationReadReport> read() {
            return read_configuration(*transport, fast_session_config(), callbacks);
        }
    };

} // namespace

TEST_CASE("read_configuration - Complete dump", "[reader]") {
    ReaderRig rig(20, 500);
    rig.radio.set_channel(2, 98300, 5, 1, "d3a2", "RADIO 1");

    auto result = rig.read();

    REQUIRE(result.ok());
    const auto& report = result.value();
    const auto& config = report.configuration;

    REQUIRE_FALSE(report.partial);
    REQUIRE(report.warnings.empty());
    REQUIRE(rig.link->get_tx_lines() == std::vector<std::string>{"s"});

    REQUIRE(config.model_id == std::optional<std::string>("TEF6686"));
    REQUIRE(config.version == std::optional<std::string>("v2.20"));
    REQUIRE(config.memory_positions == std::optional<int>(20));
    REQUIRE(config.skip_frequency_value == std::optional<int>(500));
    REQUIRE(config.fm_offset_khz == std::optional<int>(0));
    REQUIRE(config.am_range_khz == std::optional<FrequencyRange>(FrequencyRange{144, 27000}));
    REQUIRE(config.fm_range_khz == std::optional<FrequencyRange>(FrequencyRange{64000, 108000}));
    REQUIRE(config.channels.size() == 20);

    SECTION("Channel fields") {
        const ChannelRecord* ch2 = config.find_channel(2);
        REQUIRE(ch2 != nullptr);
        REQUIRE(ch2->freq_khz == 98300);
        REQUIRE(ch2->bandwidth_code == 5);
        REQUIRE(ch2->pi == std::optional<std::string>("D3A2"));
        REQUIRE(ch2->ps == std::optional<std::string>("RADIO 1"));

        const ChannelRecord* ch3 = config.find_channel(3);
        REQUIRE_FALSE(ch3->pi.has_value());
        REQUIRE_FALSE(ch3->ps.has_value());
    }

    SECTION("Progress per row and completion status") {
        REQUIRE(rig.progress.size() == 20);
        REQUIRE(rig.progress.front() == std::make_pair(1, 20));
        REQUIRE(rig.progress.back() == std::make_pair(20, 20));
        REQUIRE(rig.statuses.back() == "Configuration read complete. Found 20 channels.");
    }
}

TEST_CASE("read_configuration - Banner noise before the dump", "[reader]") {
    ReaderRig rig(4, 0);
    rig.radio.banner = {"ets Jun  8 2016 00:22:57", "rst:0x1 (POWERON_RESET)", "TEF ready"};

    auto result = rig.read();

    REQUIRE(result.ok());
    REQUIRE(result.value().configuration.channels.size() == 4);
    REQUIRE(result.value().warnings.empty());
}

TEST_CASE("read_configuration - Unexpected lines after the banner allowance", "[reader]") {
    ReaderRig rig(4, 0);
    rig.link->set_responder([&rig](const std::string& line) {
        auto lines = rig.radio.respond(line);
        lines.insert(lines.end() - 1, "garbage line");
        return lines;
    });

    auto result = rig.read();

    REQUIRE(result.ok());
    REQUIRE(result.value().warnings.size() == 1);
    REQUIRE_THAT(result.value().warnings[0], ContainsSubstring("Ignoring unexpected line"));
}

TEST_CASE("read_configuration - Malformed header values warn", "[reader]") {
    auto link = std::make_shared<MockSerialLink>();
    auto transport = create_transport_with_mock(link);
    link->set_responder([](const std::string&) {
        return std::vector<std::string>{
            "m:twenty", "s:x", "a:1", "f:64000,abc", "o:", "1,87500,0,1,,", "2,bad,0,1,,"
        };
    });

    auto result = read_configuration(*transport, fast_session_config());

    REQUIRE(result.ok());
    const auto& report = result.value();
    REQUIRE(report.warnings.size() == 6);
    REQUIRE_THAT(report.warnings[0], ContainsSubstring("memory positions"));
    REQUIRE_THAT(report.warnings[5], ContainsSubstring("Could not parse channel data"));
    REQUIRE_FALSE(report.configuration.memory_positions.has_value());
    REQUIRE(report.configuration.channels.size() == 1);
    // Without a declared count nothing is known to be missing
    REQUIRE_FALSE(report.partial);
}

TEST_CASE("read_configuration - Partial dump", "[reader]") {
    ReaderRig rig(20, 500);
    rig.radio.stop_after_rows = 12;

    auto result = rig.read();

    REQUIRE(result.ok());
    REQUIRE(result.value().partial);
    REQUIRE(result.value().configuration.channels.size() == 12);
    REQUIRE(result.value().warnings.size() == 1);
    REQUIRE_THAT(result.value().warnings[0], ContainsSubstring("(12/20)"));
}

TEST_CASE("read_configuration - Hard failures", "[reader]") {
    SECTION("No response at all") {
        ReaderRig rig;
        rig.radio.silent = true;

        auto result = rig.read();

        REQUIRE(result.fail());
        REQUIRE(result.error() == Status::WNO_RESPONSE);
        REQUIRE_THAT(rig.statuses.back(), ContainsSubstring("No response received"));
    }

    SECTION("Command cannot be sent") {
        ReaderRig rig;
        rig.link->set_simulate_write_error(true);

        auto result = rig.read();

        REQUIRE(result.fail());
        REQUIRE(result.error() == Status::DWRITE_ERROR);
    }
}

TEST_CASE("read_configuration - Trailing data is drained", "[reader]") {
    ReaderRig rig(3, 0);
    rig.link->set_responder([&rig](const std::string& line) {
        auto lines = rig.radio.respond(line);
        lines.push_back("");
        return lines;
    });

    REQUIRE(rig.read().ok());
    REQUIRE(rig.link->get_rx_queue_size() == 0);
    REQUIRE_FALSE(rig.transport->read_line(10).has_value());
}

TEST_CASE("ConfigDumpParser - Line classification", "[reader][parser]") {
    Callbacks callbacks;
    ConfigDumpParser parser(callbacks);

    parser.consume("m:2");
    REQUIRE(parser.expected_channels() == std::optional<int>(2));
    REQUIRE_FALSE(parser.complete());

    parser.consume("o:10700,1");
    REQUIRE(parser.configuration().fm_offset_khz == std::optional<int>(10700));

    parser.consume("1,87500,0,1,,");
    parser.consume("2,98300,11,0,c201,NPO 3FM");
    REQUIRE(parser.complete());
    REQUIRE(parser.lines_read() == 4);
    REQUIRE(parser.configuration().channels[1].pi == std::optional<std::string>("C201"));
    REQUIRE(parser.configuration().channels[1].mono_stereo_code == 0);
}
