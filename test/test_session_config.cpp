/**
 * @file test_session_config.cpp
 * @brief Unit tests for session configuration and port enumeration
 * @version 0.1
 * @date 2026-10-18
 */

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "../include/pattern/session_config.hpp"
#include "../include/io/port_enumerator.hpp"

using namespace tefmem;

TEST_CASE("SessionConfig::create_default - Default values", "[session][config]") {
    auto config = SessionConfig::create_default();

    REQUIRE(config.device_path == "/dev/ttyUSB0");
    REQUIRE(config.baud_rate == SerialBaud::BAUD_115200);
    REQUIRE(config.read_timeout_ms == 2000);
    REQUIRE(config.stream_timeout_ms == 500);
    REQUIRE(config.drain_timeout_ms == 200);
    REQUIRE(config.boot_delay_ms == 2000);
    REQUIRE(config.settle_delay_ms == 100);
    REQUIRE(config.write_pacing_ms == 150);
    REQUIRE(config.check_pacing_ms == 10);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("SessionConfig::validate - Invalid values throw", "[session][config][validation]") {
    SessionConfig config = SessionConfig::create_default();

    SECTION("Empty device path") {
        config.device_path = "";
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Zero read timeout") {
        config.read_timeout_ms = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Zero stream timeout") {
        config.stream_timeout_ms = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Timeout too large") {
        config.read_timeout_ms = 70000;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Pacing too large") {
        config.write_pacing_ms = 6000;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Zero delays are allowed") {
        config.boot_delay_ms = 0;
        config.settle_delay_ms = 0;
        config.drain_timeout_ms = 0;
        REQUIRE_NOTHROW(config.validate());
    }
}

// === JSON Configuration Tests ===

TEST_CASE("SessionConfig::from_file - Parse JSON file", "[session][config][json]") {
    const std::string test_file = "/tmp/test_tefmem_config.json";
    {
        std::ofstream out(test_file);
        out <<
            R"({
  "session_config": {
    "device_path": "/dev/ttyACM0",
    "baud_rate": 921600,
    "read_timeout_ms": 3000,
    "stream_timeout_ms": 400,
    "drain_timeout_ms": 100,
    "boot_delay_ms": 1500,
    "settle_delay_ms": 50,
    "write_pacing_ms": 200,
    "check_pacing_ms": 5
  }
})";
        out.close();
    }

    auto config = SessionConfig::from_file(test_file);

    REQUIRE(config.device_path == "/dev/ttyACM0");
    REQUIRE(config.baud_rate == SerialBaud::BAUD_921600);
    REQUIRE(config.read_timeout_ms == 3000);
    REQUIRE(config.stream_timeout_ms == 400);
    REQUIRE(config.drain_timeout_ms == 100);
    REQUIRE(config.boot_delay_ms == 1500);
    REQUIRE(config.settle_delay_ms == 50);
    REQUIRE(config.write_pacing_ms == 200);
    REQUIRE(config.check_pacing_ms == 5);

    std::remove(test_file.c_str());
}

TEST_CASE("SessionConfig::from_json - Partial config uses defaults", "[session][config][json]") {
    auto j = nlohmann::json::parse(R"({"session_config": {"device_path": "/dev/ttyUSB3"}})");
    auto config = SessionConfig::from_json(j);

    REQUIRE(config.device_path == "/dev/ttyUSB3");
    REQUIRE(config.baud_rate == SerialBaud::BAUD_115200);
    REQUIRE(config.read_timeout_ms == 2000);
}

TEST_CASE("SessionConfig::from_json - Round trip through to_json", "[session][config][json]") {
    SessionConfig original = SessionConfig::create_default();
    original.device_path = "/dev/ttyUSB7";
    original.write_pacing_ms = 300;

    auto restored = SessionConfig::from_json(original.to_json());
    REQUIRE(restored.device_path == "/dev/ttyUSB7");
    REQUIRE(restored.write_pacing_ms == 300);
}

TEST_CASE("SessionConfig::from_json - Bad values throw", "[session][config][json]") {
    SECTION("Unsupported baud rate") {
        auto j = nlohmann::json::parse(R"({"session_config": {"baud_rate": 12345}})");
        REQUIRE_THROWS_AS(SessionConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Negative timeout") {
        auto j = nlohmann::json::parse(R"({"session_config": {"read_timeout_ms": -5}})");
        REQUIRE_THROWS_AS(SessionConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Non-numeric timeout") {
        auto j = nlohmann::json::parse(R"({"session_config": {"read_timeout_ms": "soon"}})");
        REQUIRE_THROWS_AS(SessionConfig::from_json(j), std::invalid_argument);
    }
}

TEST_CASE("SessionConfig::from_file - Invalid JSON throws", "[session][config][json]") {
    const std::string test_file = "/tmp/test_tefmem_invalid.json";
    {
        std::ofstream out(test_file);
        out << "{ invalid json }";
        out.close();
    }

    REQUIRE_THROWS_AS(SessionConfig::from_file(test_file), std::runtime_error);

    std::remove(test_file.c_str());
}

TEST_CASE("SessionConfig::load - Environment overrides file", "[session][config][env]") {
    const std::string test_file = "/tmp/test_tefmem_env.json";
    {
        std::ofstream out(test_file);
        out << R"({"session_config": {"device_path": "/dev/ttyUSB1", "read_timeout_ms": 900}})";
        out.close();
    }

    setenv("TEFMEM_DEVICE", "/dev/ttyUSB5", 1);
    auto config = SessionConfig::load(test_file);
    unsetenv("TEFMEM_DEVICE");

    REQUIRE(config.device_path == "/dev/ttyUSB5");
    REQUIRE(config.read_timeout_ms == 900);

    std::remove(test_file.c_str());
}

TEST_CASE("SessionConfig::load - Missing file means defaults", "[session][config][env]") {
    auto config = SessionConfig::load(std::string("/tmp/does_not_exist_tefmem.json"));
    REQUIRE(config.device_path == "/dev/ttyUSB0");
}

// === Port Enumeration ===

TEST_CASE("natural_less - Numeric runs compare by value", "[ports]") {
    REQUIRE(natural_less("/dev/ttyUSB2", "/dev/ttyUSB10"));
    REQUIRE_FALSE(natural_less("/dev/ttyUSB10", "/dev/ttyUSB2"));
    REQUIRE(natural_less("/dev/ttyACM0", "/dev/ttyUSB0"));
    REQUIRE_FALSE(natural_less("/dev/ttyS1", "/dev/ttyS1"));
}

TEST_CASE("list_serial_ports - Only character devices are listed", "[ports]") {
    SECTION("Missing directory yields nothing") {
        REQUIRE(list_serial_ports("/tmp/tefmem_no_such_dir").empty());
    }

    SECTION("Regular files with device names are ignored") {
        namespace fs = std::filesystem;
        fs::path dir = fs::temp_directory_path() / "tefmem_fake_dev";
        fs::create_directories(dir);
        std::ofstream(dir / "ttyUSB0").close();

        REQUIRE(list_serial_ports(dir.string()).empty());

        fs::remove_all(dir);
    }

    SECTION("Subdirectories are skipped without throwing") {
        namespace fs = std::filesystem;
        fs::path dir = fs::temp_directory_path() / "tefmem_fake_dev_tree";
        fs::create_directories(dir / "serial" / "by-id");
        fs::create_directories(dir / "ttyACM0");

        std::vector<std::string> ports;
        REQUIRE_NOTHROW(ports = list_serial_ports(dir.string()));
        REQUIRE(ports.empty());

        fs::remove_all(dir);
    }

    SECTION("The system device directory can be scanned") {
        REQUIRE_NOTHROW(list_serial_ports());
    }
}
