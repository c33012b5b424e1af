/**
 * @file port_enumerator.hpp
 * @brief Enumerate candidate serial devices for the radio
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <vector>

namespace tefmem {

    /**
     * @brief List serial character devices under a device directory
     *
     * Matches ttyUSB*, ttyACM*, ttyS*, rfcomm* and cu.* entries and returns their full
     * paths sorted naturally, so /dev/ttyUSB2 comes before /dev/ttyUSB10.
     * An unreadable directory yields an empty list.
     *
     * @param dev_dir Directory to scan
     * @return std::vector<std::string> Device paths
     */
    std::vector<std::string> list_serial_ports(const std::string& dev_dir = "/dev");

    /**
     * @brief Natural ordering: digit runs compare by numeric value
     * @return true if lhs sorts before rhs
     */
    bool natural_less(const std::string& lhs, const std::string& rhs);

} // namespace tefmem
