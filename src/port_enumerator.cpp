/**
 * @file port_enumerator.cpp
 * @brief Serial device enumeration
 * @version 0.1
 * @date 2026-10-18
 */

#include "../include/io/port_enumerator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace tefmem {

    std::vector<std::string> list_serial_ports(const std::string& dev_dir) {
        std::vector<std::string> devices;

        static const std::vector<std::regex> patterns = {
            std::regex("ttyUSB[0-9]+"),
            std::regex("ttyACM[0-9]+"),
            std::regex("ttyS[0-9]+"),
            std::regex("rfcomm[0-9]+"),
            std::regex("cu\\..+")
        };

        std::error_code ec;
        fs::directory_iterator it(dev_dir, ec);
        if (ec) {
            return devices;
        }

        for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            const fs::directory_entry& entry = *it;
            std::error_code type_ec;
            if (!entry.is_character_file(type_ec) || type_ec) {
                continue;
            }
            std::string filename = entry.path().filename().string();
            for (const auto& pattern : patterns) {
                if (std::regex_match(filename, pattern)) {
                    devices.push_back(entry.path().string());
                    break;
                }
            }
        }

        std::sort(devices.begin(), devices.end(), natural_less);
        return devices;
    }

    bool natural_less(const std::string& lhs, const std::string& rhs) {
        std::size_t i = 0;
        std::size_t j = 0;
        while (i < lhs.size() && j < rhs.size()) {
            unsigned char a = static_cast<unsigned char>(lhs[i]);
            unsigned char b = static_cast<unsigned char>(rhs[j]);
            if (std::isdigit(a) && std::isdigit(b)) {
                std::size_t i_end = i;
                std::size_t j_end = j;
                while (i_end < lhs.size() && std::isdigit(static_cast<unsigned char>(lhs[i_end]))) {
                    ++i_end;
                }
                while (j_end < rhs.size() && std::isdigit(static_cast<unsigned char>(rhs[j_end]))) {
                    ++j_end;
                }
                // Compare digit runs by length after dropping leading zeros, then lexically
                std::size_t i_nz = i;
                std::size_t j_nz = j;
                while (i_nz + 1 < i_end && lhs[i_nz] == '0') ++i_nz;
                while (j_nz + 1 < j_end && rhs[j_nz] == '0') ++j_nz;
                std::size_t len_a = i_end - i_nz;
                std::size_t len_b = j_end - j_nz;
                if (len_a != len_b) {
                    return len_a < len_b;
                }
                int cmp = lhs.compare(i_nz, len_a, rhs, j_nz, len_b);
                if (cmp != 0) {
                    return cmp < 0;
                }
                i = i_end;
                j = j_end;
                continue;
            }
            if (a != b) {
                return a < b;
            }
            ++i;
            ++j;
        }
        return (lhs.size() - i) < (rhs.size() - j);
    }

} // namespace tefmem
