#ifndef DISCOCAP_REPORT_HPP
#define DISCOCAP_REPORT_HPP

#include <discocap/device.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Local time, "YYYY-MM-DDTHH:MM:SS".
std::string format_timestamp(Timestamp ts);

// "3d 04:05:06", or "04:05:06" under a day.
std::string format_uptime(uint32_t seconds);

std::string csv_escape(std::string_view field);

// Devices sorted by brand, then ip, then mac.
std::vector<DiscoveredDevice> sorted_devices(std::vector<DiscoveredDevice> devices);

void write_table(std::ostream& out, const std::vector<DiscoveredDevice>& devices);
void write_csv(std::ostream& out, const std::vector<DiscoveredDevice>& devices);
bool write_csv(const std::string& path, const std::vector<DiscoveredDevice>& devices);

#endif
