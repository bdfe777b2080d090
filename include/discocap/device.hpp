#ifndef DISCOCAP_DEVICE_HPP
#define DISCOCAP_DEVICE_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

using IPv4 = std::array<uint8_t, 4>;
using MAC = std::array<uint8_t, 6>;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// One host seen on the wire. The mac is the identity; everything else may
// change between sightings.
struct DiscoveredDevice {
    std::string brand;
    std::string ip;
    std::string mac;
    std::string name{"Unknown"};
    std::string model;
    std::string firmware;
    uint32_t uptime{0};
    Timestamp discovered_at{Clock::now()};
    Timestamp last_seen{discovered_at};

    std::string unique_id() const;

    // Never moves last_seen backwards.
    void touch();
};

std::string format_mac(const MAC& mac);
std::string format_mac(const uint8_t* bytes);

std::string format_ipv4(const IPv4& addr);
std::string format_ipv4(const uint8_t* bytes);

// Uppercases hex digits and rewrites '-' separators to ':'.
std::string normalize_mac(std::string_view mac);

#endif
