#include <discocap/device.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>

std::string DiscoveredDevice::unique_id() const {
    return normalize_mac(mac);
}

void DiscoveredDevice::touch() {
    auto now = Clock::now();
    if (now > last_seen) {
        last_seen = now;
    }
}

std::string format_mac(const MAC& mac) {
    return format_mac(mac.data());
}

std::string format_mac(const uint8_t* bytes) {
    return fmt::format("{:02X}:{:02X}:{:02X}:{:02X}:{:02X}:{:02X}",
                       bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
}

std::string format_ipv4(const IPv4& addr) {
    return format_ipv4(addr.data());
}

std::string format_ipv4(const uint8_t* bytes) {
    return fmt::format("{}.{}.{}.{}", bytes[0], bytes[1], bytes[2], bytes[3]);
}

std::string normalize_mac(std::string_view mac) {
    std::string ret;
    ret.reserve(mac.size());
    for (auto c : mac) {
        if (c == '-') {
            ret.push_back(':');
        } else {
            ret.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return ret;
}
