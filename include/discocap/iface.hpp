#ifndef DISCOCAP_IFACE_HPP
#define DISCOCAP_IFACE_HPP

#include <discocap/device.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct IPv4Subnet {
    IPv4 addr;
    IPv4 mask;
};

// A capture-capable interface on the scanning host.
struct CaptureInterface {
    std::string name;
    std::string description;
    bool loopback{false};
    std::vector<IPv4Subnet> ipv4;
    std::optional<MAC> mac;
    // Link speed in bits per second, 0 when unknown.
    uint64_t speed{0};
    std::string operstate{"unknown"};
};

// Interface a scan captures on when none is given: the first non-loopback
// entry, in the order libpcap reports them.
std::optional<std::string> pick_capture_interface(const std::vector<CaptureInterface>& ifaces);

// One block per interface; the one a default scan would use is marked.
void write_interfaces(std::ostream& out, const std::vector<CaptureInterface>& ifaces);

uint64_t iface_speed(std::string_view iface);
std::string iface_operstate(std::string_view iface);

#endif
