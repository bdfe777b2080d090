#include <discocap/iface.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <filesystem>
#include <fstream>

static std::string_view trim(std::string_view s) noexcept {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end-1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

static std::string read_sysfs(std::string_view iface, std::string_view attr) {
    if (iface.empty() || iface.find('/') != std::string_view::npos) {
        return std::string();
    }
    auto filepath = fmt::format("/sys/class/net/{}/{}", iface, attr);
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        return std::string();
    }
    std::ifstream file{filepath};
    std::string value;
    std::getline(file, value);
    return std::string(trim(value));
}

uint64_t iface_speed(std::string_view iface) {
    auto speed = read_sysfs(iface, "speed");
    if (speed.empty()) {
        return 0;
    }
    uint64_t val = 0;
    for (auto c : speed) {
        if (c >= '0' && c <= '9') {
            val = (val * 10) + static_cast<uint64_t>(c - '0');
        } else {
            // virtual links report -1
            return 0;
        }
    }
    return val * 1'000'000;
}

std::string iface_operstate(std::string_view iface) {
    auto state = read_sysfs(iface, "operstate");
    return state.empty() ? std::string("unknown") : state;
}

std::optional<std::string> pick_capture_interface(const std::vector<CaptureInterface>& ifaces) {
    for (const auto& iface : ifaces) {
        if (!iface.loopback) {
            return iface.name;
        }
    }
    return std::nullopt;
}

void write_interfaces(std::ostream& out, const std::vector<CaptureInterface>& ifaces) {
    auto chosen = pick_capture_interface(ifaces);
    for (const auto& iface : ifaces) {
        out << iface.name;
        if (!iface.description.empty()) {
            out << " (" << iface.description << ")";
        }
        if (chosen && *chosen == iface.name) {
            out << " [default]";
        }
        out << "\n    state: " << iface.operstate;
        if (iface.loopback) {
            out << ", loopback";
        }
        if (iface.mac) {
            out << ", mac: " << format_mac(*iface.mac);
        }
        if (iface.speed > 0) {
            out << ", speed: " << iface.speed / 1'000'000 << " Mb/s";
        }
        out << '\n';
        for (const auto& subnet : iface.ipv4) {
            out << "    inet " << format_ipv4(subnet.addr) << " netmask " << format_ipv4(subnet.mask) << '\n';
        }
        if (iface.ipv4.empty() && !iface.loopback) {
            out << "    no IPv4 address\n";
        }
    }
    if (ifaces.empty()) {
        out << "no capture interfaces found\n";
    }
}
