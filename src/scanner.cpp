#include <discocap/scanner.hpp>
#include <discocap/decoder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>

std::string Scanner::filter_expression() const {
    return fmt::format("udp port {}", port());
}

void Scanner::set_callback(DeviceCallback callback) {
    callback_ = std::move(callback);
}

void Scanner::handle_packet(const Frame& frame) {
    const auto p = port();
    if (frame.source_port != p && frame.destination_port != p) {
        return;
    }
    try {
        auto dev = decode(frame.payload, frame.payload_len, frame.source_ip);
        if (dev.has_value() && callback_) {
            callback_(*dev);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] packet parsing error from {}: {}", brand(), frame.source_ip, e.what());
    } catch (...) {
        spdlog::warn("[{}] unknown packet parsing error from {}", brand(), frame.source_ip);
    }
}

uint16_t UbiquitiScanner::port() const {
    return UBIQUITI_PORT;
}

std::string UbiquitiScanner::brand() const {
    return "Ubiquiti";
}

std::optional<DiscoveredDevice> UbiquitiScanner::decode(const uint8_t* payload, size_t len,
                                                        std::string_view source_ip) const {
    return decode_ubiquiti(payload, len, source_ip, brand());
}

uint16_t MndpScanner::port() const {
    return MNDP_PORT;
}

std::string MndpScanner::brand() const {
    return "Mikrotik/Mimosa";
}

std::optional<DiscoveredDevice> MndpScanner::decode(const uint8_t* payload, size_t len,
                                                    std::string_view source_ip) const {
    return decode_mndp(payload, len, source_ip);
}

Scanner& ScannerSet::add(std::unique_ptr<Scanner> scanner) {
    return *scanners_.emplace_back(std::move(scanner));
}

bool ScannerSet::empty() const {
    return scanners_.empty();
}

size_t ScannerSet::size() const {
    return scanners_.size();
}

std::vector<std::string> ScannerSet::brands() const {
    std::vector<std::string> ret;
    ret.reserve(scanners_.size());
    for (const auto& scanner : scanners_) {
        ret.push_back(scanner->brand());
    }
    return ret;
}

std::string ScannerSet::build_filter() const {
    if (scanners_.empty()) {
        return "udp";
    }
    std::string ports;
    for (const auto& scanner : scanners_) {
        if (!ports.empty()) {
            ports += " or ";
        }
        ports += fmt::format("port {}", scanner->port());
    }
    return fmt::format("udp and ({})", ports);
}

void ScannerSet::route_packet(const Frame& frame) {
    for (auto& scanner : scanners_) {
        scanner->handle_packet(frame);
    }
}
