#ifndef DISCOCAP_SCANNER_HPP
#define DISCOCAP_SCANNER_HPP

#include <discocap/device.hpp>
#include <discocap/frame.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using DeviceCallback = std::function<void(const DiscoveredDevice&)>;

// Binds one discovery protocol decoder to its UDP port.
class Scanner {
  private:
    DeviceCallback callback_;

  public:
    Scanner() = default;
    Scanner(const Scanner&) = delete;
    Scanner(Scanner&&) = delete;
    virtual ~Scanner() = default;
    Scanner& operator=(const Scanner&) = delete;
    Scanner& operator=(Scanner&&) = delete;

    virtual uint16_t port() const = 0;
    virtual std::string brand() const = 0;

    std::string filter_expression() const;

    virtual std::optional<DiscoveredDevice> decode(const uint8_t* payload, size_t len,
                                                   std::string_view source_ip) const = 0;

    // Replaces any previously registered callback.
    void set_callback(DeviceCallback callback);

    // Frames on other ports are ignored. Exceptions from decode or the
    // callback are logged and dropped so one bad packet can not stop capture.
    void handle_packet(const Frame& frame);
};

class UbiquitiScanner : public Scanner {
  public:
    uint16_t port() const override;
    std::string brand() const override;
    std::optional<DiscoveredDevice> decode(const uint8_t* payload, size_t len,
                                           std::string_view source_ip) const override;
};

class MndpScanner : public Scanner {
  public:
    uint16_t port() const override;
    std::string brand() const override;
    std::optional<DiscoveredDevice> decode(const uint8_t* payload, size_t len,
                                           std::string_view source_ip) const override;
};

class ScannerSet {
  private:
    std::vector<std::unique_ptr<Scanner>> scanners_;

  public:
    ScannerSet() = default;
    ScannerSet(const ScannerSet&) = delete;
    ScannerSet(ScannerSet&&) = delete;
    ~ScannerSet() = default;
    ScannerSet& operator=(const ScannerSet&) = delete;
    ScannerSet& operator=(ScannerSet&&) = delete;

    Scanner& add(std::unique_ptr<Scanner> scanner);

    bool empty() const;
    size_t size() const;
    std::vector<std::string> brands() const;

    // "udp" with no scanners, otherwise "udp and (port A or port B ...)".
    std::string build_filter() const;

    // Every scanner sees every frame.
    void route_packet(const Frame& frame);
};

#endif
