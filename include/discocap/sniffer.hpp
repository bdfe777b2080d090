#ifndef DISCOCAP_SNIFFER_HPP
#define DISCOCAP_SNIFFER_HPP

#include <discocap/config.hpp>
#include <discocap/iface.hpp>
#include <discocap/packet_source.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

extern "C" {
struct pcap;
struct pcap_pkthdr;
}

// libpcap packet source. Captures live from an interface, or replays a
// capture file when Config::pcap_file is set.
class Sniffer : public PacketSource {
  public:
    explicit Sniffer(const Config& cfg);
    Sniffer(const Sniffer&) = delete;
    Sniffer(Sniffer&& other) = delete;
    ~Sniffer() override;
    Sniffer& operator=(const Sniffer&) = delete;
    Sniffer& operator=(Sniffer&&) = delete;

    bool ok() const;

    CaptureResult run(const std::string& filter,
                      const std::optional<std::string>& iface,
                      const FrameHandler& on_frame,
                      const StopPredicate& should_stop) override;

    void interrupt() override;

    void sniff_callback(const pcap_pkthdr& hdr, const uint8_t* bytes);

  private:
    CaptureResult open_live(const std::string& iface);
    CaptureResult open_offline();
    CaptureResult apply_filter(const std::string& filter);
    CaptureResult run_live();
    CaptureResult run_offline();
    void stats();
    void close_capture();

    Config config_;
    // Held for a whole run(); a new run waits for an old one to wind down.
    std::mutex run_mut_;
    pcap* pcap_{nullptr};
    int stop_event_{-1};
    int datalink_{0};
    const FrameHandler* on_frame_{nullptr};
    const StopPredicate* should_stop_{nullptr};
};

// Capture-capable interfaces reported by libpcap, with their addresses.
std::vector<CaptureInterface> list_interfaces();

// Interface a scan without -i captures on.
std::optional<std::string> default_interface();

#endif
