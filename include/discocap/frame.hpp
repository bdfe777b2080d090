#ifndef DISCOCAP_FRAME_HPP
#define DISCOCAP_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Link types as reported by pcap_datalink().
constexpr int LINK_NULL = 0;
constexpr int LINK_ETHERNET = 1;
constexpr int LINK_RAW = 12;
constexpr int LINK_RAW_ALT = 101;
constexpr int LINK_LOOP = 108;
constexpr int LINK_LINUX_SLL = 113;
constexpr int LINK_IPV4 = 228;
constexpr int LINK_LINUX_SLL2 = 276;

// A captured IPv4/UDP datagram. payload points into the capture buffer and
// is only valid while the frame callback runs.
struct Frame {
    std::string source_ip;
    std::string destination_ip;
    uint16_t source_port{0};
    uint16_t destination_port{0};
    const uint8_t* payload{nullptr};
    size_t payload_len{0};
};

std::optional<Frame> parse_frame(int datalink, const uint8_t* data, size_t len);

#endif
