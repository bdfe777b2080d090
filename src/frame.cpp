#include <discocap/frame.hpp>
#include <discocap/device.hpp>
#include <discocap/utils.hpp>

#include <algorithm>

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;
constexpr uint16_t ETHERTYPE_QINQ = 0x88A8;
constexpr uint8_t IPPROTO_UDP_NUM = 17;
constexpr uint32_t FAMILY_INET = 2;

static std::optional<Frame> parse_ipv4(const uint8_t* data, size_t len) {
    if (len < 20 || (data[0] >> 4) != 4) {
        return std::nullopt;
    }
    const size_t hdr_len = static_cast<size_t>(data[0] & 0x0F) * 4;
    if (hdr_len < 20 || hdr_len > len) {
        return std::nullopt;
    }
    size_t total_len = load_be<uint16_t>(data + 2);
    if (total_len < hdr_len) {
        return std::nullopt;
    }
    // Captures may be truncated by snaplen; trailing link padding is not ours.
    if (total_len < len) {
        len = total_len;
    }
    if ((load_be<uint16_t>(data + 6) & 0x1FFF) != 0) {
        return std::nullopt;
    }
    if (data[9] != IPPROTO_UDP_NUM) {
        return std::nullopt;
    }

    const uint8_t* udp = data + hdr_len;
    const size_t udp_avail = len - hdr_len;
    if (udp_avail < 8) {
        return std::nullopt;
    }
    const size_t udp_len = load_be<uint16_t>(udp + 4);
    if (udp_len < 8) {
        return std::nullopt;
    }

    Frame frame;
    frame.source_ip = format_ipv4(data + 12);
    frame.destination_ip = format_ipv4(data + 16);
    frame.source_port = load_be<uint16_t>(udp);
    frame.destination_port = load_be<uint16_t>(udp + 2);
    frame.payload = udp + 8;
    frame.payload_len = std::min(udp_len, udp_avail) - 8;
    return frame;
}

static std::optional<Frame> parse_ethernet(const uint8_t* data, size_t len) {
    size_t pos = 12;
    if (len < pos + 2) {
        return std::nullopt;
    }
    uint16_t ethertype = load_be<uint16_t>(data + pos);
    for (int tags = 0; tags < 2 && (ethertype == ETHERTYPE_VLAN || ethertype == ETHERTYPE_QINQ); ++tags) {
        pos += 4;
        if (len < pos + 2) {
            return std::nullopt;
        }
        ethertype = load_be<uint16_t>(data + pos);
    }
    if (ethertype != ETHERTYPE_IPV4) {
        return std::nullopt;
    }
    pos += 2;
    return parse_ipv4(data + pos, len - pos);
}

std::optional<Frame> parse_frame(int datalink, const uint8_t* data, size_t len) {
    switch (datalink) {
        case LINK_ETHERNET:
            return parse_ethernet(data, len);
        case LINK_RAW:
        case LINK_RAW_ALT:
        case LINK_IPV4:
            return parse_ipv4(data, len);
        case LINK_NULL:
        case LINK_LOOP: {
            if (len < 4) {
                return std::nullopt;
            }
            // DLT_NULL is host byte order, DLT_LOOP network byte order.
            auto family = load_native<uint32_t>(data);
            if (family != FAMILY_INET && byteswap(family) != FAMILY_INET) {
                return std::nullopt;
            }
            return parse_ipv4(data + 4, len - 4);
        }
        case LINK_LINUX_SLL:
            if (len < 16 || load_be<uint16_t>(data + 14) != ETHERTYPE_IPV4) {
                return std::nullopt;
            }
            return parse_ipv4(data + 16, len - 16);
        case LINK_LINUX_SLL2:
            if (len < 20 || load_be<uint16_t>(data) != ETHERTYPE_IPV4) {
                return std::nullopt;
            }
            return parse_ipv4(data + 20, len - 20);
        default:
            return std::nullopt;
    }
}
