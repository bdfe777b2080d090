#include <discocap/decoder.hpp>
#include <discocap/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

static std::string tlv_string(const uint8_t* value, size_t len) {
    auto text = drop_invalid_utf8(std::string_view(reinterpret_cast<const char*>(value), len));
    return std::string(trim_nul(text));
}

std::optional<DiscoveredDevice> decode_ubiquiti(const uint8_t* data, size_t len,
                                                std::string_view source_ip,
                                                std::string_view brand) {
    if (len < UBNT_HEADER_LEN + 2) {
        return std::nullopt;
    }
    if ((data[0] != 0x01 && data[0] != 0x02) || data[1] != 0x00) {
        return std::nullopt;
    }

    DiscoveredDevice dev;
    dev.brand = std::string(brand);
    std::optional<std::string> ip;
    bool have_model = false;

    size_t pos = UBNT_HEADER_LEN;
    while (pos + UBNT_TLV_HEADER_LEN <= len) {
        const uint8_t type = data[pos];
        const size_t value_len = load_be<uint16_t>(data + pos + 1);
        const uint8_t* value = data + pos + UBNT_TLV_HEADER_LEN;
        if (pos + UBNT_TLV_HEADER_LEN + value_len > len) {
            spdlog::trace("ubiquiti tlv 0x{:02X} overruns payload ({} > {})", type,
                          pos + UBNT_TLV_HEADER_LEN + value_len, len);
            break;
        }

        switch (type) {
            case UBNT_TLV_MAC_ADDRESS:
                if (value_len >= 6) {
                    dev.mac = format_mac(value);
                }
                break;
            case UBNT_TLV_IP_INFO:
                if (value_len >= 10) {
                    dev.mac = format_mac(value);
                    ip = format_ipv4(value + 6);
                }
                break;
            case UBNT_TLV_FIRMWARE:
                dev.firmware = tlv_string(value, value_len);
                break;
            case UBNT_TLV_HOSTNAME:
                dev.name = tlv_string(value, value_len);
                break;
            case UBNT_TLV_MODEL_SHORT:
                if (!have_model) {
                    dev.model = tlv_string(value, value_len);
                    have_model = true;
                }
                break;
            case UBNT_TLV_MODEL_FULL:
                dev.model = tlv_string(value, value_len);
                have_model = true;
                break;
            case UBNT_TLV_UPTIME:
                if (value_len >= 4) {
                    dev.uptime = load_be<uint32_t>(value);
                }
                break;
            default:
                break;
        }

        pos += UBNT_TLV_HEADER_LEN + value_len;
    }

    if (dev.mac.empty()) {
        return std::nullopt;
    }
    dev.ip = ip ? *ip : std::string(source_ip);
    return dev;
}

std::optional<DiscoveredDevice> decode_mndp(const uint8_t* data, size_t len,
                                            std::string_view source_ip) {
    if (len < MNDP_TLV_HEADER_LEN) {
        return std::nullopt;
    }

    DiscoveredDevice dev;
    std::optional<std::string> ip;
    std::string platform;
    std::string board;

    size_t pos = 0;
    while (pos + MNDP_TLV_HEADER_LEN <= len) {
        const uint16_t type = load_le<uint16_t>(data + pos);
        const size_t value_len = load_le<uint16_t>(data + pos + 2);
        const uint8_t* value = data + pos + MNDP_TLV_HEADER_LEN;
        if (pos + MNDP_TLV_HEADER_LEN + value_len > len) {
            spdlog::trace("mndp tlv 0x{:04X} overruns payload ({} > {})", type,
                          pos + MNDP_TLV_HEADER_LEN + value_len, len);
            break;
        }

        switch (type) {
            case MNDP_TLV_MAC_ADDRESS:
                if (value_len >= 6) {
                    dev.mac = format_mac(value);
                }
                break;
            case MNDP_TLV_IDENTITY:
                dev.name = tlv_string(value, value_len);
                break;
            case MNDP_TLV_VERSION:
                dev.firmware = tlv_string(value, value_len);
                break;
            case MNDP_TLV_PLATFORM:
                platform = tlv_string(value, value_len);
                break;
            case MNDP_TLV_BOARD:
                board = tlv_string(value, value_len);
                break;
            case MNDP_TLV_UPTIME:
                if (value_len >= 4) {
                    dev.uptime = load_le<uint32_t>(value);
                }
                break;
            case MNDP_TLV_IPV4:
                if (value_len >= 4) {
                    ip = format_ipv4(value);
                }
                break;
            default:
                break;
        }

        pos += MNDP_TLV_HEADER_LEN + value_len;
    }

    if (dev.mac.empty()) {
        return std::nullopt;
    }
    dev.ip = ip ? *ip : std::string(source_ip);
    dev.brand = detect_mndp_brand(platform, board);
    dev.model = board.empty() ? platform : board;
    return dev;
}

static constexpr std::string_view MIKROTIK_INDICATORS[] = {
    "routerboard", "rb", "ccr", "crs", "css", "hex", "hap",
    "mikrotik", "routeros", "chr", "ltap", "wap", "disc",
    "sxt", "lhg", "basebox", "netbox", "netmetal", "powerbox"
};

std::string detect_mndp_brand(std::string_view platform, std::string_view board) {
    std::string combined;
    combined.reserve(platform.size() + board.size() + 1);
    combined.append(platform);
    combined.push_back(' ');
    combined.append(board);
    std::transform(combined.begin(), combined.end(), combined.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (combined.find("mimosa") != std::string::npos) {
        return "Mimosa";
    }
    for (auto indicator : MIKROTIK_INDICATORS) {
        if (combined.find(indicator) != std::string::npos) {
            return "Mikrotik";
        }
    }
    return "Mikrotik/MNDP";
}
