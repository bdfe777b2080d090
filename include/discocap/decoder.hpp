#ifndef DISCOCAP_DECODER_HPP
#define DISCOCAP_DECODER_HPP

#include <discocap/device.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

constexpr uint16_t UBIQUITI_PORT = 10001;
constexpr uint16_t MNDP_PORT = 5678;

constexpr uint8_t UBNT_TLV_MAC_ADDRESS = 0x01;
constexpr uint8_t UBNT_TLV_IP_INFO = 0x02;
constexpr uint8_t UBNT_TLV_FIRMWARE = 0x03;
constexpr uint8_t UBNT_TLV_HOSTNAME = 0x0B;
constexpr uint8_t UBNT_TLV_MODEL_SHORT = 0x0C;
constexpr uint8_t UBNT_TLV_ESSID = 0x0D;
constexpr uint8_t UBNT_TLV_UPTIME = 0x0E;
constexpr uint8_t UBNT_TLV_MODEL_FULL = 0x14;

constexpr size_t UBNT_HEADER_LEN = 4;
constexpr size_t UBNT_TLV_HEADER_LEN = 3;

constexpr uint16_t MNDP_TLV_MAC_ADDRESS = 0x0001;
constexpr uint16_t MNDP_TLV_IDENTITY = 0x0005;
constexpr uint16_t MNDP_TLV_VERSION = 0x0007;
constexpr uint16_t MNDP_TLV_PLATFORM = 0x0008;
constexpr uint16_t MNDP_TLV_UPTIME = 0x000A;
constexpr uint16_t MNDP_TLV_SOFTWARE_ID = 0x000B;
constexpr uint16_t MNDP_TLV_BOARD = 0x000E;
constexpr uint16_t MNDP_TLV_IPV6 = 0x0010;
constexpr uint16_t MNDP_TLV_INTERFACE = 0x0011;
constexpr uint16_t MNDP_TLV_IPV4 = 0x0014;

constexpr size_t MNDP_TLV_HEADER_LEN = 4;

// Ubiquiti discovery reply: 4 byte header, then 1 byte type / 2 byte
// big-endian length TLVs. Returns nullopt without a hardware address.
std::optional<DiscoveredDevice> decode_ubiquiti(const uint8_t* data, size_t len,
                                                std::string_view source_ip,
                                                std::string_view brand);

// MNDP announcement: 2 byte type / 2 byte length TLVs, both little-endian,
// starting at offset 0. Brand is derived from platform and board.
std::optional<DiscoveredDevice> decode_mndp(const uint8_t* data, size_t len,
                                            std::string_view source_ip);

std::string detect_mndp_brand(std::string_view platform, std::string_view board);

#endif
