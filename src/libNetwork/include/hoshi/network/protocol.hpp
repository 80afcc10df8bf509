#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hoshi {
namespace network {

using Message      = std::string;   //!< One frame payload. JSON text for the game protocol.
using ConnectionId = std::uint64_t; //!< Server internal id of a client connection.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

// Largest payload we are willing to read. A full game state of a 21x21 board with history stays well below.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 256 * 1024;

//! Every frame is prefixed with its payload size in network byte order.
struct BasicMessageHeader {
	std::uint32_t payload_size{};
};

// Local helpers to move integers to/from network byte order without relying on platform headers.
constexpr std::uint32_t byteswap_u32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t to_network_u32(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap_u32(value);
}

constexpr std::uint32_t from_network_u32(std::uint32_t value) {
	return to_network_u32(value);
}

} // namespace network
} // namespace hoshi
