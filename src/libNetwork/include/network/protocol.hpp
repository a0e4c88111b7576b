#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tictac {
namespace network {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer.
using Message      = std::string;   //!< One line of text without the delimiter.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

//! Messages are separated by a single newline. A trailing '\r' is dropped on read.
inline constexpr char LINE_DELIMITER = '\n';

//! Maximum inbound line we are willing to buffer. Longer lines drop the connection.
inline constexpr std::size_t MAX_LINE_BYTES = 4 * 1024;

} // namespace network
} // namespace tictac
