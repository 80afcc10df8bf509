#pragma once

#include "hoshi/network/protocol.hpp"

#include <asio.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace hoshi {
namespace network {

//! Minimal synchronous TCP client speaking the framed protocol.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	void disconnect();

	bool send(const Message& message);
	std::optional<Message> read(); //!< Blocks until a full frame arrived. Empty on error.

	bool isConnected() const;

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	bool m_isConnected{false};
};

} // namespace network
} // namespace hoshi
