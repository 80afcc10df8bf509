#pragma once

#include "hoshi/network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace hoshi::network {

//! Transportation primitive. Handles framed read/write for a single client connection.
//! \note Owned by a std::shared_ptr. Pending operations keep the connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Start reading frames.
	void stop();                   //!< Close the socket without signalling a disconnect.
	void send(const Message& msg); //!< Queue message for the client.

	ConnectionId connectionId() const;

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for new messages.
	void doDisconnect(); //!< Internal cleanup.

private:
	std::atomic<bool> m_running{false};           //!< Connection running.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serializes socket operations.

	ConnectionId m_connectionId;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue;
	bool m_writeInProgress{false};
};

} // namespace hoshi::network
