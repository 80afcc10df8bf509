#include "hoshi/network/tcpServer.hpp"

#include "Logging.hpp"

#include <asio/ip/tcp.hpp>

#include <format>
#include <utility>

namespace hoshi::network {

TcpServer::TcpServer(std::uint16_t port) : m_ioContext(), m_acceptor(m_ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", port()));
}

void TcpServer::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_connections.find(connectionId);
		if (it == m_connections.end()) {
			return false;
		}
		connection = it->second;
	}

	connection->send(msg);
	return true;
}

void TcpServer::reject(ConnectionId connectionId) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_connections.find(connectionId);
		if (it == m_connections.end()) {
			return;
		}
		connection = std::move(it->second);
		m_connections.erase(it);
	}

	connection->stop();
	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(connectionId);
	}
}

void TcpServer::doAccept() {
	m_acceptor.async_accept(asio::make_strand(m_ioContext), [this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			createConnection(std::move(socket), m_nextConnectionId++);
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

void TcpServer::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	Connection::Callbacks callbacks;
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto id = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(id);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(id);
		}
	};

	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		m_connections.emplace(connectionId, connection);
	}

	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connectionId);
	}
	connection->start();
}

} // namespace hoshi::network
