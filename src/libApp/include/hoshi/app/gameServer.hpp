#pragma once

#include "hoshi/app/commands.hpp"
#include "hoshi/app/config.hpp"
#include "hoshi/app/eventSink.hpp"
#include "hoshi/app/gameSession.hpp"
#include "hoshi/app/sessionRegistry.hpp"
#include "hoshi/app/ticker.hpp"
#include "hoshi/network/tcpServer.hpp"

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace hoshi::app {

//! Connects the TCP transport with the game sessions.
//! Maps every connection to at most one (session, player) pair and routes session events back to the connections.
class GameServer : public IEventSink {
public:
	explicit GameServer(ServerConfig config);
	~GameServer() override;

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;

	void start(); //!< Start accepting clients, the ticker and the AI worker thread.
	void stop();  //!< Disconnect clients and end all sessions.

	std::uint16_t port() const;
	SessionRegistry& registry();

public: // IEventSink
	void broadcast(SessionId sessionId, const ServerEvent& event) override;
	void sendTo(SessionId sessionId, const PlayerId& playerId, const ServerEvent& event) override;

private:
	struct Peer {
		SessionId sessionId{0u}; //!< 0 while not in a game.
		PlayerId playerId;
		std::string name;
		GameSession::TimePoint lastSeen;
	};

	void onConnect(network::ConnectionId connectionId);
	void onMessage(network::ConnectionId connectionId, const network::Message& message);
	void onDisconnect(network::ConnectionId connectionId);

	void handle(network::ConnectionId connectionId, const CreateGame& command);
	void handle(network::ConnectionId connectionId, const JoinGame& command);
	void handle(network::ConnectionId connectionId, const MakeMove& command);
	void handle(network::ConnectionId connectionId, const PassTurn& command);
	void handle(network::ConnectionId connectionId, const Resign& command);
	void handle(network::ConnectionId connectionId, const RequestUndo& command);
	void handle(network::ConnectionId connectionId, const RespondUndo& command);
	void handle(network::ConnectionId connectionId, const ToggleDeadStone& command);
	void handle(network::ConnectionId connectionId, const ConfirmScore& command);
	void handle(network::ConnectionId connectionId, const CancelScoring& command);
	void handle(network::ConnectionId connectionId, const RequestPlayAgain& command);
	void handle(network::ConnectionId connectionId, const RespondPlayAgain& command);
	void handle(network::ConnectionId connectionId, const Heartbeat& command);
	void handle(network::ConnectionId connectionId, const LeaveGame& command);
	void handle(network::ConnectionId connectionId, const GetGameState& command);

	//! Run fn with the session and player bound to the connection. Failures are reported to the connection.
	template <typename Fn>
	void withSession(network::ConnectionId connectionId, Fn&& fn);

	std::shared_ptr<ai::GtpEngine> launchEngine(const GameConfig& config);
	void bind(network::ConnectionId connectionId, SessionId sessionId, const PlayerId& playerId, const std::string& name);
	std::optional<Peer> peer(network::ConnectionId connectionId) const;
	void sendError(network::ConnectionId connectionId, ErrorCode code, const std::string& message);

	void startRematch(const std::shared_ptr<GameSession>& previous);
	void sweepHeartbeats(GameSession::TimePoint now);

private:
	ServerConfig m_config;

	asio::io_context m_aiContext; //!< Drives all engine processes.
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_aiWork;
	std::thread m_aiThread;

	SessionRegistry m_registry;
	network::TcpServer m_server;
	Ticker m_ticker;

	std::unordered_map<network::ConnectionId, Peer> m_peers;
	mutable std::mutex m_peersMutex;
	bool m_running{false};
};

} // namespace hoshi::app
