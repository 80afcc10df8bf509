#include "hoshi/app/gameServer.hpp"

#include "Logging.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hoshi::app {

static constexpr char LOG_REC_MOVE[]   = "[GameServer] Received 'makeMove' from player '{}' at ({}, {}).";
static constexpr char LOG_REC_PASS[]   = "[GameServer] Received 'passTurn' from player '{}'.";
static constexpr char LOG_REC_RESIGN[] = "[GameServer] Received 'resign'   from player '{}'.";

GameServer::GameServer(ServerConfig config)
    : m_config(std::move(config)),
      m_registry(GameSession::Dependencies{
              .sink          = *this,
              .now           = [] { return std::chrono::steady_clock::now(); },
              .engineFactory = [this](const GameConfig& game) { return launchEngine(game); },
      }),
      m_server(m_config.port), m_ticker(m_registry, [] { return std::chrono::steady_clock::now(); }, m_config.tickInterval, m_config.disconnectGrace) {
}

GameServer::~GameServer() {
	stop();
}

void GameServer::start() {
	if (m_running) {
		Logger().Log(Logging::LogLevel::Warning, "[GameServer] Already running. Start ignored.");
		return;
	}
	m_running = true;

	m_aiContext.restart();
	m_aiWork.emplace(asio::make_work_guard(m_aiContext));
	m_aiThread = std::thread([this] { m_aiContext.run(); });

	m_server.connect({
	        .onConnect    = [this](network::ConnectionId id) { onConnect(id); },
	        .onMessage    = [this](network::ConnectionId id, const network::Message& msg) { onMessage(id, msg); },
	        .onDisconnect = [this](network::ConnectionId id) { onDisconnect(id); },
	});
	m_server.start();

	m_ticker.setHook([this](GameSession::TimePoint now) { sweepHeartbeats(now); });
	m_ticker.start();

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Listening on port {}.", m_server.port()));
}

void GameServer::stop() {
	if (!m_running) {
		return;
	}
	m_running = false;

	m_ticker.stop();
	m_server.stop();
	{
		std::lock_guard lock(m_peersMutex);
		m_peers.clear();
	}

	// Sessions release their engines. Must happen before the engine context stops.
	for (const auto& session: m_registry.sessions()) {
		m_registry.remove(session->id());
	}

	m_aiWork.reset();
	m_aiContext.stop();
	if (m_aiThread.joinable()) {
		m_aiThread.join();
	}

	Logger().Log(Logging::LogLevel::Info, "[GameServer] Stopped.");
}

std::uint16_t GameServer::port() const {
	return m_server.port();
}

SessionRegistry& GameServer::registry() {
	return m_registry;
}

void GameServer::broadcast(SessionId sessionId, const ServerEvent& event) {
	const auto message = toMessage(sessionId, event);

	std::vector<network::ConnectionId> targets;
	{
		std::lock_guard lock(m_peersMutex);
		for (const auto& [connectionId, peer]: m_peers) {
			if (peer.sessionId == sessionId) {
				targets.push_back(connectionId);
			}
		}
	}

	for (const auto connectionId: targets) {
		m_server.send(connectionId, message);
	}
}

void GameServer::sendTo(SessionId sessionId, const PlayerId& playerId, const ServerEvent& event) {
	const auto message = toMessage(sessionId, event);

	std::vector<network::ConnectionId> targets;
	{
		std::lock_guard lock(m_peersMutex);
		for (const auto& [connectionId, peer]: m_peers) {
			if (peer.sessionId == sessionId && peer.playerId == playerId) {
				targets.push_back(connectionId);
			}
		}
	}

	for (const auto connectionId: targets) {
		m_server.send(connectionId, message);
	}
}

void GameServer::onConnect(network::ConnectionId connectionId) {
	std::lock_guard lock(m_peersMutex);
	m_peers[connectionId] = Peer{.lastSeen = std::chrono::steady_clock::now()};
}

void GameServer::onMessage(network::ConnectionId connectionId, const network::Message& message) {
	const auto command = fromClientMessage(message);
	if (!command) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Malformed message from connection '{}'.", connectionId));
		sendError(connectionId, ErrorCode::InvalidArgument, "Malformed message.");
		return;
	}

	{
		// Any message counts as sign of life.
		std::lock_guard lock(m_peersMutex);
		if (auto it = m_peers.find(connectionId); it != m_peers.end()) {
			it->second.lastSeen = std::chrono::steady_clock::now();
		}
	}

	std::visit([&](const auto& c) { handle(connectionId, c); }, *command);
}

void GameServer::onDisconnect(network::ConnectionId connectionId) {
	std::optional<Peer> peer;
	bool stillConnected = false;
	{
		std::lock_guard lock(m_peersMutex);
		const auto it = m_peers.find(connectionId);
		if (it == m_peers.end()) {
			return;
		}
		peer = std::move(it->second);
		m_peers.erase(it);

		for (const auto& [_, other]: m_peers) {
			if (other.sessionId == peer->sessionId && other.playerId == peer->playerId) {
				stillConnected = true;
				break;
			}
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Connection '{}' closed.", connectionId));
	if (peer->sessionId == 0u || stillConnected) {
		return;
	}
	if (const auto session = m_registry.find(peer->sessionId)) {
		session->setConnected(peer->playerId, false);
	}
}

template <typename Fn>
void GameServer::withSession(network::ConnectionId connectionId, Fn&& fn) {
	const auto bound = peer(connectionId);
	if (!bound || bound->sessionId == 0u) {
		sendError(connectionId, ErrorCode::NotFound, "Not in a game.");
		return;
	}

	const auto session = m_registry.find(bound->sessionId);
	if (!session) {
		sendError(connectionId, ErrorCode::NotFound, "Game not found.");
		return;
	}

	if (const auto result = fn(session, bound->playerId); !result.ok()) {
		sendError(connectionId, result.code, result.message);
	}
}

void GameServer::handle(network::ConnectionId connectionId, const CreateGame& command) {
	auto settings = command.config;
	if (!settings.contains("boardSize")) {
		settings["boardSize"] = m_config.defaultBoardSize;
	}

	std::shared_ptr<GameSession> session;
	try {
		session = m_registry.create(GameConfig::fromJson(settings));
	} catch (const std::invalid_argument& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Rejected game config of '{}': {}", command.playerId, e.what()));
		sendError(connectionId, ErrorCode::InvalidArgument, e.what());
		return;
	} catch (const std::runtime_error& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not create game for '{}': {}", command.playerId, e.what()));
		sendError(connectionId, ErrorCode::AiUnavailable, e.what());
		return;
	}

	bind(connectionId, session->id(), command.playerId, command.name);
	m_server.send(connectionId, toMessage(session->id(), GameCreated{.sessionId = session->id(), .code = session->code(), .playerId = command.playerId}));

	if (const auto result = session->join(command.playerId, command.name); !result.ok()) {
		sendError(connectionId, result.code, result.message);
	}
}

void GameServer::handle(network::ConnectionId connectionId, const JoinGame& command) {
	const auto session = command.sessionId ? m_registry.find(*command.sessionId) : m_registry.findByCode(command.code);
	if (!session) {
		sendError(connectionId, ErrorCode::NotFound, "Game not found.");
		return;
	}

	bind(connectionId, session->id(), command.playerId, command.name);
	if (const auto result = session->join(command.playerId, command.name, command.asSpectator); !result.ok()) {
		{
			std::lock_guard lock(m_peersMutex);
			if (auto it = m_peers.find(connectionId); it != m_peers.end()) {
				it->second.sessionId = 0u;
			}
		}
		sendError(connectionId, result.code, result.message);
	}
}

void GameServer::handle(network::ConnectionId connectionId, const MakeMove& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		Logger().Log(Logging::LogLevel::Info, std::format(LOG_REC_MOVE, playerId, command.coord.x, command.coord.y));
		return session->applyMove(playerId, command.coord);
	});
}

void GameServer::handle(network::ConnectionId connectionId, const PassTurn&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		Logger().Log(Logging::LogLevel::Info, std::format(LOG_REC_PASS, playerId));
		return session->applyPass(playerId);
	});
}

void GameServer::handle(network::ConnectionId connectionId, const Resign&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		Logger().Log(Logging::LogLevel::Info, std::format(LOG_REC_RESIGN, playerId));
		return session->resign(playerId);
	});
}

void GameServer::handle(network::ConnectionId connectionId, const RequestUndo& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) { return session->requestUndo(playerId, command.moveIndex); });
}

void GameServer::handle(network::ConnectionId connectionId, const RespondUndo& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) { return session->respondUndo(playerId, command.accepted); });
}

void GameServer::handle(network::ConnectionId connectionId, const ToggleDeadStone& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) { return session->toggleDeadStone(playerId, command.coord); });
}

void GameServer::handle(network::ConnectionId connectionId, const ConfirmScore& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) { return session->confirmScore(playerId, command.confirmed); });
}

void GameServer::handle(network::ConnectionId connectionId, const CancelScoring&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) { return session->cancelScoring(playerId); });
}

void GameServer::handle(network::ConnectionId connectionId, const RequestPlayAgain&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		auto result = session->requestPlayAgain(playerId);
		if (result.ok() && session->takePlayAgainAgreement()) {
			startRematch(session);
		}
		return result;
	});
}

void GameServer::handle(network::ConnectionId connectionId, const RespondPlayAgain& command) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		auto result = session->respondPlayAgain(playerId, command.accepted);
		if (result.ok() && session->takePlayAgainAgreement()) {
			startRematch(session);
		}
		return result;
	});
}

void GameServer::handle(network::ConnectionId, const Heartbeat&) {
	// Presence was already refreshed on receive.
}

void GameServer::handle(network::ConnectionId connectionId, const LeaveGame&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId& playerId) {
		{
			std::lock_guard lock(m_peersMutex);
			if (auto it = m_peers.find(connectionId); it != m_peers.end()) {
				it->second.sessionId = 0u;
			}
		}
		return session->leave(playerId);
	});
}

void GameServer::handle(network::ConnectionId connectionId, const GetGameState&) {
	withSession(connectionId, [&](const std::shared_ptr<GameSession>& session, const PlayerId&) {
		m_server.send(connectionId, toMessage(session->id(), GameState{.snapshot = session->snapshot()}));
		return ActionResult::success();
	});
}

std::shared_ptr<ai::GtpEngine> GameServer::launchEngine(const GameConfig& config) {
	return ai::launchEngine(m_aiContext, m_config.ai, config.aiLevel, config.boardSize);
}

void GameServer::bind(network::ConnectionId connectionId, SessionId sessionId, const PlayerId& playerId, const std::string& name) {
	std::lock_guard lock(m_peersMutex);
	auto& peer     = m_peers[connectionId];
	peer.sessionId = sessionId;
	peer.playerId  = playerId;
	peer.name      = name;
	peer.lastSeen  = std::chrono::steady_clock::now();
}

std::optional<GameServer::Peer> GameServer::peer(network::ConnectionId connectionId) const {
	std::lock_guard lock(m_peersMutex);
	const auto it = m_peers.find(connectionId);
	if (it == m_peers.end()) {
		return std::nullopt;
	}
	return it->second;
}

void GameServer::sendError(network::ConnectionId connectionId, ErrorCode code, const std::string& message) {
	const auto bound   = peer(connectionId);
	const auto payload = bound && bound->sessionId != 0u ? toMessage(bound->sessionId, ErrorEvent{.code = code, .message = message})
	                                                     : toMessage(ErrorEvent{.code = code, .message = message});
	m_server.send(connectionId, payload);
}

void GameServer::startRematch(const std::shared_ptr<GameSession>& previous) {
	const auto black = previous->seat(Player::Black);
	const auto white = previous->seat(Player::White);
	if (!black || !white) {
		return;
	}

	// Both players keep their colors. The first human joining is seated by the color preference.
	auto config            = previous->config();
	const bool blackFirst  = !black->isAi;
	config.colorPreference = blackFirst ? ColorPreference::Black : ColorPreference::White;

	std::shared_ptr<GameSession> next;
	try {
		next = m_registry.create(config);
	} catch (const std::exception& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not start new game after '{}': {}", previous->id(), e.what()));
		broadcast(previous->id(), ErrorEvent{.code = ErrorCode::AiUnavailable, .message = e.what()});
		return;
	}

	broadcast(previous->id(), NewGame{.previous = previous->id(), .sessionId = next->id(), .code = next->code()});

	std::vector<Peer> spectators;
	{
		std::lock_guard lock(m_peersMutex);
		for (auto& [_, peer]: m_peers) {
			if (peer.sessionId != previous->id()) {
				continue;
			}
			peer.sessionId = next->id();
			if (peer.playerId != black->id && peer.playerId != white->id) {
				spectators.push_back(peer);
			}
		}
	}

	const auto& first  = blackFirst ? *black : *white;
	const auto& second = blackFirst ? *white : *black;
	for (const auto* seat: {&first, &second}) {
		if (seat->isAi) {
			continue;
		}
		if (const auto result = next->join(seat->id, seat->name); !result.ok()) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Player '{}' could not rejoin: {}", seat->id, result.message));
		}
	}
	for (const auto& spectator: spectators) {
		if (const auto result = next->join(spectator.playerId, spectator.name, true); !result.ok()) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Spectator '{}' could not rejoin: {}", spectator.playerId, result.message));
		}
	}

	m_registry.remove(previous->id());
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Game '{}' continues as '{}'.", previous->id(), next->id()));
}

void GameServer::sweepHeartbeats(GameSession::TimePoint now) {
	std::vector<network::ConnectionId> stale;
	{
		std::lock_guard lock(m_peersMutex);
		for (const auto& [connectionId, peer]: m_peers) {
			if (now - peer.lastSeen >= m_config.heartbeatTimeout) {
				stale.push_back(connectionId);
			}
		}
	}

	// Rejecting reports the disconnect synchronously. Peer lock must not be held.
	for (const auto connectionId: stale) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Connection '{}' missed its heartbeat.", connectionId));
		m_server.reject(connectionId);
	}
}

} // namespace hoshi::app
