#pragma once

#include "hoshi/ai/engineChannel.hpp"
#include "hoshi/ai/vertex.hpp"
#include "hoshi/core/types.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoshi::ai {

//! Client side of the GTP-like engine protocol.
//! Commands are sent as "<id> <command> <args>" and answered by "=<id> ..." or "?<id> ..." followed by an empty line.
//! Keeps a mirror of the game it set up so a restarted engine can be brought back to the same position.
//! \note Must be owned by a std::shared_ptr. Asynchronous handlers only hold weak references.
class GtpEngine : public std::enable_shared_from_this<GtpEngine> {
public:
	using Duration       = std::chrono::milliseconds;
	using ChannelFactory = std::function<std::shared_ptr<IEngineChannel>()>;

	struct Settings {
		Duration commandTimeout{std::chrono::seconds(10)}; //!< Unanswered commands fail after this time.
		unsigned maxRetries{2u};                           //!< Engine restarts before a move request is given up.
	};

	enum class Failure { None, Rejected, Timeout, ChannelLost };

	struct Reply {
		Failure failure{Failure::None};
		std::string text; //!< Response text or error description.

		bool ok() const {
			return failure == Failure::None;
		}
	};
	using ReplyHandler = std::function<void(const Reply&)>;

	struct PlayedMove {
		Player player;
		std::optional<Coord> coord; //!< Empty for a pass.
	};

	//! Everything needed to reproduce a game on the engine.
	struct GameSetup {
		std::size_t boardSize{19u};
		double komi{6.5};
		std::vector<Coord> handicapStones;
		std::vector<PlayedMove> moves;
	};

	struct MoveReply {
		std::optional<EngineMove> move; //!< Empty if the engine did not produce a usable move.
		Duration thinkingTime{};
		std::string error;
	};
	using MoveHandler = std::function<void(const MoveReply&)>;

public:
	GtpEngine(asio::io_context& ioContext, ChannelFactory factory, Settings settings = {});
	~GtpEngine();

	GtpEngine(const GtpEngine&)            = delete;
	GtpEngine& operator=(const GtpEngine&) = delete;

	bool start();    //!< Open the channel. Returns false if the engine could not be started.
	void shutdown(); //!< Fail pending commands and stop the engine.
	bool isRunning() const;

	//! Send a raw command. The handler is called exactly once.
	void command(std::string_view name, const std::string& args, ReplyHandler handler = {});

	//! Reset the engine to the given game. Handler gets the first failure or success after the last command.
	void setup(GameSetup setup, ReplyHandler handler = {});

	void play(Player player, std::optional<Coord> coord, ReplyHandler handler = {}); //!< Tell the engine about a move.
	void genmove(Player player, MoveHandler handler);                               //!< Ask the engine for a move.
	void finalScore(ReplyHandler handler);                                          //!< Engine's own score estimate.

	GameSetup mirror() const; //!< Game as the engine currently knows it.

private:
	struct Pending {
		std::uint64_t id;
		ReplyHandler handler;
		std::shared_ptr<asio::steady_timer> timer;
	};
	struct PartialResponse {
		std::uint64_t id;
		bool success;
		std::string text;
	};

	bool isStopped() const; //!< Shut down on purpose. No restarts then.
	bool openChannel();     //!< Create and open a fresh channel. Expects no channel to be open.
	bool restart();         //!< Replace the channel and replay the mirror.
	void replay(const GameSetup& setup, ReplyHandler handler);
	void requestMove(Player player, MoveHandler handler, std::chrono::steady_clock::time_point start, std::uint64_t mirrorEpoch, unsigned attempt);

	void onLine(std::uint64_t channelGeneration, const std::string& line);
	void onClosed(std::uint64_t channelGeneration, const std::string& reason);
	void complete(std::uint64_t id, Reply reply);
	void failAll(Failure failure, const std::string& reason);

private:
	asio::io_context& m_ioContext;
	ChannelFactory m_factory;
	Settings m_settings;

	std::shared_ptr<IEngineChannel> m_channel;
	std::uint64_t m_channelGeneration{0u}; //!< Ignores output of replaced channels.
	bool m_stopped{false};
	std::uint64_t m_nextId{1u};
	std::map<std::uint64_t, Pending> m_pending;
	std::optional<PartialResponse> m_response; //!< Response currently being read.
	GameSetup m_mirror;
	std::uint64_t m_mirrorEpoch{0u}; //!< Bumped by setup. Move replies for an older game are not mirrored.

	mutable std::mutex m_mutex;
};

} // namespace hoshi::ai
