#include "hoshi/ai/gtpEngine.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <system_error>
#include <utility>

namespace hoshi::ai {

static std::string trim(std::string_view value) {
	auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
	const auto first = std::find_if_not(value.begin(), value.end(), isSpace);
	const auto last  = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
	return first < last ? std::string(first, last) : std::string{};
}

GtpEngine::GtpEngine(asio::io_context& ioContext, ChannelFactory factory, Settings settings)
    : m_ioContext(ioContext), m_factory(std::move(factory)), m_settings(settings) {
}

GtpEngine::~GtpEngine() {
	shutdown();
}

bool GtpEngine::start() {
	if (isRunning()) {
		return true;
	}
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_stopped = false;
	}
	return openChannel();
}

void GtpEngine::shutdown() {
	std::shared_ptr<IEngineChannel> channel;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		channel   = std::exchange(m_channel, nullptr);
		m_stopped = true;
		++m_channelGeneration;
	}

	failAll(Failure::ChannelLost, "engine shut down");
	if (channel) {
		channel->close();
	}
}

bool GtpEngine::isRunning() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_channel && m_channel->isOpen();
}

void GtpEngine::command(std::string_view name, const std::string& args, ReplyHandler handler) {
	std::shared_ptr<IEngineChannel> channel;
	std::uint64_t id = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_channel && m_channel->isOpen()) {
			channel = m_channel;
			id      = m_nextId++;

			auto timer = std::make_shared<asio::steady_timer>(m_ioContext);
			timer->expires_after(m_settings.commandTimeout);
			timer->async_wait([weak = weak_from_this(), id](const asio::error_code& ec) {
				if (ec == asio::error::operation_aborted) {
					return;
				}
				if (auto self = weak.lock()) {
					self->complete(id, Reply{.failure = Failure::Timeout, .text = "command timed out"});
				}
			});
			m_pending.emplace(id, Pending{.id = id, .handler = std::move(handler), .timer = std::move(timer)});
		}
	}

	if (!channel) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Dropping '{}': engine not running.", name));
		if (handler) {
			handler(Reply{.failure = Failure::ChannelLost, .text = "engine not running"});
		}
		return;
	}

	const auto line = args.empty() ? std::format("{} {}", id, name) : std::format("{} {} {}", id, name, args);
	Logger().Log(Logging::LogLevel::Debug, std::format("[GtpEngine] > {}", line));
	if (!channel->write(line)) {
		complete(id, Reply{.failure = Failure::ChannelLost, .text = "write to engine failed"});
	}
}

void GtpEngine::setup(GameSetup setup, ReplyHandler handler) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_mirror = setup;
		++m_mirrorEpoch;
	}
	replay(setup, std::move(handler));
}

void GtpEngine::play(Player player, std::optional<Coord> coord, ReplyHandler handler) {
	std::size_t boardSize = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_mirror.moves.push_back(PlayedMove{.player = player, .coord = coord});
		boardSize = m_mirror.boardSize;
	}

	const auto vertex = toVertex(coord, boardSize);
	if (!vertex) {
		if (handler) {
			handler(Reply{.failure = Failure::Rejected, .text = "move cannot be written as vertex"});
		}
		return;
	}
	command("play", std::format("{} {}", toColor(player), *vertex), std::move(handler));
}

void GtpEngine::genmove(Player player, MoveHandler handler) {
	std::uint64_t epoch = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		epoch = m_mirrorEpoch;
	}
	requestMove(player, std::move(handler), std::chrono::steady_clock::now(), epoch, 0u);
}

void GtpEngine::finalScore(ReplyHandler handler) {
	command("final_score", {}, std::move(handler));
}

bool GtpEngine::isStopped() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_stopped;
}

GtpEngine::GameSetup GtpEngine::mirror() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_mirror;
}

bool GtpEngine::openChannel() {
	auto channel = m_factory ? m_factory() : nullptr;
	if (!channel) {
		Logger().Log(Logging::LogLevel::Error, "[GtpEngine] No engine channel available.");
		return false;
	}

	std::uint64_t generation = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		generation = ++m_channelGeneration;
		m_response.reset();
	}

	std::weak_ptr<GtpEngine> weak = weak_from_this();
	try {
		channel->open(IEngineChannel::Callbacks{
		        .onLine =
		                [weak, generation](const std::string& line) {
			                if (auto self = weak.lock()) {
				                self->onLine(generation, line);
			                }
		                },
		        .onClosed =
		                [weak, generation](const std::string& reason) {
			                if (auto self = weak.lock()) {
				                self->onClosed(generation, reason);
			                }
		                },
		});
	} catch (const std::system_error& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GtpEngine] Could not start engine: {}", e.what()));
		return false;
	}

	std::lock_guard<std::mutex> lock(m_mutex);
	m_channel = std::move(channel);
	return true;
}

bool GtpEngine::restart() {
	std::shared_ptr<IEngineChannel> previous;
	GameSetup mirror;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		previous = std::exchange(m_channel, nullptr);
		++m_channelGeneration;
		mirror = m_mirror;
	}

	if (previous) {
		previous->close();
	}
	failAll(Failure::ChannelLost, "engine restarted");

	if (!openChannel()) {
		return false;
	}
	replay(mirror, [](const Reply& reply) {
		if (!reply.ok()) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Replaying game after restart failed: {}", reply.text));
		}
	});
	return true;
}

void GtpEngine::replay(const GameSetup& setup, ReplyHandler handler) {
	std::vector<std::pair<std::string_view, std::string>> commands{
	        {"boardsize", std::format("{}", setup.boardSize)},
	        {"clear_board", {}},
	        {"komi", std::format("{}", setup.komi)},
	};
	for (const auto stone: setup.handicapStones) {
		if (const auto vertex = toVertex(stone, setup.boardSize)) {
			commands.emplace_back("play", std::format("{} {}", toColor(Player::Black), *vertex));
		}
	}
	for (const auto& move: setup.moves) {
		if (const auto vertex = toVertex(move.coord, setup.boardSize)) {
			commands.emplace_back("play", std::format("{} {}", toColor(move.player), *vertex));
		} else {
			Logger().Log(Logging::LogLevel::Warning, "[GtpEngine] Skipping move that cannot be written as vertex.");
		}
	}

	// Completes after the last reply, reporting the first failure.
	struct Batch {
		std::mutex mutex;
		std::size_t remaining;
		std::optional<Reply> failure;
		ReplyHandler handler;
	};
	auto batch       = std::make_shared<Batch>();
	batch->remaining = commands.size();
	batch->handler   = std::move(handler);

	for (const auto& [name, args]: commands) {
		command(name, args, [batch](const Reply& reply) {
			std::optional<Reply> result;
			{
				std::lock_guard<std::mutex> lock(batch->mutex);
				if (!reply.ok() && !batch->failure) {
					batch->failure = reply;
				}
				if (--batch->remaining == 0u) {
					result = batch->failure.value_or(Reply{});
				}
			}
			if (result && batch->handler) {
				batch->handler(*result);
			}
		});
	}
}

void GtpEngine::requestMove(Player player, MoveHandler handler, std::chrono::steady_clock::time_point start, std::uint64_t mirrorEpoch, unsigned attempt) {
	command("genmove", std::string{toColor(player)}, [weak = weak_from_this(), player, handler, start, mirrorEpoch, attempt](const Reply& reply) {
		auto self = weak.lock();
		if (!self) {
			return;
		}

		const auto thinking = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
		if (reply.ok()) {
			const auto move = fromVertex(trim(reply.text), self->mirror().boardSize);
			if (!move) {
				handler(MoveReply{.move = std::nullopt, .thinkingTime = thinking, .error = std::format("unreadable engine move '{}'", reply.text)});
				return;
			}

			{
				std::lock_guard<std::mutex> lock(self->m_mutex);
				if (move->kind != EngineMove::Kind::Resign && mirrorEpoch == self->m_mirrorEpoch) {
					self->m_mirror.moves.push_back(PlayedMove{
					        .player = player,
					        .coord  = move->kind == EngineMove::Kind::Place ? std::optional<Coord>{move->coord} : std::nullopt,
					});
				}
			}
			handler(MoveReply{.move = move, .thinkingTime = thinking, .error = {}});
			return;
		}

		if (reply.failure != Failure::Rejected && attempt < self->m_settings.maxRetries && !self->isStopped()) {
			Logger().Log(Logging::LogLevel::Warning,
			             std::format("[GtpEngine] genmove failed ({}). Restarting engine, retry {} of {}.", reply.text, attempt + 1u, self->m_settings.maxRetries));
			if (self->restart()) {
				self->requestMove(player, handler, start, mirrorEpoch, attempt + 1u);
				return;
			}
		}

		Logger().Log(Logging::LogLevel::Error, std::format("[GtpEngine] Giving up on genmove: {}", reply.text));
		handler(MoveReply{
		        .move         = std::nullopt,
		        .thinkingTime = thinking,
		        .error        = reply.failure == Failure::Rejected ? reply.text : std::string{"AI unresponsive"},
		});
	});
}

void GtpEngine::onLine(std::uint64_t channelGeneration, const std::string& line) {
	std::optional<std::pair<std::uint64_t, Reply>> finished;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (channelGeneration != m_channelGeneration) {
			return;
		}

		if (m_response) {
			if (line.empty()) {
				finished.emplace(m_response->id, Reply{
				                                         .failure = m_response->success ? Failure::None : Failure::Rejected,
				                                         .text    = trim(m_response->text),
				                                 });
				m_response.reset();
			} else {
				m_response->text += '\n' + line;
			}
		} else if (!line.empty() && (line.front() == '=' || line.front() == '?')) {
			std::uint64_t id     = 0u;
			const auto* first    = line.data() + 1;
			const auto* last     = line.data() + line.size();
			const auto [ptr, ec] = std::from_chars(first, last, id);
			if (ec != std::errc{}) {
				Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Response without id: '{}'", line));
				return;
			}
			m_response = PartialResponse{.id = id, .success = line.front() == '=', .text = std::string(ptr, last)};
		} else if (!line.empty()) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[GtpEngine] Ignoring engine output '{}'.", line));
		}
	}

	if (finished) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[GtpEngine] < {} {}", finished->first, finished->second.text));
		complete(finished->first, std::move(finished->second));
	}
}

void GtpEngine::onClosed(std::uint64_t channelGeneration, const std::string& reason) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (channelGeneration != m_channelGeneration) {
			return;
		}
		m_channel.reset();
		m_response.reset();
	}

	Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Engine closed: {}", reason));
	failAll(Failure::ChannelLost, reason);
}

void GtpEngine::complete(std::uint64_t id, Reply reply) {
	ReplyHandler handler;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_pending.find(id);
		if (it == m_pending.end()) {
			return;
		}
		it->second.timer->cancel();
		handler = std::move(it->second.handler);
		m_pending.erase(it);
	}

	if (!reply.ok()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Command {} failed: {}", id, reply.text));
	}
	if (handler) {
		handler(reply);
	}
}

void GtpEngine::failAll(Failure failure, const std::string& reason) {
	std::map<std::uint64_t, Pending> pending;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		pending.swap(m_pending);
	}

	for (auto& [id, entry]: pending) {
		entry.timer->cancel();
		if (entry.handler) {
			entry.handler(Reply{.failure = failure, .text = reason});
		}
	}
}

} // namespace hoshi::ai
