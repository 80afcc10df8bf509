#include "hoshi/app/sessionRegistry.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <utility>

namespace hoshi::app {

static constexpr std::string_view CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
static constexpr std::size_t CODE_LENGTH        = 6u;

SessionRegistry::SessionRegistry(GameSession::Dependencies dependencies) : m_dependencies(std::move(dependencies)), m_rng(std::random_device{}()) {
}

std::shared_ptr<GameSession> SessionRegistry::create(GameConfig config) {
	// Reserve id and code, then build outside the lock. AI games start their engine process here.
	SessionId id = 0u;
	std::string code;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		id   = m_nextId++;
		code = generateCode();
		m_codes.emplace(code, id);
	}

	std::shared_ptr<GameSession> session;
	try {
		session = std::make_shared<GameSession>(id, code, std::move(config), m_dependencies);
	} catch (const std::exception&) {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_codes.erase(code);
		if (m_nextId == id + 1u) {
			m_nextId = id;
		}
		throw;
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_sessions.emplace(id, session);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[SessionRegistry] Created game {} with code '{}'.", id, code));
	return session;
}

void SessionRegistry::insert(std::shared_ptr<GameSession> session) {
	if (!session) {
		return;
	}

	std::lock_guard<std::mutex> lock(m_mutex);
	const auto id = session->id();
	m_nextId      = std::max(m_nextId, id + 1u);
	m_codes[session->code()] = id;
	m_sessions[id]           = std::move(session);
}

std::shared_ptr<GameSession> SessionRegistry::find(SessionId id) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_sessions.find(id);
	return it != m_sessions.end() ? it->second : nullptr;
}

std::shared_ptr<GameSession> SessionRegistry::findByCode(std::string_view code) const {
	std::string normalized(code);
	std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_codes.find(normalized);
	if (it == m_codes.end()) {
		return nullptr;
	}
	const auto session = m_sessions.find(it->second);
	return session != m_sessions.end() ? session->second : nullptr;
}

bool SessionRegistry::remove(SessionId id) {
	std::shared_ptr<GameSession> removed;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_sessions.find(id);
		if (it == m_sessions.end()) {
			return false;
		}
		removed = std::move(it->second);
		m_sessions.erase(it);
		m_codes.erase(removed->code());
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[SessionRegistry] Removed game {}.", id));
	return true;
}

std::vector<std::shared_ptr<GameSession>> SessionRegistry::sessions() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<std::shared_ptr<GameSession>> result;
	result.reserve(m_sessions.size());
	for (const auto& [id, session]: m_sessions) {
		result.push_back(session);
	}
	return result;
}

std::size_t SessionRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

std::vector<SessionId> SessionRegistry::evictAbandoned(GameSession::TimePoint now, GameSession::Duration gracePeriod) {
	std::vector<SessionId> evicted;
	for (const auto& session: sessions()) {
		if (session->isAbandoned(now, gracePeriod) && remove(session->id())) {
			evicted.push_back(session->id());
		}
	}

	if (!evicted.empty()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[SessionRegistry] Evicted {} abandoned game(s).", evicted.size()));
	}
	return evicted;
}

std::string SessionRegistry::generateCode() {
	std::uniform_int_distribution<std::size_t> pick(0u, CODE_ALPHABET.size() - 1u);

	std::string code(CODE_LENGTH, ' ');
	do {
		for (auto& c: code) {
			c = CODE_ALPHABET[pick(m_rng)];
		}
	} while (m_codes.contains(code));
	return code;
}

} // namespace hoshi::app
