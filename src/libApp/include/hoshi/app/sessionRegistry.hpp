#pragma once

#include "hoshi/app/config.hpp"
#include "hoshi/app/gameSession.hpp"
#include "hoshi/app/types.hpp"

#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hoshi::app {

//! Owns all live sessions. Removing a session releases its AI engine.
class SessionRegistry {
public:
	explicit SessionRegistry(GameSession::Dependencies dependencies);

	//! Create and insert a session with a fresh id and share code.
	//! \throws std::invalid_argument on an invalid config, std::runtime_error if the AI engine cannot be started.
	std::shared_ptr<GameSession> create(GameConfig config);

	void insert(std::shared_ptr<GameSession> session);
	std::shared_ptr<GameSession> find(SessionId id) const;           //!< nullptr for unknown ids.
	std::shared_ptr<GameSession> findByCode(std::string_view code) const; //!< Case insensitive. nullptr for unknown codes.
	bool remove(SessionId id);

	std::vector<std::shared_ptr<GameSession>> sessions() const; //!< Snapshot for iteration without holding the registry lock.
	std::size_t size() const;

	//! Remove every session that has had no connected participant for gracePeriod.
	//! \returns Ids of the removed sessions.
	std::vector<SessionId> evictAbandoned(GameSession::TimePoint now, GameSession::Duration gracePeriod);

private:
	std::string generateCode(); //!< Unused share code. Expects the lock to be held.

private:
	GameSession::Dependencies m_dependencies;

	SessionId m_nextId{1u};
	std::unordered_map<SessionId, std::shared_ptr<GameSession>> m_sessions;
	std::unordered_map<std::string, SessionId> m_codes;
	std::mt19937 m_rng;
	mutable std::mutex m_mutex;
};

} // namespace hoshi::app
