#include "hoshi/app/ticker.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>

namespace hoshi::app {

Ticker::Ticker(SessionRegistry& registry, GameSession::TimeSource now, GameSession::Duration interval, GameSession::Duration gracePeriod)
    : m_registry(registry), m_now(std::move(now)), m_interval(interval), m_gracePeriod(gracePeriod), m_timer(m_ioContext) {
}

Ticker::~Ticker() {
	stop();
}

void Ticker::setHook(TickHook hook) {
	m_hook = std::move(hook);
}

void Ticker::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	schedule();
	m_thread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[Ticker] Started with {} ms interval.", m_interval.count()));
}

void Ticker::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::post(m_ioContext, [this]() { m_timer.cancel(); });
	if (m_thread.joinable()) {
		m_thread.join();
	}
	Logger().Log(Logging::LogLevel::Info, "[Ticker] Stopped.");
}

void Ticker::tickOnce() {
	for (const auto& session: m_registry.sessions()) {
		session->tick();
	}

	const auto now = m_now();
	m_registry.evictAbandoned(now, m_gracePeriod);
	if (m_hook) {
		m_hook(now);
	}
}

void Ticker::schedule() {
	m_timer.expires_after(m_interval);
	m_timer.async_wait([this](const asio::error_code& ec) {
		if (ec || !m_running) {
			return;
		}
		tickOnce();
		schedule();
	});
}

} // namespace hoshi::app
