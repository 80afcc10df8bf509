#pragma once

#include "hoshi/ai/engineSettings.hpp"
#include "hoshi/clock/clock.hpp"
#include "hoshi/core/scoring.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace hoshi::app {

enum class GameType { Human, Ai };
enum class ColorPreference { Black, White, Random };

std::string_view toString(GameType type);
std::string_view toString(ColorPreference preference);

//! Settings of a single game as requested by its creator.
struct GameConfig {
	std::size_t boardSize{19u};
	Ruleset ruleset{Ruleset::Japanese};
	std::optional<double> komi; //!< Overrides the ruleset komi in even games.
	unsigned handicap{0u};      //!< 0 or [MIN_HANDICAP, MAX_HANDICAP].
	Clock::Config timeControl{Clock::ByoYomi{.mainTime = {}, .period = {}, .periods = 0u}};
	GameType gameType{GameType::Human};
	ColorPreference colorPreference{ColorPreference::Black}; //!< Color of the creator.
	ai::AiLevel aiLevel{ai::AiLevel::Normal};
	bool autoExtendDeadGroups{false};

	//! Komi applied to the score. Handicap games use 0.5.
	double effectiveKomi() const;

	//! \throws std::invalid_argument describing the first invalid setting.
	void validate() const;

	//! Parse the createGame settings. Missing keys keep their defaults. Durations are given in seconds.
	//! \throws std::invalid_argument on malformed or invalid settings.
	static GameConfig fromJson(const nlohmann::json& j);
};

nlohmann::json toJson(const GameConfig& config);
nlohmann::json toJson(const Clock::Config& timeControl);

//! Process wide settings of the server.
struct ServerConfig {
	std::uint16_t port{12345u};
	std::chrono::milliseconds disconnectGrace{std::chrono::seconds(60)}; //!< Sessions without connected peers are evicted after this time.
	std::chrono::milliseconds tickInterval{std::chrono::seconds(1)};
	std::chrono::milliseconds heartbeatTimeout{std::chrono::seconds(30)}; //!< Connections without heartbeat are dropped after this time.
	std::size_t defaultBoardSize{19u};
	ai::EngineSettings ai{};

	//! Defaults overridden by the keys present in the object.
	//! \throws std::invalid_argument on wrongly typed or invalid values.
	static ServerConfig fromJson(const nlohmann::json& j);

	//! Read a JSON configuration file.
	//! \throws std::runtime_error if the file cannot be read or parsed, std::invalid_argument on invalid values.
	static ServerConfig load(const std::filesystem::path& path);
};

} // namespace hoshi::app
