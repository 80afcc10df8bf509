#include "hoshi/app/config.hpp"

#include "hoshi/ai/vertex.hpp"
#include "hoshi/core/handicap.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace hoshi::app {

using nlohmann::json;
using std::chrono::milliseconds;

namespace {

const json* find(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || it->is_null()) {
		return nullptr;
	}
	return &*it;
}

unsigned readUnsigned(const json& j, const char* key, unsigned fallback) {
	const auto* value = find(j, key);
	if (!value) {
		return fallback;
	}
	if (!value->is_number_unsigned()) {
		throw std::invalid_argument(std::format("'{}' must be a non-negative integer.", key));
	}
	if (value->get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
		throw std::invalid_argument(std::format("'{}' is out of range.", key));
	}
	return value->get<unsigned>();
}

double readNumber(const json& j, const char* key, double fallback) {
	const auto* value = find(j, key);
	if (!value) {
		return fallback;
	}
	if (!value->is_number()) {
		throw std::invalid_argument(std::format("'{}' must be a number.", key));
	}
	return value->get<double>();
}

bool readBool(const json& j, const char* key, bool fallback) {
	const auto* value = find(j, key);
	if (!value) {
		return fallback;
	}
	if (!value->is_boolean()) {
		throw std::invalid_argument(std::format("'{}' must be a boolean.", key));
	}
	return value->get<bool>();
}

std::string readString(const json& j, const char* key, const std::string& fallback) {
	const auto* value = find(j, key);
	if (!value) {
		return fallback;
	}
	if (!value->is_string()) {
		throw std::invalid_argument(std::format("'{}' must be a string.", key));
	}
	return value->get<std::string>();
}

//! Non-negative duration given in the unit of Period (seconds by default).
template <typename Period = std::ratio<1>>
milliseconds readDuration(const json& j, const char* key, milliseconds fallback) {
	const auto* value = find(j, key);
	if (!value) {
		return fallback;
	}
	const auto amount = readNumber(j, key, 0.0);
	if (amount < 0.0 || !std::isfinite(amount)) {
		throw std::invalid_argument(std::format("'{}' must not be negative.", key));
	}
	return std::chrono::duration_cast<milliseconds>(std::chrono::duration<double, Period>(amount));
}

double toSeconds(milliseconds duration) {
	return std::chrono::duration<double>(duration).count();
}

Clock::Config timeControlFromJson(const json& j) {
	if (j.is_null()) {
		return Clock::ByoYomi{.mainTime = {}, .period = {}, .periods = 0u};
	}
	if (!j.is_object()) {
		throw std::invalid_argument("'timeControl' must be an object.");
	}

	const auto mode = readString(j, "mode", "standard");
	if (mode == "none") {
		return Clock::ByoYomi{.mainTime = {}, .period = {}, .periods = 0u};
	}
	if (mode == "standard") {
		const auto config = Clock::ByoYomi{
		        .mainTime = readDuration(j, "mainTime", {}),
		        .period   = readDuration(j, "byoYomiTime", {}),
		        .periods  = readUnsigned(j, "byoYomiPeriods", 0u),
		};
		if (config.periods > 0u && config.period == milliseconds::zero()) {
			throw std::invalid_argument("Byo-yomi periods need a period time.");
		}
		return config;
	}
	if (mode == "fischer") {
		const auto config = Clock::Fischer{
		        .mainTime  = readDuration(j, "mainTime", {}),
		        .increment = readDuration(j, "increment", {}),
		        .period    = readDuration(j, "byoYomiTime", {}),
		        .periods   = readUnsigned(j, "byoYomiPeriods", 0u),
		};
		if (config.mainTime == milliseconds::zero()) {
			throw std::invalid_argument("Fischer time needs main time.");
		}
		if (config.periods > 0u && config.period == milliseconds::zero()) {
			throw std::invalid_argument("Byo-yomi periods need a period time.");
		}
		return config;
	}
	if (mode == "blitz") {
		const auto config = Clock::Blitz{.timePerMove = readDuration(j, "timePerMove", {})};
		if (config.timePerMove == milliseconds::zero()) {
			throw std::invalid_argument("Blitz needs a time per move.");
		}
		return config;
	}
	throw std::invalid_argument(std::format("Unknown time control mode '{}'.", mode));
}

} // namespace

std::string_view toString(const GameType type) {
	return type == GameType::Ai ? "ai" : "human";
}

std::string_view toString(const ColorPreference preference) {
	switch (preference) {
	case ColorPreference::Black:
		return "black";
	case ColorPreference::White:
		return "white";
	case ColorPreference::Random:
		return "random";
	}
	return "random";
}

double GameConfig::effectiveKomi() const {
	if (handicap > 0u) {
		return adjustedKomi(ruleset, handicap);
	}
	return komi.value_or(defaultKomi(ruleset));
}

void GameConfig::validate() const {
	if (boardSize < MIN_BOARD_SIZE || boardSize > MAX_BOARD_SIZE) {
		throw std::invalid_argument(std::format("Board size must be in [{}, {}].", MIN_BOARD_SIZE, MAX_BOARD_SIZE));
	}
	if (handicap != 0u) {
		if (handicap < MIN_HANDICAP || handicap > MAX_HANDICAP) {
			throw std::invalid_argument(std::format("Handicap must be 0 or in [{}, {}].", MIN_HANDICAP, MAX_HANDICAP));
		}
		if (!supportsHandicap(boardSize)) {
			throw std::invalid_argument(std::format("No handicap points on a {0}x{0} board.", boardSize));
		}
	}
	if (komi && !std::isfinite(*komi)) {
		throw std::invalid_argument("Komi must be a finite number.");
	}
	if (gameType == GameType::Ai && boardSize > ai::MAX_VERTEX_BOARD_SIZE) {
		throw std::invalid_argument(std::format("Games against the AI are limited to {0}x{0}.", ai::MAX_VERTEX_BOARD_SIZE));
	}
}

GameConfig GameConfig::fromJson(const json& j) {
	if (!j.is_object()) {
		throw std::invalid_argument("Game settings must be an object.");
	}

	GameConfig config;
	config.boardSize = readUnsigned(j, "boardSize", static_cast<unsigned>(config.boardSize));
	config.handicap  = readUnsigned(j, "handicap", config.handicap);
	if (find(j, "komi")) {
		config.komi = readNumber(j, "komi", 0.0);
	}

	const auto ruleset = readString(j, "ruleset", std::string{toString(config.ruleset)});
	if (const auto parsed = rulesetFromString(ruleset)) {
		config.ruleset = *parsed;
	} else {
		throw std::invalid_argument(std::format("Unknown ruleset '{}'.", ruleset));
	}

	if (const auto* timeControl = find(j, "timeControl")) {
		config.timeControl = timeControlFromJson(*timeControl);
	}

	const auto gameType = readString(j, "gameType", "human");
	if (gameType == "human") {
		config.gameType = GameType::Human;
	} else if (gameType == "ai") {
		config.gameType = GameType::Ai;
	} else {
		throw std::invalid_argument(std::format("Unknown game type '{}'.", gameType));
	}

	const auto color = readString(j, "colorPreference", "black");
	if (color == "black") {
		config.colorPreference = ColorPreference::Black;
	} else if (color == "white") {
		config.colorPreference = ColorPreference::White;
	} else if (color == "random") {
		config.colorPreference = ColorPreference::Random;
	} else {
		throw std::invalid_argument(std::format("Unknown color preference '{}'.", color));
	}

	const auto level = readString(j, "aiLevel", std::string{ai::toString(config.aiLevel)});
	if (const auto parsed = ai::aiLevelFromString(level)) {
		config.aiLevel = *parsed;
	} else {
		throw std::invalid_argument(std::format("Unknown AI level '{}'.", level));
	}

	config.autoExtendDeadGroups = readBool(j, "autoExtendDeadGroups", false);

	config.validate();
	return config;
}

json toJson(const Clock::Config& timeControl) {
	return std::visit(
	        [](const auto& c) -> json {
		        using T = std::decay_t<decltype(c)>;
		        if constexpr (std::is_same_v<T, Clock::ByoYomi>) {
			        if (c.mainTime == milliseconds::zero() && c.periods == 0u) {
				        return json{{"mode", "none"}};
			        }
			        return json{{"mode", "standard"}, {"mainTime", toSeconds(c.mainTime)}, {"byoYomiTime", toSeconds(c.period)}, {"byoYomiPeriods", c.periods}};
		        } else if constexpr (std::is_same_v<T, Clock::Fischer>) {
			        return json{{"mode", "fischer"},
			                    {"mainTime", toSeconds(c.mainTime)},
			                    {"increment", toSeconds(c.increment)},
			                    {"byoYomiTime", toSeconds(c.period)},
			                    {"byoYomiPeriods", c.periods}};
		        } else {
			        return json{{"mode", "blitz"}, {"timePerMove", toSeconds(c.timePerMove)}};
		        }
	        },
	        timeControl);
}

json toJson(const GameConfig& config) {
	return json{
	        {"boardSize", config.boardSize},
	        {"ruleset", toString(config.ruleset)},
	        {"komi", config.effectiveKomi()},
	        {"handicap", config.handicap},
	        {"timeControl", toJson(config.timeControl)},
	        {"gameType", toString(config.gameType)},
	        {"colorPreference", toString(config.colorPreference)},
	        {"aiLevel", ai::toString(config.aiLevel)},
	        {"autoExtendDeadGroups", config.autoExtendDeadGroups},
	};
}

ServerConfig ServerConfig::fromJson(const json& j) {
	if (!j.is_object()) {
		throw std::invalid_argument("Server configuration must be an object.");
	}

	ServerConfig config;
	const auto port = readUnsigned(j, "port", config.port);
	if (port > 65535u) {
		throw std::invalid_argument("'port' must be in [0, 65535].");
	}
	config.port             = static_cast<std::uint16_t>(port);
	config.disconnectGrace  = readDuration(j, "disconnectGraceSeconds", config.disconnectGrace);
	config.tickInterval     = readDuration<std::milli>(j, "tickIntervalMs", config.tickInterval);
	config.heartbeatTimeout = readDuration(j, "heartbeatTimeoutSeconds", config.heartbeatTimeout);
	config.defaultBoardSize = readUnsigned(j, "defaultBoardSize", static_cast<unsigned>(config.defaultBoardSize));

	if (config.tickInterval == milliseconds::zero()) {
		throw std::invalid_argument("'tickIntervalMs' must be positive.");
	}
	if (config.defaultBoardSize < MIN_BOARD_SIZE || config.defaultBoardSize > MAX_BOARD_SIZE) {
		throw std::invalid_argument(std::format("'defaultBoardSize' must be in [{}, {}].", MIN_BOARD_SIZE, MAX_BOARD_SIZE));
	}

	if (const auto* engine = find(j, "ai")) {
		if (!engine->is_object()) {
			throw std::invalid_argument("'ai' must be an object.");
		}
		config.ai.program = readString(*engine, "program", config.ai.program);
		config.ai.model   = readString(*engine, "model", config.ai.model);
		config.ai.config  = readString(*engine, "config", config.ai.config);

		if (const auto* extra = find(*engine, "extraArguments")) {
			if (!extra->is_array()) {
				throw std::invalid_argument("'extraArguments' must be an array of strings.");
			}
			for (const auto& argument: *extra) {
				if (!argument.is_string()) {
					throw std::invalid_argument("'extraArguments' must be an array of strings.");
				}
				config.ai.extraArguments.push_back(argument.get<std::string>());
			}
		}

		config.ai.protocol.commandTimeout = readDuration(*engine, "commandTimeoutSeconds", config.ai.protocol.commandTimeout);
		config.ai.protocol.maxRetries     = readUnsigned(*engine, "maxRetries", config.ai.protocol.maxRetries);
		if (config.ai.program.empty()) {
			throw std::invalid_argument("'ai.program' must not be empty.");
		}
	}

	return config;
}

ServerConfig ServerConfig::load(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw std::runtime_error(std::format("Could not open configuration file '{}'.", path.string()));
	}

	const auto j = json::parse(file, nullptr, false);
	if (j.is_discarded()) {
		throw std::runtime_error(std::format("Configuration file '{}' is not valid JSON.", path.string()));
	}
	return fromJson(j);
}

} // namespace hoshi::app
