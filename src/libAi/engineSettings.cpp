#include "hoshi/ai/engineSettings.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace hoshi::ai {

std::string_view toString(const AiLevel level) {
	switch (level) {
	case AiLevel::Easy:
		return "easy";
	case AiLevel::Normal:
		return "normal";
	case AiLevel::Hard:
		return "hard";
	case AiLevel::Pro:
		return "pro";
	}
	return "normal";
}

std::optional<AiLevel> aiLevelFromString(const std::string_view name) {
	for (const auto level: {AiLevel::Easy, AiLevel::Normal, AiLevel::Hard, AiLevel::Pro}) {
		if (toString(level) == name) {
			return level;
		}
	}
	return std::nullopt;
}

SearchLimits searchLimits(const AiLevel level, const std::size_t boardSize) {
	SearchLimits limits{};
	switch (level) {
	case AiLevel::Easy:
		limits = {.maxVisits = 50u, .maxTimeSeconds = 1.0, .threads = 1u};
		break;
	case AiLevel::Normal:
		limits = {.maxVisits = 100u, .maxTimeSeconds = 3.0, .threads = 1u};
		break;
	case AiLevel::Hard:
		limits = {.maxVisits = 200u, .maxTimeSeconds = 5.0, .threads = 2u};
		break;
	case AiLevel::Pro:
		limits = {.maxVisits = 400u, .maxTimeSeconds = 8.0, .threads = 2u};
		break;
	}

	double visitScale = 1.0;
	double timeScale  = 1.0;
	switch (boardSize) {
	case 9u:
		break;
	case 13u:
		visitScale = 0.8;
		timeScale  = 1.5;
		break;
	case 15u:
		visitScale = 0.7;
		timeScale  = 2.0;
		break;
	case 19u:
		visitScale = 0.5;
		timeScale  = 3.0;
		break;
	default: {
		// Interpolate on the area relative to 9x9.
		const auto ratio = static_cast<double>(boardSize * boardSize) / 81.0;
		visitScale       = std::max(0.3, 1.0 / std::sqrt(ratio));
		timeScale        = std::min(5.0, 1.0 + std::log(ratio));
		break;
	}
	}

	limits.maxVisits      = std::max(1u, static_cast<unsigned>(limits.maxVisits * visitScale));
	limits.maxTimeSeconds = limits.maxTimeSeconds * timeScale;
	return limits;
}

ProcessChannel::Command engineCommand(const EngineSettings& settings, const AiLevel level, const std::size_t boardSize) {
	const auto limits = searchLimits(level, boardSize);

	ProcessChannel::Command command{.program = settings.program, .arguments = {"gtp"}};
	if (!settings.model.empty()) {
		command.arguments.insert(command.arguments.end(), {"-model", settings.model});
	}
	if (!settings.config.empty()) {
		command.arguments.insert(command.arguments.end(), {"-config", settings.config});
	}
	command.arguments.push_back("-override-config");
	command.arguments.push_back(std::format("maxVisits={},maxPlayouts={},maxTime={},numSearchThreads={}", limits.maxVisits, limits.maxVisits,
	                                        limits.maxTimeSeconds, limits.threads));
	command.arguments.insert(command.arguments.end(), settings.extraArguments.begin(), settings.extraArguments.end());
	return command;
}

std::shared_ptr<GtpEngine> launchEngine(asio::io_context& ioContext, const EngineSettings& settings, const AiLevel level, const std::size_t boardSize) {
	auto command = engineCommand(settings, level, boardSize);
	auto engine  = std::make_shared<GtpEngine>(
            ioContext, [&ioContext, command]() -> std::shared_ptr<IEngineChannel> { return std::make_shared<ProcessChannel>(ioContext, command); },
            settings.protocol);

	if (!engine->start()) {
		throw std::runtime_error(std::format("Could not start AI engine '{}'.", settings.program));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[AI] Engine '{}' started for {}x{} at level '{}'.", settings.program, boardSize, boardSize, toString(level)));
	return engine;
}

} // namespace hoshi::ai
