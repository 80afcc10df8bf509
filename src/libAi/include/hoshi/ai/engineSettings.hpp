#pragma once

#include "hoshi/ai/gtpEngine.hpp"
#include "hoshi/ai/processChannel.hpp"

#include <asio.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoshi::ai {

enum class AiLevel { Easy, Normal, Hard, Pro };

std::string_view toString(AiLevel level);
std::optional<AiLevel> aiLevelFromString(std::string_view name);

//! Search budget handed to the engine.
struct SearchLimits {
	unsigned maxVisits;
	double maxTimeSeconds;
	unsigned threads;
};

//! Budget of a level, scaled for the board size. Larger boards get fewer visits but more time.
SearchLimits searchLimits(AiLevel level, std::size_t boardSize);

//! Where to find the engine and how to talk to it.
struct EngineSettings {
	std::string program{"katago"};
	std::string model;                       //!< Neural network file. Omitted from the command line if empty.
	std::string config;                      //!< Engine configuration file. Omitted if empty.
	std::vector<std::string> extraArguments; //!< Appended as given.
	GtpEngine::Settings protocol{};
};

//! Command line starting the engine in GTP mode with the search limits of the level.
ProcessChannel::Command engineCommand(const EngineSettings& settings, AiLevel level, std::size_t boardSize);

//! Spawn an engine process for one game.
//! \throws std::runtime_error if the engine cannot be started.
std::shared_ptr<GtpEngine> launchEngine(asio::io_context& ioContext, const EngineSettings& settings, AiLevel level, std::size_t boardSize);

} // namespace hoshi::ai
