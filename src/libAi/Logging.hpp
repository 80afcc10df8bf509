#pragma once

#include "Logger/Logger.hpp"

namespace hoshi::ai {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hoshi::ai
