#pragma once

#include "Logger/Logger.hpp"

namespace hoshi::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hoshi::app
