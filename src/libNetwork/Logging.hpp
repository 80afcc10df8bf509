#pragma once

#include "Logger/Logger.hpp"

namespace hoshi::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hoshi::network
