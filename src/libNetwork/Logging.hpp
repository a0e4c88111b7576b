#pragma once

#include "Logger/Logger.hpp"

namespace tictac::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tictac::network
