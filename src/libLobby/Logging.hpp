#pragma once

#include "Logger/Logger.hpp"

namespace tictac::lobby {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tictac::lobby
