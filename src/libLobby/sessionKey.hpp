#pragma once

#include <string>

namespace tictac::lobby {

//! Random 128 bit value as lowercase hex. Used for session and game ids.
std::string CreateSessionKey();

} // namespace tictac::lobby
