#pragma once

#include "Logger/Logger.hpp"

namespace gomoku::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace gomoku::network
