#pragma once

#include "Logger/Logger.hpp"

namespace gomoku::network::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace gomoku::network::core
