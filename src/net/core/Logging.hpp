#pragma once

#include "Logger/Logger.hpp"

namespace wiz::network::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wiz::network::core
