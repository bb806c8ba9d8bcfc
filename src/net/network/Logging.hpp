#pragma once

#include "Logger/Logger.hpp"

namespace wiz::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wiz::network
