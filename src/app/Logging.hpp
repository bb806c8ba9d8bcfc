#pragma once

#include "Logger/Logger.hpp"

namespace wiz::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wiz::app
