#pragma once

#include <cstddef>
#include <string>

namespace wiz::network {

using RoomPassword = std::string; //!< Rooms are keyed by their password. Empty is the default room.

inline constexpr std::size_t MAX_PASSWORD_BYTES = 128;

} // namespace wiz::network
