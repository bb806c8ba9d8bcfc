#pragma once

#include "network/core/protocol.hpp"
#include "network/types.hpp"

#include <json/json.h>

#include <functional>
#include <optional>
#include <set>
#include <unordered_map>

namespace wiz::network {

struct Room {
	RoomPassword password;
	std::set<core::ConnectionId> members;
	Json::Value state; //!< Last published snapshot. Null until somebody publishes.
};

//! Rooms keyed by password and the membership of every connection.
//! \note Used from the relay thread only.
class RoomManager {
public:
	Room& join(core::ConnectionId connectionId, const RoomPassword& password); //!< Create or join. Leaves the previous room first.
	void leave(core::ConnectionId connectionId);                                //!< Leave the current room. Empty rooms are removed.

	Room* roomOf(core::ConnectionId connectionId);
	const Room* find(const RoomPassword& password) const;
	std::size_t roomCount() const;

	void forEachMember(const Room& room, const std::function<void(core::ConnectionId)>& visitor) const;

private:
	std::unordered_map<RoomPassword, Room> m_rooms;
	std::unordered_map<core::ConnectionId, RoomPassword> m_membership;
};

} // namespace wiz::network
