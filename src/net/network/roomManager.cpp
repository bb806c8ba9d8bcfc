#include "roomManager.hpp"

namespace wiz::network {

Room& RoomManager::join(core::ConnectionId connectionId, const RoomPassword& password) {
	leave(connectionId);

	auto [it, created] = m_rooms.try_emplace(password);
	if (created) {
		it->second.password = password;
	}
	it->second.members.insert(connectionId);
	m_membership[connectionId] = password;
	return it->second;
}

void RoomManager::leave(core::ConnectionId connectionId) {
	const auto membership = m_membership.find(connectionId);
	if (membership == m_membership.end()) {
		return;
	}

	const auto room = m_rooms.find(membership->second);
	m_membership.erase(membership);
	if (room == m_rooms.end()) {
		return;
	}

	room->second.members.erase(connectionId);
	if (room->second.members.empty()) {
		m_rooms.erase(room);
	}
}

Room* RoomManager::roomOf(core::ConnectionId connectionId) {
	const auto membership = m_membership.find(connectionId);
	if (membership == m_membership.end()) {
		return nullptr;
	}
	const auto room = m_rooms.find(membership->second);
	return room == m_rooms.end() ? nullptr : &room->second;
}

const Room* RoomManager::find(const RoomPassword& password) const {
	const auto it = m_rooms.find(password);
	return it == m_rooms.end() ? nullptr : &it->second;
}

std::size_t RoomManager::roomCount() const {
	return m_rooms.size();
}

void RoomManager::forEachMember(const Room& room, const std::function<void(core::ConnectionId)>& visitor) const {
	for (const auto connectionId: room.members) {
		visitor(connectionId);
	}
}

} // namespace wiz::network
