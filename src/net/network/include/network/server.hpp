#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>

namespace wiz::network {

//! Room relay.
//! Clients join a room by password and publish opaque snapshots. The relay stores the last
//! snapshot per room and rebroadcasts every publish to all members, sender included.
class Server {
public:
	Server();
	explicit Server(std::uint16_t port);
	~Server();

	Server(const Server&)            = delete;
	Server& operator=(const Server&) = delete;
	Server(Server&&)                 = delete;
	Server& operator=(Server&&)      = delete;

	bool start(); //!< Returns false if the port could not be bound.
	void stop();

	std::uint16_t port() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide networking protocol stuff.
};

} // namespace wiz::network
