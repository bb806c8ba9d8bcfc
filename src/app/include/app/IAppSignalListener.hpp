#pragma once

#include <cstdint>

namespace wiz::app {

//! Types of signals.
enum AppSignal : uint64_t {
	AS_None         = 0,
	AS_StateChange  = 1 << 0, //!< Game state changed. New step, snapshot or reset.
	AS_SeatChange   = 1 << 1, //!< Seat names or readiness changed.
	AS_RoomJoined   = 1 << 2, //!< Joined a relay room.
	AS_Error        = 1 << 3, //!< Relay or snapshot error. Query lastError().
	AS_Disconnected = 1 << 4, //!< Lost the relay connection.
};

class IAppSignalListener {
public:
	virtual ~IAppSignalListener()             = default;
	virtual void onAppEvent(AppSignal signal) = 0;
};

} // namespace wiz::app
