#pragma once

#include "app/IAppSignalListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace wiz::app {

//! Fans session signals out to subscribed listeners.
class EventHub {
	struct SignalListenerEntry {
		IAppSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;          //!< What events the listener cares about.
	};

public:
	void subscribe(IAppSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IAppSignalListener* listener);
	void signal(AppSignal signal); //!< Notify every listener whose mask contains signal.

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
};

} // namespace wiz::app
