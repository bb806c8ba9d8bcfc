#include "app/eventHub.hpp"

#include <algorithm>

namespace wiz::app {

void EventHub::subscribe(IAppSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	const auto it = std::find_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; });
	if (it != m_signalListeners.end()) {
		it->signalMask |= signalMask;
		return;
	}
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IAppSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::signal(AppSignal signal) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (const auto& [listener, signalMask]: m_signalListeners) {
		if (signalMask & signal) {
			listener->onAppEvent(signal);
		}
	}
}

} // namespace wiz::app
