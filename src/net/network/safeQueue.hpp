#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace wiz::network {

//! Thread safe queue with a blocking Pop function.
template <class Entry>
class SafeQueue {
public:
	//! Push element onto the queue.
	void Push(Entry value);

	//! Blocks until there is an element to receive.
	//! Returns empty once the queue is released and drained.
	std::optional<Entry> Pop();

	bool Empty() const;

	//! Stop blocking the threads waiting in Pop.
	void Release();

private:
	std::deque<Entry> m_queue;
	mutable std::mutex m_mutex;
	std::condition_variable m_condition;
	std::atomic<bool> m_blockThreads{true};
};


template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
}

template <class Entry>
std::optional<Entry> SafeQueue<Entry>::Pop() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait(lock, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		return std::nullopt;
	}
	auto element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads = false;
	}
	m_condition.notify_all();
}

} // namespace wiz::network
