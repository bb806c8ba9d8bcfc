#include "app/gameSession.hpp"

#include "Logging.hpp"
#include "app/snapshotCodec.hpp"

#include <format>
#include <utility>

namespace wiz::app {

GameSession::GameSession() {
	m_network.registerHandler(this);
}

GameSession::~GameSession() {
	disconnect();
}

void GameSession::signalMask(uint64_t mask) {
	for (uint64_t bit = 1; mask != 0; bit <<= 1) {
		if (mask & bit) {
			m_eventHub.signal(static_cast<AppSignal>(bit));
			mask &= ~bit;
		}
	}
}

void GameSession::subscribe(IAppSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void GameSession::unsubscribe(IAppSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}


bool GameSession::connect(const std::string& host, std::uint16_t port) {
	if (!m_network.connect(host, port)) {
		fail(std::format("Could not connect to {}:{}.", host, port));
		return false;
	}
	return true;
}

void GameSession::disconnect() {
	m_network.disconnect();
	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_inRoom = false;
}

bool GameSession::isConnected() const {
	return m_network.isConnected();
}

bool GameSession::joinRoom(const std::string& password) {
	if (password.size() > network::MAX_PASSWORD_BYTES) {
		fail(std::format("Room password exceeds {} bytes.", network::MAX_PASSWORD_BYTES));
		return false;
	}
	if (!m_network.joinRoom(password)) {
		fail("Not connected to a relay.");
		return false;
	}
	return true;
}


template <typename Step>
bool GameSession::commit(Step&& step, uint64_t mask) {
	std::optional<Json::Value> snapshot;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (!step()) {
			return false;
		}
		if (m_inRoom) {
			snapshot = toJson(m_game.state());
		}
	}

	if (snapshot) {
		publish(*snapshot);
	}
	signalMask(mask);
	return true;
}

bool GameSession::claimSeat(Side side, const std::string& name) {
	if (side == Side::Neutral || name.empty()) {
		return false;
	}

	return commit(
	        [&] {
		        auto& seats = m_game.mutableState().seats;
		        if (!seats.of(side).name.empty() && seats.of(side).name != name) {
			        return false;
		        }
		        // Moving to the other seat frees the previous one.
		        if (m_localSide && *m_localSide != side) {
			        seats.of(*m_localSide) = SeatInfo{};
		        }
		        seats.of(side).name = name;
		        m_localSide         = side;
		        m_localName         = name;
		        return true;
	        },
	        AS_SeatChange);
}

bool GameSession::setReady(bool ready) {
	return commit(
	        [&] {
		        if (!m_localSide) {
			        return false;
		        }
		        m_game.mutableState().seats.of(*m_localSide).ready = ready;
		        return true;
	        },
	        AS_SeatChange);
}

void GameSession::resetGame() {
	commit(
	        [&] {
		        m_game.reset();
		        return true;
	        },
	        AS_StateChange | AS_SeatChange);
	Logger().Log(Logging::LogLevel::Info, "[Session] Game reset.");
}


bool GameSession::select(Cell cell) {
	bool selected = false;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (!canActLocked()) {
			return false;
		}
		selected = m_game.select(cell);
	}
	signalMask(AS_StateChange);
	return selected;
}

void GameSession::deselect() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_game.deselect();
	}
	signalMask(AS_StateChange);
}

bool GameSession::choose(Cell cell) {
	return commit([&] { return canActLocked() && m_game.choose(cell); });
}

bool GameSession::decideGuard(std::optional<PieceId> paladin) {
	return commit([&] { return canActLocked() && m_game.decideGuard(paladin); });
}

bool GameSession::chooseWizardAttack(AttackMode mode) {
	return commit([&] { return canActLocked() && m_game.chooseWizardAttack(mode); });
}

bool GameSession::chooseBardSwap(Cell cell) {
	return commit([&] { return canActLocked() && m_game.chooseBardSwap(cell); });
}


GameState GameSession::state() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.state();
}

TurnPhase GameSession::phase() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.phase();
}

Candidates GameSession::candidates() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.candidates();
}

BeamResult GameSession::selectedBeam() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_game.selectedBeam();
}

std::optional<Side> GameSession::localSide() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_localSide;
}

Side GameSession::viewer() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	if (m_inRoom) {
		// Spectators without a seat only see what both sides see.
		return m_localSide.value_or(Side::Neutral);
	}
	return deciderLocked().value_or(m_game.currentSide());
}

std::optional<Side> GameSession::decider() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return deciderLocked();
}

bool GameSession::canAct() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return canActLocked();
}

bool GameSession::isOnline() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_inRoom;
}

std::string GameSession::lastError() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_lastError;
}

std::optional<Side> GameSession::deciderLocked() const {
	if (m_game.winner()) {
		return std::nullopt;
	}
	if (const auto* pending = std::get_if<AwaitingGuardDecision>(&m_game.state().turn)) {
		return pending->guard.defender;
	}
	return m_game.currentSide();
}

bool GameSession::canActLocked() const {
	const auto side = deciderLocked();
	if (!side) {
		return false;
	}
	if (!m_inRoom) {
		return true;
	}
	return m_localSide == side && m_game.state().seats.bothReady();
}


void GameSession::onRoomJoined(const network::ServerRoomJoined& event) {
	std::optional<Json::Value> snapshot;
	bool accepted = true;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_inRoom = true;

		if (event.state.isNull()) {
			// Fresh room: our state becomes the room's state.
			snapshot = toJson(m_game.state());
		} else if (auto decoded = fromJson(event.state)) {
			m_game.load(std::move(*decoded));
			if (m_localSide && m_game.state().seats.of(*m_localSide).name != m_localName) {
				m_localSide.reset();
			}
		} else {
			accepted = false;
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Joined room. Fresh: {}", event.state.isNull()));
	if (snapshot) {
		publish(*snapshot);
	}
	if (!accepted) {
		fail("The room holds an invalid game state.");
	}
	signalMask(AS_RoomJoined | AS_StateChange | AS_SeatChange);
}

void GameSession::onState(const network::ServerState& event) {
	auto decoded = fromJson(event.state);
	if (!decoded) {
		fail("Received an invalid game state.");
		return;
	}

	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_game.load(std::move(*decoded));
		if (m_localSide && m_game.state().seats.of(*m_localSide).name != m_localName) {
			Logger().Log(Logging::LogLevel::Warning, "[Session] Our seat was taken over.");
			m_localSide.reset();
		}
	}
	signalMask(AS_StateChange | AS_SeatChange);
}

void GameSession::onError(const network::ServerError& event) {
	fail(event.message);
}

void GameSession::onDisconnected() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_inRoom = false;
	}
	signalMask(AS_Disconnected);
}

void GameSession::publish(const Json::Value& snapshot) {
	if (!m_network.publish(snapshot)) {
		fail("Could not publish the game state.");
	}
}

void GameSession::fail(const std::string& message) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Session] {}", message));
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_lastError = message;
	}
	signalMask(AS_Error);
}

} // namespace wiz::app
