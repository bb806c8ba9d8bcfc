#pragma once

#include "app/IAppSignalListener.hpp"
#include "app/eventHub.hpp"
#include "core/game.hpp"
#include "network/client.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace wiz::app {

//! Owns the local engine of one participant.
//! Local decisions are applied to the engine and the resulting snapshot is published to the room.
//! Snapshots from the room replace the local state unconditionally (last one wins).
//! Without a relay connection the session plays hot-seat: every side may act and nothing is published.
//! Listeners subscribe to signals and query the session for the updated data.
class GameSession : public network::IClientHandler {
public:
	GameSession();
	~GameSession();

	void subscribe(IAppSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IAppSignalListener* listener);

	bool connect(const std::string& host, std::uint16_t port = network::core::DEFAULT_PORT);
	void disconnect();
	bool isConnected() const;
	bool joinRoom(const std::string& password);

	// Seats
	bool claimSeat(Side side, const std::string& name); //!< Take a free seat, or a seat already carrying this name.
	bool setReady(bool ready);                          //!< Readiness of the claimed seat.
	void resetGame();                                   //!< Back to the initial layout. Seat names survive.

	// Turn input. Declined when it is not this participant's decision.
	bool select(Cell cell);
	void deselect();
	bool choose(Cell cell);
	bool decideGuard(std::optional<PieceId> paladin);
	bool chooseWizardAttack(AttackMode mode);
	bool chooseBardSwap(Cell cell);

	// Getters
	GameState state() const;
	TurnPhase phase() const;
	Candidates candidates() const;
	BeamResult selectedBeam() const;
	std::optional<Side> localSide() const;
	Side viewer() const;                 //!< Side whose hidden information may be shown.
	std::optional<Side> decider() const; //!< Side whose input the engine waits for. Empty once decided.
	bool canAct() const;                 //!< This participant may give the next input.
	bool isOnline() const;               //!< Joined a room. Turn ownership is enforced.
	std::string lastError() const;

public: // Client listener handlers
	void onRoomJoined(const network::ServerRoomJoined& event) override;
	void onState(const network::ServerState& event) override;
	void onError(const network::ServerError& event) override;
	void onDisconnected() override;

private:
	bool canActLocked() const;
	std::optional<Side> deciderLocked() const;

	//! Run a state changing step under the lock. On success the snapshot is published.
	template <typename Step>
	bool commit(Step&& step, uint64_t mask = AS_StateChange);

	void publish(const Json::Value& snapshot);
	void fail(const std::string& message); //!< Remember the error and signal it.
	void signalMask(uint64_t mask);

private:
	network::Client m_network;
	EventHub m_eventHub;
	Game m_game;

	std::optional<Side> m_localSide;
	std::string m_localName;
	bool m_inRoom{false};
	std::string m_lastError;
	mutable std::mutex m_stateMutex;
};

} // namespace wiz::app
