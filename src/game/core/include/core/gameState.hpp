#pragma once

#include "core/moveGenerator.hpp"
#include "core/pieceRegistry.hpp"
#include "core/terrain.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wiz {

//! Description of one resolved step in three redaction variants.
struct MoveRecord {
	std::string full;
	std::string firstView;
	std::string secondView;

	const std::string& viewFor(Side viewer) const; //!< Neutral viewers get the redacted text of a hidden move.

	bool operator==(const MoveRecord&) const = default;
};

//! Kinds of pieces lost, per owning side.
struct CaptureTally {
	std::vector<PieceKind> first;
	std::vector<PieceKind> second;
	std::vector<PieceKind> neutral;

	std::vector<PieceKind>& lostBy(Side side);
	const std::vector<PieceKind>& lostBy(Side side) const;
	std::size_t total() const;

	bool operator==(const CaptureTally&) const = default;
};

struct SeatInfo {
	std::string name; //!< Empty while nobody claimed the seat.
	bool ready{false};

	bool operator==(const SeatInfo&) const = default;
};

struct Seats {
	SeatInfo first;
	SeatInfo second;

	SeatInfo& of(Side side);
	const SeatInfo& of(Side side) const;
	bool bothReady() const;

	bool operator==(const Seats&) const = default;
};

enum class AttackMode { BeamShot, Melee };

//! An attack waiting for the defending side to guard or decline.
struct PendingGuard {
	PieceId attacker;
	Cell attackerOrigin;
	AttackMode mode;
	PieceId target;
	Cell targetCell;
	Side defender;
	std::vector<PieceId> guardians;

	bool operator==(const PendingGuard&) const = default;
};

struct IdleState {
	bool operator==(const IdleState&) const = default;
};
struct SelectedState {
	PieceId piece;
	Candidates candidates;

	bool operator==(const SelectedState&) const = default;
};
struct AwaitingGuardDecision {
	PendingGuard guard;

	bool operator==(const AwaitingGuardDecision&) const = default;
};
struct AwaitingWizardAttackChoice {
	PieceId wizard;
	Cell target;

	bool operator==(const AwaitingWizardAttackChoice&) const = default;
};
struct AwaitingBardSwapTarget {
	PieceId bard;
	Side actingSide;
	std::vector<Cell> partners;

	bool operator==(const AwaitingBardSwapTarget&) const = default;
};

//! Turn state machine. Alternative order matches TurnPhase.
using TurnState = std::variant<IdleState, SelectedState, AwaitingGuardDecision, AwaitingWizardAttackChoice, AwaitingBardSwapTarget>;

enum class TurnPhase { Idle, Selected, AwaitingGuardDecision, AwaitingWizardAttackChoice, AwaitingBardSwapTarget };

//! Everything needed to rebuild a game. This is the snapshot exchanged between participants.
struct GameState {
	PieceRegistry pieces;
	Terrain terrain;
	Side currentSide{Side::First};
	unsigned moveId{0u};
	std::vector<MoveRecord> history;
	CaptureTally captured;
	Seats seats;
	TurnState turn{IdleState{}};
	std::optional<Side> winner;
};

//! Initial layout, first side to move.
GameState makeInitialState();

} // namespace wiz
