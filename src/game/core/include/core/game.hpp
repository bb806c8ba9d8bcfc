#pragma once

#include "core/beamTracer.hpp"
#include "core/boardGraph.hpp"
#include "core/gameState.hpp"

#include <optional>
#include <string>

namespace wiz {

//! Side whose wizard still stands while the other one is gone. Empty for both or none.
std::optional<Side> detectWinner(const PieceRegistry& pieces);

//! Turn resolution engine.
//! Drives the turn state machine over a GameState. Inputs that do not fit the current
//! state are declined: the call returns false and nothing is resolved.
class Game {
public:
	Game();
	explicit Game(GameState state);

	void reset();              //!< Initial layout. Seat names survive, readiness is cleared.
	void load(GameState state); //!< Replace the whole state by a snapshot. A plain selection is dropped.

	const GameState& state() const;
	GameState& mutableState(); //!< Seat and readiness bookkeeping. Not for rules changes.
	const BoardGraph& graph() const;

	TurnPhase phase() const;
	Side currentSide() const;
	std::optional<Side> winner() const;

	Candidates candidates() const; //!< Candidates of the selected piece. Empty when nothing is selected.
	BeamResult selectedBeam() const; //!< Beam of the selected wizard, for display.

	bool select(Cell cell);                              //!< Idle/Selected: select an own or the neutral piece.
	void deselect();                                     //!< Selected -> Idle.
	bool choose(Cell cell);                              //!< Selected: apply the candidate on cell.
	bool decideGuard(std::optional<PieceId> paladin);    //!< Guard with paladin, or decline with nullopt.
	bool chooseWizardAttack(AttackMode mode);            //!< Beam shot or melee step on an adjacent target.
	bool chooseBardSwap(Cell cell);                      //!< Forced swap partner after a bard move.

private:
	MoveContext contextFor(const Piece& piece) const;

	bool resolveMove(Piece& piece, Cell destination);
	bool resolveSwap(Piece& piece, Cell partnerCell);
	bool beginAttack(Piece& attacker, Cell targetCell, AttackMode mode);
	void executeAttack(Piece& attacker, const Piece& target, AttackMode mode);
	void enterBardSwap(const Piece& bard, Side actingSide);

	void capture(const Piece& victim);                                    //!< Remove, tally, activate bards, erase scorch.
	void relocate(Piece& piece, Cell destination);                        //!< Move with stealth and paladin side effects.
	void revealInZones(Piece& moved);                                     //!< Paladin-zone assassin reveal.
	void followScorch(const Piece& dragon, Cell origin, Cell destination); //!< New trail for a moved dragon.

	void record(Side actor, bool hidden, const std::string& full, const std::string& hiddenText);
	std::string describe(const Piece& piece, Cell cell) const;

	void finishTurn(std::optional<GuardLight> freshLight = std::nullopt); //!< Win check and side handoff.

private:
	BoardGraph m_graph;
	GameState m_state;
};

} // namespace wiz
