#pragma once

#include "core/boardGraph.hpp"
#include "core/pieceRegistry.hpp"
#include "core/terrain.hpp"

namespace wiz {

enum class ActionType { Move, Swap, Attack };

//! A legal action for the selected piece, tagged with its destination.
struct CandidateAction {
	ActionType type;
	Cell target;

	bool operator==(const CandidateAction&) const = default;
};

//! Read-only view of the board used by move generation and beam tracing.
struct MoveContext {
	const BoardGraph& graph;
	const PieceRegistry& pieces;
	const Terrain& terrain;
	Side actingSide; //!< Side of the piece, or the side to move for the neutral bard.
};

//! The side a piece acts for when the side to move selects it.
inline constexpr Side actingSideFor(const Piece& piece, Side sideToMove) {
	return piece.side == Side::Neutral ? sideToMove : piece.side;
}

} // namespace wiz
