#pragma once

#include "core/moveContext.hpp"

#include <vector>

namespace wiz {

using Candidates = std::vector<CandidateAction>;

Candidates generateWizardMoves(const Piece& wizard, const MoveContext& context);
Candidates generateApprenticeMoves(const Piece& apprentice, const MoveContext& context);
Candidates generateDragonMoves(const Piece& dragon, const MoveContext& context);
Candidates generateRangerMoves(const Piece& ranger, const MoveContext& context);
Candidates generateGriffinMoves(const Piece& griffin, const MoveContext& context);
Candidates generateAssassinMoves(const Piece& assassin, const MoveContext& context);
Candidates generatePaladinMoves(const Piece& paladin, const MoveContext& context);
Candidates generateBardMoves(const Piece& bard, const MoveContext& context);

//! Dispatch on the archetype of piece.
Candidates generateMoves(const Piece& piece, const MoveContext& context);

//! Origin and every cell passed by a straight slide, without the destination.
std::vector<Cell> slidePath(const BoardGraph& graph, Cell origin, Cell destination);

//! The paladin's own cell plus all adjacent cells.
std::vector<Cell> protectionZone(const BoardGraph& graph, const Piece& paladin);

//! Paladins of target's side, other than target, whose zone covers target's cell.
std::vector<PieceId> findGuardingPaladins(const BoardGraph& graph, const PieceRegistry& pieces, const Piece& target);

//! True if cell lies in the zone of any paladin of side.
bool isInPaladinZone(const BoardGraph& graph, const PieceRegistry& pieces, Cell cell, Side side);

} // namespace wiz
