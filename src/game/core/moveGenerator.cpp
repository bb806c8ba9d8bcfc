#include "core/moveGenerator.hpp"
#include "core/beamTracer.hpp"

#include <algorithm>
#include <array>

namespace wiz {

namespace {

constexpr std::array<Direction, 2> FORWARD_FIRST{{{-1, 0}, {0, -1}}};
constexpr std::array<Direction, 2> FORWARD_SECOND{{{1, 0}, {0, 1}}};
constexpr std::array<Direction, 2> TRUE_DIAGONALS{{{1, 1}, {-1, -1}}};
constexpr std::array<Direction, 4> ASSASSIN_JUMPS{{{2, -1}, {-1, 2}, {-2, 1}, {1, -2}}};

void push(Candidates& out, ActionType type, Cell target) {
	const CandidateAction action{type, target};
	if (std::find(out.begin(), out.end(), action) == out.end()) {
		out.push_back(action);
	}
}

//! Single step onto cell: move if it looks empty, attack if it holds a visible enemy.
void addStep(Candidates& out, const Piece& piece, const MoveContext& context, Cell cell, bool mayAttack = true) {
	if (!context.terrain.canStop(cell, context.actingSide, piece.kind())) {
		return;
	}
	const auto* occupant = context.pieces.pieceAt(cell, context.actingSide);
	if (!occupant) {
		push(out, ActionType::Move, cell);
	} else if (mayAttack && isEnemy(*occupant, context.actingSide)) {
		push(out, ActionType::Attack, cell);
	}
}

void addStep(Candidates& out, const Piece& piece, const MoveContext& context, Direction direction, bool mayAttack = true) {
	if (const auto cell = context.graph.step(piece.cell, direction)) {
		addStep(out, piece, context, *cell, mayAttack);
	}
}

//! Unlimited slide. Scorch may be crossed, the first visible piece stops the slide.
void addSlide(Candidates& out, const Piece& piece, const MoveContext& context, Direction direction) {
	auto cell = context.graph.step(piece.cell, direction);
	while (cell && context.terrain.canPass(*cell, context.actingSide)) {
		const auto* occupant = context.pieces.pieceAt(*cell, context.actingSide);
		const bool stoppable = context.terrain.canStop(*cell, context.actingSide, piece.kind());
		if (occupant) {
			if (stoppable && isEnemy(*occupant, context.actingSide)) {
				push(out, ActionType::Attack, *cell);
			}
			return;
		}
		if (stoppable) {
			push(out, ActionType::Move, *cell);
		}
		cell = context.graph.step(*cell, direction);
	}
}

} // namespace

Candidates generateWizardMoves(const Piece& wizard, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: LATTICE_DIRECTIONS) {
		addStep(out, wizard, context, direction, false);
	}

	for (const auto* piece: context.pieces.all()) {
		if (piece->side != wizard.side) {
			continue;
		}
		const auto* apprentice = std::get_if<ApprenticeData>(&piece->payload);
		if (apprentice && !apprentice->swapUsed) {
			push(out, ActionType::Swap, piece->cell);
		}
	}

	if (const auto beam = traceBeam(wizard, context); beam.target) {
		push(out, ActionType::Attack, *beam.target);
	}
	return out;
}

Candidates generateApprenticeMoves(const Piece& apprentice, const MoveContext& context) {
	Candidates out;
	const auto& forward = apprentice.side == Side::First ? FORWARD_FIRST : FORWARD_SECOND;
	for (const auto& direction: forward) {
		addStep(out, apprentice, context, direction);
	}

	const auto* data   = std::get_if<ApprenticeData>(&apprentice.payload);
	const auto* wizard = context.pieces.wizardOf(apprentice.side);
	if (data && !data->swapUsed && wizard) {
		push(out, ActionType::Swap, wizard->cell);
	}
	return out;
}

Candidates generateDragonMoves(const Piece& dragon, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: LATTICE_DIRECTIONS) {
		auto cell = context.graph.step(dragon.cell, direction);
		while (cell && context.terrain.canPass(*cell, context.actingSide)) {
			const bool stoppable = context.terrain.canStop(*cell, context.actingSide, PieceKind::Dragon);

			// Physical lookup: the dragon runs into hidden assassins.
			if (const auto* occupant = context.pieces.pieceAt(*cell)) {
				if (stoppable && isEnemy(*occupant, context.actingSide) && occupant->kind() != PieceKind::Bard) {
					push(out, ActionType::Attack, *cell);
				}
				break;
			}
			if (stoppable) {
				push(out, ActionType::Move, *cell);
			}
			cell = context.graph.step(*cell, direction);
		}
	}
	return out;
}

Candidates generateRangerMoves(const Piece& ranger, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: LATTICE_DIRECTIONS) {
		addStep(out, ranger, context, direction);
	}

	// Cannon: jump a screen and capture the enemy right behind it.
	for (const auto& direction: LATTICE_DIRECTIONS) {
		const Piece* screen = nullptr;
		for (auto cell = context.graph.step(ranger.cell, direction); cell; cell = context.graph.step(*cell, direction)) {
			if ((screen = context.pieces.pieceAt(*cell, context.actingSide))) {
				break;
			}
		}
		if (!screen || (screen->kind() == PieceKind::Bard && !screen->isActivatedBard())) {
			continue;
		}

		const auto landing = context.graph.step(screen->cell, direction);
		if (!landing || !context.terrain.canStop(*landing, context.actingSide, PieceKind::Ranger)) {
			continue;
		}
		const auto* target = context.pieces.pieceAt(*landing, context.actingSide);
		if (target && isEnemy(*target, context.actingSide)) {
			push(out, ActionType::Attack, *landing);
		}
	}
	return out;
}

Candidates generateGriffinMoves(const Piece& griffin, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: ROW_DIRECTIONS) {
		addSlide(out, griffin, context, direction);
	}
	for (const auto& direction: TRUE_DIAGONALS) {
		addStep(out, griffin, context, direction);
	}
	return out;
}

Candidates generateAssassinMoves(const Piece& assassin, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: ASSASSIN_JUMPS) {
		addStep(out, assassin, context, direction);
	}
	return out;
}

Candidates generatePaladinMoves(const Piece& paladin, const MoveContext& context) {
	Candidates out;
	for (const auto& direction: LATTICE_DIRECTIONS) {
		addStep(out, paladin, context, direction);
	}
	return out;
}

Candidates generateBardMoves(const Piece& bard, const MoveContext& context) {
	Candidates out;
	if (!bard.isActivatedBard()) {
		return out;
	}

	for (const auto& direction: LATTICE_DIRECTIONS) {
		const auto cell = context.graph.step(bard.cell, direction);
		if (!cell) {
			continue;
		}

		const auto* jumped = context.pieces.pieceAt(*cell, context.actingSide);
		if (!jumped) {
			// Also lands on a stealthed enemy assassin, which only looks empty.
			addStep(out, bard, context, *cell, false);
			continue;
		}
		if ((jumped->kind() == PieceKind::Bard && !jumped->isActivatedBard()) || jumped->isHidden()) {
			continue;
		}
		if (const auto landing = context.graph.step(*cell, direction)) {
			addStep(out, bard, context, *landing, false);
		}
	}
	return out;
}

Candidates generateMoves(const Piece& piece, const MoveContext& context) {
	switch (piece.kind()) {
	case PieceKind::Wizard:
		return generateWizardMoves(piece, context);
	case PieceKind::Apprentice:
		return generateApprenticeMoves(piece, context);
	case PieceKind::Dragon:
		return generateDragonMoves(piece, context);
	case PieceKind::Ranger:
		return generateRangerMoves(piece, context);
	case PieceKind::Griffin:
		return generateGriffinMoves(piece, context);
	case PieceKind::Assassin:
		return generateAssassinMoves(piece, context);
	case PieceKind::Paladin:
		return generatePaladinMoves(piece, context);
	case PieceKind::Bard:
		return generateBardMoves(piece, context);
	case PieceKind::Count:
		break;
	}
	return {};
}

std::vector<Cell> slidePath(const BoardGraph& graph, const Cell origin, const Cell destination) {
	for (const auto& direction: LATTICE_DIRECTIONS) {
		std::vector<Cell> path{origin};
		for (auto cell = graph.step(origin, direction); cell; cell = graph.step(*cell, direction)) {
			if (*cell == destination) {
				return path;
			}
			path.push_back(*cell);
		}
	}
	return {};
}

std::vector<Cell> protectionZone(const BoardGraph& graph, const Piece& paladin) {
	std::vector<Cell> zone{paladin.cell};
	const auto& neighbors = graph.neighbors(paladin.cell);
	zone.insert(zone.end(), neighbors.begin(), neighbors.end());
	return zone;
}

std::vector<PieceId> findGuardingPaladins(const BoardGraph& graph, const PieceRegistry& pieces, const Piece& target) {
	std::vector<PieceId> guardians;
	if (target.side == Side::Neutral) {
		return guardians;
	}
	for (const auto* piece: pieces.all()) {
		if (piece->id == target.id || piece->side != target.side || piece->kind() != PieceKind::Paladin) {
			continue;
		}
		if (piece->cell == target.cell || graph.isAdjacent(piece->cell, target.cell)) {
			guardians.push_back(piece->id);
		}
	}
	return guardians;
}

bool isInPaladinZone(const BoardGraph& graph, const PieceRegistry& pieces, const Cell cell, const Side side) {
	const auto all = pieces.all();
	return std::any_of(all.begin(), all.end(), [&](const Piece* piece) {
		return piece->side == side && piece->kind() == PieceKind::Paladin && (piece->cell == cell || graph.isAdjacent(piece->cell, cell));
	});
}

} // namespace wiz
