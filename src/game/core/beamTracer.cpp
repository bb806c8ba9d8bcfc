#include "core/beamTracer.hpp"

#include <set>

namespace wiz {

namespace {

//! Pieces reachable from origin by a straight link of length 1 or 2 that satisfy accept.
template <class Predicate>
std::vector<const Piece*> findLinks(Cell origin, const MoveContext& context, Predicate accept) {
	std::vector<const Piece*> links;

	for (const auto& direction: LATTICE_DIRECTIONS) {
		for (int distance = 1; distance <= 2; ++distance) {
			const auto endpoint = context.graph.step(origin, direction, distance);
			if (!endpoint || context.terrain.hasOpposingLight(*endpoint, context.actingSide)) {
				continue;
			}
			if (distance == 2) {
				const auto midpoint = context.graph.step(origin, direction, 1);
				if (!midpoint || context.pieces.pieceAt(*midpoint, context.actingSide) ||
				    context.terrain.hasOpposingLight(*midpoint, context.actingSide)) {
					continue;
				}
			}

			const auto* piece = context.pieces.pieceAt(*endpoint, context.actingSide);
			if (piece && accept(*piece)) {
				links.push_back(piece);
			}
		}
	}
	return links;
}

} // namespace

bool isConductor(const Piece& piece, const Side wizardSide) {
	if (piece.kind() == PieceKind::Apprentice) {
		return piece.side == wizardSide;
	}
	if (piece.isActivatedBard()) {
		return piece.side == wizardSide || piece.side == Side::Neutral;
	}
	return false;
}

BeamResult traceBeam(const Piece& wizard, const MoveContext& context) {
	BeamResult result{.path = {wizard.cell}, .target = std::nullopt};

	const auto side = context.actingSide;
	std::set<PieceId> visited{wizard.id};

	const auto isFreshConductor = [&](const Piece& piece) { return isConductor(piece, side) && !visited.contains(piece.id); };
	const auto isTarget         = [&](const Piece& piece) { return isEnemy(piece, side) && piece.kind() != PieceKind::Bard; };

	const auto first = findLinks(wizard.cell, context, isFreshConductor);
	if (first.size() != 1u) {
		return result;
	}

	const Piece* current = first.front();
	visited.insert(current->id);
	result.path.push_back(current->cell);

	// Every step consumes a conductor, so the chain is bounded by the piece count.
	while (true) {
		const auto enemies    = findLinks(current->cell, context, isTarget);
		const auto conductors = findLinks(current->cell, context, isFreshConductor);

		if (enemies.size() > 1u || conductors.size() > 1u) {
			return result;
		}
		if (enemies.size() == 1u) {
			result.target = enemies.front()->cell;
			result.path.push_back(*result.target);
			return result;
		}
		if (conductors.empty()) {
			return result;
		}

		current = conductors.front();
		visited.insert(current->id);
		result.path.push_back(current->cell);
	}
}

} // namespace wiz
