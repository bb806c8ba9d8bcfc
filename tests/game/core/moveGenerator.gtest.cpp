#include "core/moveGenerator.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace wiz::gtest {

namespace {

Cell at(int x, int y) {
	return *squareToCell({x, y});
}

bool has(const Candidates& candidates, ActionType type, Cell cell) {
	return std::find(candidates.begin(), candidates.end(), CandidateAction{type, cell}) != candidates.end();
}

bool hasAny(const Candidates& candidates, Cell cell) {
	return std::any_of(candidates.begin(), candidates.end(), [&](const CandidateAction& action) { return action.target == cell; });
}

struct Board {
	BoardGraph graph;
	PieceRegistry pieces;
	Terrain terrain;

	MoveContext context(Side side) const {
		return MoveContext{.graph = graph, .pieces = pieces, .terrain = terrain, .actingSide = side};
	}
	Candidates movesOf(PieceId id) const {
		const auto* piece = pieces.find(id);
		return generateMoves(*piece, context(piece->side));
	}
};

} // namespace

TEST(MoveGenerator, ApprenticeOpening) {
	Board board;
	board.pieces = makeInitialLayout();

	const auto* apprentice = board.pieces.pieceAt({10, 0});
	ASSERT_NE(apprentice, nullptr);
	const auto moves = generateMoves(*apprentice, board.context(Side::First));

	EXPECT_EQ(moves.size(), 3u);
	EXPECT_TRUE(has(moves, ActionType::Move, {9, 0}));
	EXPECT_TRUE(has(moves, ActionType::Move, {9, 1}));
	EXPECT_TRUE(has(moves, ActionType::Swap, {16, 0}));

	const auto* mirrored = board.pieces.pieceAt({6, 0});
	ASSERT_NE(mirrored, nullptr);
	const auto mirroredMoves = generateMoves(*mirrored, board.context(Side::Second));
	EXPECT_TRUE(has(mirroredMoves, ActionType::Move, {7, 0}));
	EXPECT_TRUE(has(mirroredMoves, ActionType::Move, {7, 1}));
	EXPECT_TRUE(has(mirroredMoves, ActionType::Swap, {0, 0}));
}

TEST(MoveGenerator, ApprenticeAttackAndUsedSwap) {
	Board board;
	board.pieces.add(PieceKind::Wizard, Side::First, at(8, 8));
	const auto id = board.pieces.add(PieceKind::Apprentice, Side::First, at(4, 4));
	board.pieces.add(PieceKind::Ranger, Side::Second, at(3, 4));
	board.pieces.add(PieceKind::Ranger, Side::Second, at(5, 4));
	std::get<ApprenticeData>(board.pieces.find(id)->payload).swapUsed = true;

	const auto moves = board.movesOf(id);
	EXPECT_TRUE(has(moves, ActionType::Attack, at(3, 4)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 3)));
	// Backwards is never offered.
	EXPECT_FALSE(hasAny(moves, at(5, 4)));
	EXPECT_FALSE(hasAny(moves, at(8, 8)));
	EXPECT_EQ(moves.size(), 2u);
}

TEST(MoveGenerator, WizardSwapsAndSteps) {
	Board board;
	board.pieces = makeInitialLayout();

	const auto* wizard = board.pieces.wizardOf(Side::First);
	const auto moves   = generateMoves(*wizard, board.context(Side::First));

	EXPECT_TRUE(has(moves, ActionType::Move, {15, 0}));
	EXPECT_TRUE(has(moves, ActionType::Move, {15, 1}));
	const auto swaps = std::count_if(moves.begin(), moves.end(), [](const CandidateAction& a) { return a.type == ActionType::Swap; });
	EXPECT_EQ(swaps, 7);
	EXPECT_EQ(std::count_if(moves.begin(), moves.end(), [](const CandidateAction& a) { return a.type == ActionType::Attack; }), 0);
}

TEST(MoveGenerator, DragonScorchAndLight) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Dragon, Side::First, at(4, 4));
	board.pieces.add(PieceKind::Apprentice, Side::Second, at(7, 4));
	board.terrain.addScorch({at(5, 4), 99u, Side::Second});
	board.terrain.addGuardLight(at(4, 5), Side::Second);

	const auto moves = board.movesOf(id);

	// Passes the scorch but may not stop on it.
	EXPECT_FALSE(hasAny(moves, at(5, 4)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(6, 4)));
	EXPECT_TRUE(has(moves, ActionType::Attack, at(7, 4)));
	EXPECT_FALSE(hasAny(moves, at(8, 4)));

	// Opposing guard light blocks the whole ray.
	for (int y = 5; y <= 8; ++y) {
		EXPECT_FALSE(hasAny(moves, at(4, y)));
	}
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 0)));
}

TEST(MoveGenerator, DragonFindsHiddenAssassinNotBard) {
	Board board;
	const auto id       = board.pieces.add(PieceKind::Dragon, Side::First, at(4, 4));
	const auto assassin = board.pieces.add(PieceKind::Assassin, Side::Second, at(6, 4));
	std::get<AssassinData>(board.pieces.find(assassin)->payload).stealthed = true;
	board.pieces.add(PieceKind::Bard, Side::Neutral, at(2, 4));

	const auto moves = board.movesOf(id);
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 4)));
	EXPECT_TRUE(has(moves, ActionType::Attack, at(6, 4)));
	EXPECT_FALSE(hasAny(moves, at(7, 4)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(3, 4)));
	EXPECT_FALSE(hasAny(moves, at(2, 4)));
	EXPECT_FALSE(hasAny(moves, at(1, 4)));
}

TEST(MoveGenerator, RangerCannon) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Ranger, Side::First, at(4, 2));

	// Friendly screen, enemy right behind.
	board.pieces.add(PieceKind::Apprentice, Side::First, at(4, 4));
	board.pieces.add(PieceKind::Paladin, Side::Second, at(4, 5));

	// Unactivated bard cannot screen.
	board.pieces.add(PieceKind::Bard, Side::Neutral, at(2, 2));
	board.pieces.add(PieceKind::Apprentice, Side::Second, at(1, 2));

	// Hidden enemy assassin is transparent.
	const auto assassin = board.pieces.add(PieceKind::Assassin, Side::Second, at(5, 2));
	std::get<AssassinData>(board.pieces.find(assassin)->payload).stealthed = true;
	board.pieces.add(PieceKind::Griffin, Side::Second, at(6, 2));
	board.pieces.add(PieceKind::Griffin, Side::Second, at(7, 2));

	const auto moves = board.movesOf(id);
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 3)));
	EXPECT_TRUE(has(moves, ActionType::Attack, at(4, 5)));
	EXPECT_FALSE(hasAny(moves, at(1, 2)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 2)));
	EXPECT_TRUE(has(moves, ActionType::Attack, at(7, 2)));
	EXPECT_FALSE(hasAny(moves, at(6, 2)));
}

TEST(MoveGenerator, GriffinRowsAndDiagonals) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Griffin, Side::First, at(4, 4));
	board.pieces.add(PieceKind::Ranger, Side::Second, at(7, 1));
	board.terrain.addScorch({at(2, 6), 5u, Side::First});

	const auto moves = board.movesOf(id);
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 3)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(6, 2)));
	EXPECT_TRUE(has(moves, ActionType::Attack, at(7, 1)));
	EXPECT_FALSE(hasAny(moves, at(8, 0)));

	EXPECT_TRUE(has(moves, ActionType::Move, at(3, 5)));
	EXPECT_FALSE(hasAny(moves, at(2, 6)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(1, 7)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(0, 8)));

	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 5)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(3, 3)));

	// No other lines.
	EXPECT_FALSE(hasAny(moves, at(5, 4)));
	EXPECT_FALSE(hasAny(moves, at(4, 5)));
	EXPECT_EQ(moves.size(), 8u);
}

TEST(MoveGenerator, AssassinTriangles) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Assassin, Side::First, at(4, 4));
	board.pieces.add(PieceKind::Ranger, Side::Second, at(6, 3));

	const auto moves = board.movesOf(id);
	EXPECT_EQ(moves.size(), 4u);
	EXPECT_TRUE(has(moves, ActionType::Attack, at(6, 3)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(3, 6)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(2, 5)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 2)));

	// Each destination closes a triangle with two adjacent neighbours on different rows.
	for (const auto& action: moves) {
		const auto& around = board.graph.neighbors(at(4, 4));
		const auto shared  = std::count_if(around.begin(), around.end(), [&](Cell c) { return board.graph.isAdjacent(c, action.target); });
		EXPECT_EQ(shared, 2);
	}
}

TEST(MoveGenerator, PaladinStopsOnScorch) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Paladin, Side::First, at(4, 4));
	board.terrain.addScorch({at(5, 4), 1u, Side::Second});
	board.terrain.addGuardLight(at(3, 4), Side::Second);
	board.terrain.addGuardLight(at(4, 5), Side::First);

	const auto moves = board.movesOf(id);
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 4)));
	EXPECT_FALSE(hasAny(moves, at(3, 4)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 5)));
	EXPECT_EQ(moves.size(), 5u);

	const auto zone = protectionZone(board.graph, *board.pieces.find(id));
	EXPECT_EQ(zone.size(), 7u);
	EXPECT_EQ(zone.front(), at(4, 4));
}

TEST(MoveGenerator, BardNeedsActivation) {
	Board board;
	const auto id = board.pieces.add(PieceKind::Bard, Side::Neutral, at(4, 4));
	board.pieces.add(PieceKind::Ranger, Side::First, at(5, 4));
	const auto hidden = board.pieces.add(PieceKind::Assassin, Side::Second, at(4, 3));
	std::get<AssassinData>(board.pieces.find(hidden)->payload).stealthed = true;
	const auto own = board.pieces.add(PieceKind::Assassin, Side::First, at(3, 4));
	std::get<AssassinData>(board.pieces.find(own)->payload).stealthed = true;

	EXPECT_TRUE(generateMoves(*board.pieces.find(id), board.context(Side::First)).empty());

	std::get<BardData>(board.pieces.find(id)->payload).activated = true;
	const auto moves = generateMoves(*board.pieces.find(id), board.context(Side::First));

	// Jump over the ranger.
	EXPECT_TRUE(has(moves, ActionType::Move, at(6, 4)));
	EXPECT_FALSE(hasAny(moves, at(5, 4)));
	// Onto a stealthed enemy assassin, never over or onto a friendly one.
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 3)));
	EXPECT_FALSE(hasAny(moves, at(3, 4)));
	EXPECT_FALSE(hasAny(moves, at(2, 4)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(4, 5)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(5, 3)));
	EXPECT_TRUE(has(moves, ActionType::Move, at(3, 5)));
	EXPECT_EQ(moves.size(), 5u);
}

TEST(MoveGenerator, GuardingPaladins) {
	Board board;
	const auto target = board.pieces.add(PieceKind::Apprentice, Side::Second, at(4, 4));
	const auto near   = board.pieces.add(PieceKind::Paladin, Side::Second, at(5, 4));
	board.pieces.add(PieceKind::Paladin, Side::Second, at(7, 4));
	board.pieces.add(PieceKind::Paladin, Side::First, at(3, 4));

	const auto guardians = findGuardingPaladins(board.graph, board.pieces, *board.pieces.find(target));
	ASSERT_EQ(guardians.size(), 1u);
	EXPECT_EQ(guardians.front(), near);

	// A paladin never guards itself.
	EXPECT_TRUE(findGuardingPaladins(board.graph, board.pieces, *board.pieces.find(near)).empty());
	EXPECT_TRUE(isInPaladinZone(board.graph, board.pieces, at(4, 4), Side::First));
	EXPECT_FALSE(isInPaladinZone(board.graph, board.pieces, at(0, 0), Side::First));
}

TEST(MoveGenerator, SlidePath) {
	const BoardGraph graph;

	const auto path = slidePath(graph, at(4, 4), at(7, 4));
	ASSERT_EQ(path.size(), 3u);
	EXPECT_EQ(path[0], at(4, 4));
	EXPECT_EQ(path[1], at(5, 4));
	EXPECT_EQ(path[2], at(6, 4));

	EXPECT_EQ(slidePath(graph, at(4, 4), at(4, 5)).size(), 1u);
	EXPECT_TRUE(slidePath(graph, at(4, 4), at(6, 5)).empty());
}

} // namespace wiz::gtest
