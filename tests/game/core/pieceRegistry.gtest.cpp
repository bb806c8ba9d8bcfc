#include "core/pieceRegistry.hpp"

#include <gtest/gtest.h>

namespace wiz::gtest {

TEST(PieceRegistry, InitialLayout) {
	const auto pieces = makeInitialLayout();

	ASSERT_EQ(pieces.size(), 33u);

	unsigned first = 0u, second = 0u, neutral = 0u;
	for (const auto* piece: pieces.all()) {
		switch (piece->side) {
		case Side::First:
			++first;
			break;
		case Side::Second:
			++second;
			break;
		case Side::Neutral:
			++neutral;
			break;
		}
	}
	EXPECT_EQ(first, 16u);
	EXPECT_EQ(second, 16u);
	EXPECT_EQ(neutral, 1u);

	const auto* bard = pieces.pieceAt({8, 4});
	ASSERT_NE(bard, nullptr);
	EXPECT_EQ(bard->kind(), PieceKind::Bard);
	EXPECT_EQ(bard->side, Side::Neutral);
	EXPECT_FALSE(bard->isActivatedBard());

	ASSERT_NE(pieces.wizardOf(Side::First), nullptr);
	ASSERT_NE(pieces.wizardOf(Side::Second), nullptr);
	EXPECT_EQ(pieces.wizardOf(Side::First)->cell, (Cell{16, 0}));
	EXPECT_EQ(pieces.wizardOf(Side::Second)->cell, (Cell{0, 0}));
}

TEST(PieceRegistry, InitialLayoutMirrored) {
	const auto pieces = makeInitialLayout();

	for (const auto* piece: pieces.all()) {
		if (piece->side != Side::First) {
			continue;
		}
		const auto* mirror = pieces.pieceAt({16 - piece->cell.row, piece->cell.col});
		ASSERT_NE(mirror, nullptr);
		EXPECT_EQ(mirror->side, Side::Second);
		EXPECT_EQ(mirror->kind(), piece->kind());
	}
}

TEST(PieceRegistry, DragonTagIsStable) {
	PieceRegistry pieces;
	pieces.add(PieceKind::Wizard, Side::First, {16, 0});
	const auto id = pieces.add(PieceKind::Dragon, Side::First, {14, 1});

	const auto* dragon = pieces.find(id);
	ASSERT_NE(dragon, nullptr);
	EXPECT_EQ(std::get<DragonData>(dragon->payload).tag, id);
}

TEST(PieceRegistry, Visibility) {
	PieceRegistry pieces;
	const auto id = pieces.add(PieceKind::Assassin, Side::First, {8, 4});
	std::get<AssassinData>(pieces.find(id)->payload).stealthed = true;

	EXPECT_NE(pieces.pieceAt({8, 4}), nullptr);
	EXPECT_NE(pieces.pieceAt({8, 4}, Side::First), nullptr);
	EXPECT_EQ(pieces.pieceAt({8, 4}, Side::Second), nullptr);

	// Exit is deferred: still hidden until the marker is resolved.
	auto& data     = std::get<AssassinData>(pieces.find(id)->payload);
	data.stealthed = false;
	data.stealthExpiresOnSide = Side::Second;
	EXPECT_EQ(pieces.pieceAt({8, 4}, Side::Second), nullptr);

	data.stealthExpiresOnSide.reset();
	EXPECT_NE(pieces.pieceAt({8, 4}, Side::Second), nullptr);
}

TEST(PieceRegistry, InsertRemove) {
	PieceRegistry pieces;
	const auto id = pieces.add(PieceKind::Ranger, Side::First, {8, 4});

	EXPECT_FALSE(pieces.insert(Piece{.id = id, .side = Side::First, .cell = {8, 5}, .payload = RangerData{}}));
	EXPECT_FALSE(pieces.insert(Piece{.id = 40u, .side = Side::First, .cell = {8, 4}, .payload = RangerData{}}));
	EXPECT_TRUE(pieces.insert(Piece{.id = 40u, .side = Side::Second, .cell = {8, 5}, .payload = RangerData{}}));
	EXPECT_EQ(pieces.nextId(), 41u);

	EXPECT_TRUE(pieces.remove(id));
	EXPECT_FALSE(pieces.remove(id));
	EXPECT_EQ(pieces.find(id), nullptr);
	EXPECT_EQ(pieces.pieceAt({8, 4}), nullptr);
	EXPECT_EQ(pieces.size(), 1u);
}

// Two inverse displacements restore the stealth flag.
TEST(PieceRegistry, StealthParity) {
	const Square a{4, 4};
	const Square towardsSecond{2, 5}; // Row - 1
	const Square towardsFirst{6, 3};  // Row + 1

	for (const auto side: {Side::First, Side::Second}) {
		for (const bool initial: {false, true}) {
			Piece assassin{.id = 1u, .side = side, .cell = {8, 4}, .payload = AssassinData{.stealthed = initial}};

			// Pick the displacement that toggles from the initial state.
			const bool enterTowardsSecond = side == Side::First;
			const auto b                  = (initial != enterTowardsSecond) ? towardsSecond : towardsFirst;

			EXPECT_TRUE(updateStealth(assassin, a, b));
			EXPECT_NE(std::get<AssassinData>(assassin.payload).stealthed, initial);
			EXPECT_TRUE(updateStealth(assassin, b, a));
			EXPECT_EQ(std::get<AssassinData>(assassin.payload).stealthed, initial);
		}
	}
}

TEST(PieceRegistry, StealthDirection) {
	Piece first{.id = 1u, .side = Side::First, .cell = {8, 4}, .payload = AssassinData{}};
	Piece second{.id = 2u, .side = Side::Second, .cell = {8, 4}, .payload = AssassinData{}};

	// Row decreases by one: towards the second side.
	EXPECT_TRUE(updateStealth(first, {4, 4}, {2, 5}));
	EXPECT_TRUE(std::get<AssassinData>(first.payload).stealthed);
	EXPECT_FALSE(updateStealth(second, {4, 4}, {2, 5}));
	EXPECT_FALSE(std::get<AssassinData>(second.payload).stealthed);

	EXPECT_TRUE(updateStealth(second, {4, 4}, {6, 3}));
	EXPECT_TRUE(std::get<AssassinData>(second.payload).stealthed);

	// Exit keeps the assassin hidden from the opponent until its turn completes.
	EXPECT_TRUE(updateStealth(first, {2, 5}, {4, 4}));
	EXPECT_FALSE(std::get<AssassinData>(first.payload).stealthed);
	EXPECT_EQ(std::get<AssassinData>(first.payload).stealthExpiresOnSide, Side::Second);
	EXPECT_TRUE(first.isHidden());

	EXPECT_TRUE(revealAssassin(first));
	EXPECT_FALSE(first.isHidden());

	Piece ranger{.id = 3u, .side = Side::First, .cell = {8, 4}, .payload = RangerData{}};
	EXPECT_FALSE(updateStealth(ranger, {4, 4}, {2, 5}));
}

TEST(PieceRegistry, KindNames) {
	for (int i = 0; i < static_cast<int>(PieceKind::Count); ++i) {
		const auto kind = static_cast<PieceKind>(i);
		EXPECT_EQ(pieceKindFromString(toString(kind)), kind);
		EXPECT_EQ(makePayload(kind).index(), static_cast<std::size_t>(i));
	}
	EXPECT_FALSE(pieceKindFromString("queen").has_value());
	EXPECT_EQ(sideFromString("second"), Side::Second);
	EXPECT_FALSE(sideFromString("white").has_value());
}

} // namespace wiz::gtest
