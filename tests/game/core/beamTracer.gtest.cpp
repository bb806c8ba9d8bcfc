#include "core/beamTracer.hpp"

#include <gtest/gtest.h>

namespace wiz::gtest {

namespace {

Cell at(int x, int y) {
	return *squareToCell({x, y});
}

class BeamTracer : public ::testing::Test {
protected:
	BeamResult trace(PieceId wizard) const {
		const MoveContext context{.graph = m_graph, .pieces = m_pieces, .terrain = m_terrain, .actingSide = Side::First};
		return traceBeam(*m_pieces.find(wizard), context);
	}

	BoardGraph m_graph;
	PieceRegistry m_pieces;
	Terrain m_terrain;
};

} // namespace

TEST_F(BeamTracer, SingleConductor) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(5, 4));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(7, 4));

	const auto beam = trace(wizard);
	ASSERT_TRUE(beam.target.has_value());
	EXPECT_EQ(*beam.target, at(7, 4));
	ASSERT_EQ(beam.path.size(), 3u);
	EXPECT_EQ(beam.path[0], at(4, 4));
	EXPECT_EQ(beam.path[1], at(5, 4));
	EXPECT_EQ(beam.path[2], at(7, 4));
}

// Two first links: the beam never picks one of them.
TEST_F(BeamTracer, BranchFailure) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(5, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(4, 5));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(7, 4));

	const auto beam = trace(wizard);
	EXPECT_FALSE(beam.target.has_value());
	EXPECT_EQ(beam.path.size(), 1u);
}

TEST_F(BeamTracer, TwoEnemiesFail) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(5, 4));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(7, 4));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(5, 6));

	EXPECT_FALSE(trace(wizard).target.has_value());
}

TEST_F(BeamTracer, Chain) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(2, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(4, 6));
	m_pieces.add(PieceKind::Paladin, Side::Second, at(6, 6));

	const auto beam = trace(wizard);
	ASSERT_TRUE(beam.target.has_value());
	EXPECT_EQ(*beam.target, at(6, 6));
	EXPECT_EQ(beam.path.size(), 4u);
}

TEST_F(BeamTracer, ActivatedBardConducts) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(2, 4));
	const auto bard   = m_pieces.add(PieceKind::Bard, Side::Neutral, at(4, 4));
	m_pieces.add(PieceKind::Paladin, Side::Second, at(6, 4));

	EXPECT_FALSE(trace(wizard).target.has_value());

	std::get<BardData>(m_pieces.find(bard)->payload).activated = true;
	const auto beam = trace(wizard);
	ASSERT_TRUE(beam.target.has_value());
	EXPECT_EQ(*beam.target, at(6, 4));
}

TEST_F(BeamTracer, BlockedMidpoint) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Ranger, Side::First, at(5, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(6, 4));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(8, 4));

	EXPECT_FALSE(trace(wizard).target.has_value());
}

// Scorch never blocks a link. An opposing light on the midpoint does.
TEST_F(BeamTracer, TerrainOnLinks) {
	const auto wizard = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(6, 4));
	m_pieces.add(PieceKind::Ranger, Side::Second, at(8, 4));
	m_terrain.addScorch({at(5, 4), 3u, Side::Second});
	m_terrain.addScorch({at(7, 4), 3u, Side::Second});

	EXPECT_TRUE(trace(wizard).target.has_value());

	m_terrain.addGuardLight(at(7, 4), Side::Second);
	EXPECT_FALSE(trace(wizard).target.has_value());

	m_terrain.clearGuardLightsOf(Side::Second);
	m_terrain.addGuardLight(at(8, 4), Side::Second);
	EXPECT_FALSE(trace(wizard).target.has_value());
}

// Hidden enemies and bards are never targets.
TEST_F(BeamTracer, InvisibleTargets) {
	const auto wizard   = m_pieces.add(PieceKind::Wizard, Side::First, at(4, 4));
	m_pieces.add(PieceKind::Apprentice, Side::First, at(5, 4));
	const auto assassin = m_pieces.add(PieceKind::Assassin, Side::Second, at(7, 4));
	std::get<AssassinData>(m_pieces.find(assassin)->payload).stealthed = true;

	EXPECT_FALSE(trace(wizard).target.has_value());

	revealAssassin(*m_pieces.find(assassin));
	EXPECT_TRUE(trace(wizard).target.has_value());
}

TEST(BeamConductor, Kinds) {
	const Piece apprentice{.id = 1u, .side = Side::First, .cell = {8, 4}, .payload = ApprenticeData{}};
	const Piece bard{.id = 2u, .side = Side::Neutral, .cell = {8, 4}, .payload = BardData{.activated = true}};
	const Piece quietBard{.id = 3u, .side = Side::Neutral, .cell = {8, 4}, .payload = BardData{}};
	const Piece ranger{.id = 4u, .side = Side::First, .cell = {8, 4}, .payload = RangerData{}};

	EXPECT_TRUE(isConductor(apprentice, Side::First));
	EXPECT_FALSE(isConductor(apprentice, Side::Second));
	EXPECT_TRUE(isConductor(bard, Side::Second));
	EXPECT_FALSE(isConductor(quietBard, Side::First));
	EXPECT_FALSE(isConductor(ranger, Side::First));
}

} // namespace wiz::gtest
