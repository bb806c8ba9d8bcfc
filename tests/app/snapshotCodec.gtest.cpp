#include "app/snapshotCodec.hpp"
#include "core/boardGraph.hpp"
#include "core/game.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace wiz::gtest {

namespace {

Cell at(int x, int y) {
	return *squareToCell({x, y});
}

void expectSamePieces(const PieceRegistry& lhs, const PieceRegistry& rhs) {
	ASSERT_EQ(lhs.size(), rhs.size());
	EXPECT_EQ(lhs.nextId(), rhs.nextId());
	for (const auto* piece: lhs.all()) {
		const auto* other = rhs.find(piece->id);
		ASSERT_NE(other, nullptr) << piece->id;
		EXPECT_EQ(other->side, piece->side);
		EXPECT_EQ(other->cell, piece->cell);
		EXPECT_EQ(other->payload, piece->payload);
	}
}

void expectSameState(const GameState& lhs, const GameState& rhs) {
	expectSamePieces(lhs.pieces, rhs.pieces);
	EXPECT_EQ(lhs.terrain.scorchMarks(), rhs.terrain.scorchMarks());
	EXPECT_EQ(lhs.terrain.guardLights(), rhs.terrain.guardLights());
	EXPECT_EQ(lhs.currentSide, rhs.currentSide);
	EXPECT_EQ(lhs.moveId, rhs.moveId);
	EXPECT_EQ(lhs.history, rhs.history);
	EXPECT_EQ(lhs.captured, rhs.captured);
	EXPECT_EQ(lhs.seats, rhs.seats);
	EXPECT_EQ(lhs.turn, rhs.turn);
	EXPECT_EQ(lhs.winner, rhs.winner);
}

//! Encode, print, parse and decode like the relay path does.
std::optional<GameState> throughText(const GameState& state) {
	Json::StreamWriterBuilder writer;
	writer["indentation"] = "";
	const auto text       = Json::writeString(writer, app::toJson(state));

	Json::CharReaderBuilder reader;
	Json::Value json;
	std::string errors;
	std::istringstream stream(text);
	if (!Json::parseFromStream(reader, stream, &json, &errors)) {
		return std::nullopt;
	}
	return app::fromJson(json);
}

} // namespace

TEST(SnapshotCodec, InitialState) {
	auto state                = makeInitialState();
	state.seats.first.name    = "Ada";
	state.seats.first.ready   = true;
	state.seats.second.name   = "Grace";

	const auto decoded = throughText(state);
	ASSERT_TRUE(decoded.has_value());
	expectSameState(state, *decoded);
}

TEST(SnapshotCodec, PlayedState) {
	Game game;
	ASSERT_TRUE(game.select({10, 0}));
	ASSERT_TRUE(game.choose({9, 0}));

	auto& state = game.mutableState();
	state.terrain.addScorch(ScorchMark{.cell = at(4, 4), .dragonTag = 3u, .createdBy = Side::First});
	state.terrain.addGuardLight(at(3, 5), Side::Second);
	state.captured.second.push_back(PieceKind::Ranger);
	state.winner = Side::First;

	const auto decoded = throughText(state);
	ASSERT_TRUE(decoded.has_value());
	expectSameState(state, *decoded);
}

TEST(SnapshotCodec, SuspendedGuardDecision) {
	GameState setup;
	setup.pieces.add(PieceKind::Wizard, Side::First, at(8, 8));
	setup.pieces.add(PieceKind::Wizard, Side::Second, at(0, 0));
	setup.pieces.add(PieceKind::Ranger, Side::First, at(4, 2));
	setup.pieces.add(PieceKind::Apprentice, Side::Second, at(4, 3));
	const auto paladin = setup.pieces.add(PieceKind::Paladin, Side::Second, at(5, 3));

	Game game;
	game.load(std::move(setup));
	ASSERT_TRUE(game.select(at(4, 2)));
	ASSERT_TRUE(game.choose(at(4, 3)));
	ASSERT_EQ(game.phase(), TurnPhase::AwaitingGuardDecision);

	const auto decoded = throughText(game.state());
	ASSERT_TRUE(decoded.has_value());
	expectSameState(game.state(), *decoded);

	// The decoded state resumes where the sender stopped.
	Game resumed;
	resumed.load(*decoded);
	EXPECT_EQ(resumed.phase(), TurnPhase::AwaitingGuardDecision);
	EXPECT_TRUE(resumed.decideGuard(paladin));
	EXPECT_EQ(resumed.currentSide(), Side::Second);
}

TEST(SnapshotCodec, SelectionIsNotShared) {
	Game game;
	ASSERT_TRUE(game.select({10, 0}));
	ASSERT_EQ(game.phase(), TurnPhase::Selected);

	const auto json = app::toJson(game.state());
	EXPECT_EQ(json["turn"]["phase"].asString(), "idle");

	const auto decoded = app::fromJson(json);
	ASSERT_TRUE(decoded.has_value());
	EXPECT_TRUE(std::holds_alternative<IdleState>(decoded->turn));
}

TEST(SnapshotCodec, RejectsMalformed) {
	const auto valid = app::toJson(makeInitialState());
	ASSERT_TRUE(app::fromJson(valid).has_value());

	EXPECT_FALSE(app::fromJson(Json::Value{}).has_value());
	EXPECT_FALSE(app::fromJson(Json::Value{Json::arrayValue}).has_value());

	auto unknownKind                = valid;
	unknownKind["pieces"][0]["kind"] = "jester";
	EXPECT_FALSE(app::fromJson(unknownKind).has_value());

	auto offBoard                       = valid;
	offBoard["pieces"][0]["cell"]["col"] = 40;
	EXPECT_FALSE(app::fromJson(offBoard).has_value());

	auto duplicateId                = valid;
	duplicateId["pieces"][1]["id"]  = duplicateId["pieces"][0]["id"];
	EXPECT_FALSE(app::fromJson(duplicateId).has_value());

	auto stacked                   = valid;
	stacked["pieces"][1]["cell"]   = stacked["pieces"][0]["cell"];
	EXPECT_FALSE(app::fromJson(stacked).has_value());

	auto neutralSide                = valid;
	neutralSide["pieces"][0]["side"] = "neutral";
	EXPECT_FALSE(app::fromJson(neutralSide).has_value());

	auto neutralMover          = valid;
	neutralMover["currentSide"] = "neutral";
	EXPECT_FALSE(app::fromJson(neutralMover).has_value());

	auto missingSeats = valid;
	missingSeats.removeMember("seats");
	EXPECT_FALSE(app::fromJson(missingSeats).has_value());

	auto danglingTurn                = valid;
	danglingTurn["turn"]["phase"]    = "awaitingWizardAttackChoice";
	danglingTurn["turn"]["wizard"]   = 999;
	danglingTurn["turn"]["target"]   = valid["pieces"][0]["cell"];
	EXPECT_FALSE(app::fromJson(danglingTurn).has_value());

	auto unknownPhase             = valid;
	unknownPhase["turn"]["phase"] = "selected";
	EXPECT_FALSE(app::fromJson(unknownPhase).has_value());
}

} // namespace wiz::gtest
