#include "app/gameSession.hpp"
#include "app/snapshotCodec.hpp"
#include "consoleView.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace wiz::gtest {

namespace {

//! Corner wizard, one conductor that already spent its swap and an enemy beyond it.
GameState beamPosition() {
	GameState state;
	state.pieces.add(PieceKind::Wizard, Side::First, {16, 0});
	const auto apprentice = state.pieces.add(PieceKind::Apprentice, Side::First, {15, 0});
	state.pieces.add(PieceKind::Ranger, Side::Second, {13, 0});
	state.pieces.add(PieceKind::Wizard, Side::Second, {0, 0});
	std::get<ApprenticeData>(state.pieces.find(apprentice)->payload).swapUsed = true;
	return state;
}

} // namespace

TEST(ConsoleView, BeamPathAndCaptures) {
	app::GameSession session;
	session.onState(network::ServerState{.state = app::toJson(beamPosition())});

	std::ostringstream out;
	console::ConsoleView view{session, out};

	out.str("");
	ASSERT_TRUE(session.select({16, 0}));
	const auto selected = out.str();
	EXPECT_NE(selected.find("(A)"), std::string::npos);
	EXPECT_NE(selected.find("[r]"), std::string::npos);
	EXPECT_EQ(selected.find("Captured:"), std::string::npos);

	out.str("");
	ASSERT_TRUE(session.choose({13, 0}));
	const auto resolved = out.str();
	EXPECT_EQ(resolved.find("(A)"), std::string::npos);
	EXPECT_NE(resolved.find("Captured: Second lost Ranger\n"), std::string::npos);
	EXPECT_NE(resolved.find("Last: Wizard I9 beams Ranger F9"), std::string::npos);
}

TEST(ConsoleView, NoBeamMarksWithoutWizard) {
	app::GameSession session;
	std::ostringstream out;
	console::ConsoleView view{session, out};

	out.str("");
	ASSERT_TRUE(session.select({10, 0}));
	EXPECT_EQ(out.str().find("(A)"), std::string::npos);
	EXPECT_EQ(out.str().find("(.)"), std::string::npos);
	EXPECT_NE(out.str().find("[.]"), std::string::npos);
}

} // namespace wiz::gtest
