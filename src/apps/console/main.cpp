#include "app/gameSession.hpp"
#include "consoleView.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using wiz::app::GameSession;
using wiz::console::ConsoleView;

constexpr const char* HELP = R"(Commands:
  board | history | help | quit
  select <cell>        Select a piece, e.g. select C9
  move <cell>          Apply the candidate on a cell of the selection
  cancel               Drop the selection
  guard <cell>|decline Guard with the paladin on a cell, or decline
  beam | melee         Resolve a wizard attack on an adjacent target
  swap <cell>          Forced swap partner after a bard move
  seat first|second [name]
  ready | unready | reset
  join <password>      Join another room on the relay)";

std::optional<wiz::Cell> parseCell(const wiz::BoardGraph& graph, std::istringstream& args, ConsoleView& view) {
	std::string text;
	args >> text;
	const auto cell = graph.parseLabel(text);
	if (!cell) {
		view.print("Unknown cell '" + text + "'.");
	}
	return cell;
}

void report(bool accepted, ConsoleView& view) {
	if (!accepted) {
		view.print("Not possible right now.");
	}
}

//! Execute one command line. Returns false on quit.
bool execute(const std::string& line, GameSession& session, ConsoleView& view, const wiz::BoardGraph& graph, const std::string& playerName) {
	std::istringstream args{line};
	std::string command;
	args >> command;

	if (command.empty()) {
		return true;
	}
	if (command == "quit" || command == "exit") {
		return false;
	}

	if (command == "help") {
		view.print(HELP);
	} else if (command == "board") {
		view.drawBoard();
	} else if (command == "history") {
		view.drawHistory();
	} else if (command == "select") {
		if (const auto cell = parseCell(graph, args, view)) {
			report(session.select(*cell), view);
		}
	} else if (command == "move") {
		if (const auto cell = parseCell(graph, args, view)) {
			report(session.choose(*cell), view);
		}
	} else if (command == "cancel") {
		session.deselect();
	} else if (command == "guard") {
		std::string text;
		args >> text;
		if (text == "decline") {
			report(session.decideGuard(std::nullopt), view);
		} else if (const auto cell = graph.parseLabel(text)) {
			const auto state    = session.state();
			const auto* paladin = state.pieces.pieceAt(*cell);
			report(paladin && session.decideGuard(paladin->id), view);
		} else {
			view.print("Usage: guard <cell>|decline");
		}
	} else if (command == "beam") {
		report(session.chooseWizardAttack(wiz::AttackMode::BeamShot), view);
	} else if (command == "melee") {
		report(session.chooseWizardAttack(wiz::AttackMode::Melee), view);
	} else if (command == "swap") {
		if (const auto cell = parseCell(graph, args, view)) {
			report(session.chooseBardSwap(*cell), view);
		}
	} else if (command == "seat") {
		std::string side;
		std::string name;
		args >> side >> name;
		if (name.empty()) {
			name = playerName;
		}
		const auto parsed = wiz::sideFromString(side);
		report(parsed && session.claimSeat(*parsed, name), view);
	} else if (command == "ready" || command == "unready") {
		report(session.setReady(command == "ready"), view);
	} else if (command == "reset") {
		session.resetGame();
	} else if (command == "join") {
		std::string password;
		args >> password;
		report(session.joinRoom(password), view);
	} else {
		view.print("Unknown command. Type 'help'.");
	}
	return true;
}

} // namespace

//! wizchess_console [host] [port] [password] [name]
//! Without a host the game is played hot-seat on this terminal.
int main(int argc, char** argv) {
	GameSession session;
	ConsoleView view{session, std::cout};
	const wiz::BoardGraph graph;
	const std::string playerName = argc > 4 ? argv[4] : "player";

	if (argc > 1) {
		const std::string host{argv[1]};
		std::uint16_t port = wiz::network::core::DEFAULT_PORT;
		if (argc > 2) {
			const std::string_view text{argv[2]};
			const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
			if (ec != std::errc{} || end != text.data() + text.size()) {
				std::cerr << "Invalid port '" << text << "'.\n";
				return 1;
			}
		}
		const std::string password = argc > 3 ? argv[3] : "";

		if (!session.connect(host, port) || !session.joinRoom(password)) {
			return 1;
		}
	} else {
		view.drawBoard();
	}
	view.print("Type 'help' for commands.");

	std::string line;
	while (std::getline(std::cin, line)) {
		if (!execute(line, session, view, graph, playerName)) {
			break;
		}
	}

	session.disconnect();
	return 0;
}
