#include "consoleView.hpp"

#include <algorithm>
#include <format>
#include <ostream>

namespace wiz::console {

namespace {

char pieceSymbol(const Piece& piece) {
	static constexpr char SYMBOLS[] = "WADRGSPB";
	const char symbol = SYMBOLS[static_cast<std::size_t>(piece.kind())];
	if (piece.side == Side::Neutral) {
		return piece.isActivatedBard() ? '*' : 'o';
	}
	return piece.side == Side::First ? symbol : static_cast<char>(symbol - 'A' + 'a');
}

std::string sideName(Side side) {
	return side == Side::First ? "First" : side == Side::Second ? "Second" : "Neutral";
}

//! "Second lost Ranger, Apprentice; Neutral lost ..." for every side with losses.
std::string captureSummary(const CaptureTally& captured) {
	std::string summary;
	for (const auto side: {Side::First, Side::Second, Side::Neutral}) {
		const auto& lost = captured.lostBy(side);
		if (lost.empty()) {
			continue;
		}
		summary += summary.empty() ? "" : "; ";
		summary += sideName(side) + " lost ";
		for (std::size_t i = 0; i < lost.size(); ++i) {
			summary += (i == 0 ? "" : ", ") + std::string{displayName(lost[i])};
		}
	}
	return summary;
}

} // namespace

ConsoleView::ConsoleView(app::GameSession& session, std::ostream& out) : m_session(session), m_out(out) {
	m_session.subscribe(this, app::AS_StateChange | app::AS_RoomJoined | app::AS_Error | app::AS_Disconnected);
}

ConsoleView::~ConsoleView() {
	m_session.unsubscribe(this);
}

void ConsoleView::onAppEvent(app::AppSignal signal) {
	switch (signal) {
	case app::AS_StateChange:
		drawBoard();
		break;
	case app::AS_RoomJoined:
		print("Joined the room.");
		break;
	case app::AS_Error:
		print("Error: " + m_session.lastError());
		break;
	case app::AS_Disconnected:
		print("Disconnected from the relay. Playing locally.");
		break;
	default:
		break;
	}
}

void ConsoleView::drawBoard() {
	const auto state      = m_session.state();
	const auto viewer     = m_session.viewer();
	const auto candidates = m_session.candidates();
	const auto beam       = m_session.selectedBeam();

	std::lock_guard<std::mutex> lock(m_outMutex);
	m_out << "\n";
	for (int row = 0; row < m_graph.rowCount(); ++row) {
		const auto length = m_graph.rowLength(row);
		m_out << std::format("{:>3} ", m_graph.label({row, 0})) << std::string(static_cast<std::size_t>((m_graph.rowCount() / 2 + 1 - length) * 3 / 2), ' ');

		for (int col = 0; col < length; ++col) {
			const Cell cell{row, col};
			const auto* piece = state.pieces.pieceAt(cell, viewer == Side::Neutral ? std::nullopt : std::optional<Side>{viewer});
			if (viewer == Side::Neutral && piece && piece->isHidden()) {
				piece = nullptr;
			}

			char symbol = '.';
			if (piece) {
				symbol = pieceSymbol(*piece);
			} else if (state.terrain.hasGuardLight(cell)) {
				symbol = '+';
			} else if (state.terrain.hasScorch(cell)) {
				symbol = '~';
			}

			// Candidates in brackets, the conductor chain of a selected wizard in parentheses.
			const bool marked = std::any_of(candidates.begin(), candidates.end(), [&](const CandidateAction& a) { return a.target == cell; });
			const bool onBeam = beam.path.size() > 1u && std::find(beam.path.begin() + 1, beam.path.end(), cell) != beam.path.end();
			if (marked) {
				m_out << '[' << symbol << ']';
			} else if (onBeam) {
				m_out << '(' << symbol << ')';
			} else {
				m_out << ' ' << symbol << ' ';
			}
		}
		m_out << "\n";
	}
	drawStatus(state);
	m_out.flush();
}

void ConsoleView::drawStatus(const GameState& state) {
	if (state.captured.total() > 0u) {
		m_out << "Captured: " << captureSummary(state.captured) << "\n";
	}
	if (state.winner) {
		m_out << std::format("{} side wins.\n", sideName(*state.winner));
		return;
	}

	m_out << std::format("Move {}. {} to move", state.moveId + 1, sideName(state.currentSide));
	if (const auto* pending = std::get_if<AwaitingGuardDecision>(&state.turn)) {
		m_out << std::format(". {} may guard {}", sideName(pending->guard.defender), m_graph.label(pending->guard.targetCell));
	} else if (const auto* choice = std::get_if<AwaitingWizardAttackChoice>(&state.turn)) {
		m_out << std::format(". Choose beam or melee on {}", m_graph.label(choice->target));
	} else if (std::holds_alternative<AwaitingBardSwapTarget>(state.turn)) {
		m_out << ". Pick a swap partner for the bard";
	}
	m_out << std::format(". Seats: {} ({}), {} ({})\n", state.seats.first.name.empty() ? "-" : state.seats.first.name,
	                     state.seats.first.ready ? "ready" : "not ready", state.seats.second.name.empty() ? "-" : state.seats.second.name,
	                     state.seats.second.ready ? "ready" : "not ready");

	if (!state.history.empty()) {
		m_out << "Last: " << state.history.back().viewFor(m_session.viewer()) << "\n";
	}
}

void ConsoleView::drawHistory() {
	const auto state  = m_session.state();
	const auto viewer = m_session.viewer();

	std::lock_guard<std::mutex> lock(m_outMutex);
	for (std::size_t i = 0; i < state.history.size(); ++i) {
		m_out << std::format("{:>3}. {}\n", i + 1, state.history[i].viewFor(viewer));
	}
	m_out.flush();
}

void ConsoleView::print(const std::string& text) {
	std::lock_guard<std::mutex> lock(m_outMutex);
	m_out << text << std::endl;
}

} // namespace wiz::console
