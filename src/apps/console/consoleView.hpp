#pragma once

#include "app/IAppSignalListener.hpp"
#include "app/gameSession.hpp"

#include <iosfwd>
#include <mutex>

namespace wiz::console {

//! Text rendering of a session. Redraws on every state change signal.
class ConsoleView : public app::IAppSignalListener {
public:
	ConsoleView(app::GameSession& session, std::ostream& out);
	~ConsoleView();

	void onAppEvent(app::AppSignal signal) override;

	void drawBoard();
	void drawHistory();
	void print(const std::string& text);

private:
	void drawStatus(const GameState& state);

private:
	app::GameSession& m_session;
	std::ostream& m_out;
	std::mutex m_outMutex; //!< Signals arrive on the network thread too.
	BoardGraph m_graph;
};

} // namespace wiz::console
