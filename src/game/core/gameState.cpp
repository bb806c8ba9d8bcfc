#include "core/gameState.hpp"

namespace wiz {

const std::string& MoveRecord::viewFor(const Side viewer) const {
	switch (viewer) {
	case Side::First:
		return firstView;
	case Side::Second:
		return secondView;
	default:
		// Spectators get the redacted text of whichever side was kept in the dark.
		return firstView != full ? firstView : secondView;
	}
}

std::vector<PieceKind>& CaptureTally::lostBy(const Side side) {
	switch (side) {
	case Side::First:
		return first;
	case Side::Second:
		return second;
	default:
		return neutral;
	}
}

const std::vector<PieceKind>& CaptureTally::lostBy(const Side side) const {
	switch (side) {
	case Side::First:
		return first;
	case Side::Second:
		return second;
	default:
		return neutral;
	}
}

std::size_t CaptureTally::total() const {
	return first.size() + second.size() + neutral.size();
}

SeatInfo& Seats::of(const Side side) {
	return side == Side::Second ? second : first;
}

const SeatInfo& Seats::of(const Side side) const {
	return side == Side::Second ? second : first;
}

bool Seats::bothReady() const {
	return first.ready && second.ready;
}

GameState makeInitialState() {
	return GameState{.pieces = makeInitialLayout()};
}

} // namespace wiz
