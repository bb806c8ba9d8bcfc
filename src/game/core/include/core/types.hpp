#pragma once

#include <array>
#include <compare>
#include <cstdint>

namespace wiz {

using PieceId = unsigned; //!< Stable identity of a piece. Never reused within a game.

inline constexpr int BOARD_SIZE = 8; //!< Side length N of the lattice. Rows are 0..2N.

enum class Side { First = 1, Second = 2, Neutral = 3 };

//! Returns the opposing playing side. Neutral has no opponent.
inline constexpr Side opponent(Side side) {
	switch (side) {
	case Side::First:
		return Side::Second;
	case Side::Second:
		return Side::First;
	default:
		return Side::Neutral;
	}
}

//! Piece archetypes. Order matches the alternatives of PiecePayload.
enum class PieceKind : std::uint8_t {
	Wizard,
	Apprentice,
	Dragon,
	Ranger,
	Griffin,
	Assassin,
	Paladin,
	Bard,
	Count //!< Used in serialisation to check when enum changes.
};

//! Lattice address. Row 0 is the single node at the second side's end.
struct Cell {
	int row;
	int col;

	auto operator<=>(const Cell&) const = default;
};

//! Rotated square coordinate. Row of the matching cell is always x + y.
struct Square {
	int x;
	int y;

	bool operator==(const Square&) const = default;
};

//! Step in square coordinates.
struct Direction {
	int dx;
	int dy;
};

//! The six lattice directions. (1,-1) and (-1,1) stay on the same row.
inline constexpr std::array<Direction, 6> LATTICE_DIRECTIONS{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, -1}, {-1, 1}}};

//! The two same-row directions.
inline constexpr std::array<Direction, 2> ROW_DIRECTIONS{{{1, -1}, {-1, 1}}};

} // namespace wiz
