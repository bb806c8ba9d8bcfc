#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>
#include <variant>

namespace wiz {

struct WizardData {
	bool operator==(const WizardData&) const = default;
};
struct ApprenticeData {
	bool swapUsed{false}; //!< The one swap with the own wizard was spent.

	bool operator==(const ApprenticeData&) const = default;
};
struct DragonData {
	unsigned tag{0}; //!< Scopes the scorch marks of this dragon.

	bool operator==(const DragonData&) const = default;
};
struct RangerData {
	bool operator==(const RangerData&) const = default;
};
struct GriffinData {
	bool operator==(const GriffinData&) const = default;
};
struct AssassinData {
	bool stealthed{false};
	std::optional<Side> stealthExpiresOnSide; //!< Still hidden until this side finishes its turn.

	bool operator==(const AssassinData&) const = default;
};
struct PaladinData {
	bool operator==(const PaladinData&) const = default;
};
struct BardData {
	bool activated{false}; //!< Set for every bard once the first capture happened.

	bool operator==(const BardData&) const = default;
};

//! Archetype specific state. The alternative index equals the PieceKind.
using PiecePayload = std::variant<WizardData, ApprenticeData, DragonData, RangerData, GriffinData, AssassinData, PaladinData, BardData>;

struct Piece {
	PieceId id{};
	Side side{Side::Neutral};
	Cell cell{};
	PiecePayload payload{};

	PieceKind kind() const;

	//! True while the assassin may not be seen by the opposing side.
	bool isHidden() const;
	bool isActivatedBard() const;
};

//! Default payload for a freshly created piece of the given kind.
PiecePayload makePayload(PieceKind kind);

//! True if piece is invisible to viewer.
bool isHiddenFrom(const Piece& piece, Side viewer);

//! A piece of neither the acting side nor the neutral side.
bool isEnemy(const Piece& piece, Side actingSide);

//! Recompute stealth from the signed displacement origin -> destination. Returns true on change.
//! \note First side: -1 enters, +1 exits. Reversed for the second side. Exit is deferred to the next handoff.
bool updateStealth(Piece& assassin, Square origin, Square destination);

//! Clear both stealth fields at once. Returns true if the piece was hidden.
bool revealAssassin(Piece& assassin);

std::string_view toString(PieceKind kind); //!< Lower-case name used in snapshots.
std::string_view displayName(PieceKind kind);
std::optional<PieceKind> pieceKindFromString(std::string_view text);

std::string_view toString(Side side);
std::optional<Side> sideFromString(std::string_view text);

} // namespace wiz
