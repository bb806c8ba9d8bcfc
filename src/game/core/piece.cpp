#include "core/piece.hpp"

#include <array>

namespace wiz {

static constexpr std::array<std::string_view, static_cast<std::size_t>(PieceKind::Count)> KIND_NAMES{
        "wizard", "apprentice", "dragon", "ranger", "griffin", "assassin", "paladin", "bard",
};
static constexpr std::array<std::string_view, static_cast<std::size_t>(PieceKind::Count)> KIND_DISPLAY{
        "Wizard", "Apprentice", "Dragon", "Ranger", "Griffin", "Assassin", "Paladin", "Bard",
};
static_assert(std::variant_size_v<PiecePayload> == static_cast<std::size_t>(PieceKind::Count));

PieceKind Piece::kind() const {
	return static_cast<PieceKind>(payload.index());
}

bool Piece::isHidden() const {
	const auto* data = std::get_if<AssassinData>(&payload);
	return data && (data->stealthed || data->stealthExpiresOnSide.has_value());
}

bool Piece::isActivatedBard() const {
	const auto* data = std::get_if<BardData>(&payload);
	return data && data->activated;
}

PiecePayload makePayload(const PieceKind kind) {
	switch (kind) {
	case PieceKind::Wizard:
		return WizardData{};
	case PieceKind::Apprentice:
		return ApprenticeData{};
	case PieceKind::Dragon:
		return DragonData{};
	case PieceKind::Ranger:
		return RangerData{};
	case PieceKind::Griffin:
		return GriffinData{};
	case PieceKind::Assassin:
		return AssassinData{};
	case PieceKind::Paladin:
		return PaladinData{};
	case PieceKind::Bard:
	case PieceKind::Count:
		break;
	}
	return BardData{};
}

bool isHiddenFrom(const Piece& piece, const Side viewer) {
	return piece.side != viewer && piece.side != Side::Neutral && piece.isHidden();
}

bool isEnemy(const Piece& piece, const Side actingSide) {
	return piece.side != actingSide && piece.side != Side::Neutral;
}

bool updateStealth(Piece& assassin, const Square origin, const Square destination) {
	auto* data = std::get_if<AssassinData>(&assassin.payload);
	if (!data) {
		return false;
	}

	int delta = (destination.x - origin.x) + (destination.y - origin.y);
	if (assassin.side == Side::Second) {
		delta = -delta;
	}

	if (delta == -1 && !data->stealthed) {
		data->stealthed = true;
		data->stealthExpiresOnSide.reset();
		return true;
	}
	if (delta == 1 && data->stealthed) {
		data->stealthed            = false;
		data->stealthExpiresOnSide = opponent(assassin.side);
		return true;
	}
	return false;
}

bool revealAssassin(Piece& assassin) {
	auto* data = std::get_if<AssassinData>(&assassin.payload);
	if (!data) {
		return false;
	}
	const bool wasHidden = data->stealthed || data->stealthExpiresOnSide;
	data->stealthed      = false;
	data->stealthExpiresOnSide.reset();
	return wasHidden;
}

std::string_view toString(const PieceKind kind) {
	const auto index = static_cast<std::size_t>(kind);
	return index < KIND_NAMES.size() ? KIND_NAMES[index] : std::string_view{};
}

std::string_view displayName(const PieceKind kind) {
	const auto index = static_cast<std::size_t>(kind);
	return index < KIND_DISPLAY.size() ? KIND_DISPLAY[index] : std::string_view{};
}

std::optional<PieceKind> pieceKindFromString(const std::string_view text) {
	for (std::size_t i = 0; i < KIND_NAMES.size(); ++i) {
		if (KIND_NAMES[i] == text) {
			return static_cast<PieceKind>(i);
		}
	}
	return std::nullopt;
}

std::string_view toString(const Side side) {
	switch (side) {
	case Side::First:
		return "first";
	case Side::Second:
		return "second";
	case Side::Neutral:
		return "neutral";
	}
	return {};
}

std::optional<Side> sideFromString(const std::string_view text) {
	if (text == "first") {
		return Side::First;
	}
	if (text == "second") {
		return Side::Second;
	}
	if (text == "neutral") {
		return Side::Neutral;
	}
	return std::nullopt;
}

} // namespace wiz
