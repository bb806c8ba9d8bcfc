#include "app/snapshotCodec.hpp"

#include "core/boardGraph.hpp"

#include <string>

namespace wiz::app {

namespace {

constexpr const char* PHASE_IDLE       = "idle";
constexpr const char* PHASE_GUARD      = "awaitingGuardDecision";
constexpr const char* PHASE_WIZARD     = "awaitingWizardAttackChoice";
constexpr const char* PHASE_BARD_SWAP  = "awaitingBardSwapTarget";
constexpr const char* ATTACK_BEAM_SHOT = "beamShot";
constexpr const char* ATTACK_MELEE     = "melee";

Json::Value sideToJson(Side side) {
	return std::string{toString(side)};
}

Json::Value cellToJson(Cell cell) {
	Json::Value json{Json::objectValue};
	json["row"] = cell.row;
	json["col"] = cell.col;
	return json;
}

Json::Value kindsToJson(const std::vector<PieceKind>& kinds) {
	Json::Value json{Json::arrayValue};
	for (const auto kind: kinds) {
		json.append(std::string{toString(kind)});
	}
	return json;
}

Json::Value pieceToJson(const Piece& piece) {
	Json::Value json{Json::objectValue};
	json["id"]   = piece.id;
	json["kind"] = std::string{toString(piece.kind())};
	json["side"] = sideToJson(piece.side);
	json["cell"] = cellToJson(piece.cell);

	if (const auto* apprentice = std::get_if<ApprenticeData>(&piece.payload)) {
		json["swapUsed"] = apprentice->swapUsed;
	} else if (const auto* dragon = std::get_if<DragonData>(&piece.payload)) {
		json["tag"] = dragon->tag;
	} else if (const auto* assassin = std::get_if<AssassinData>(&piece.payload)) {
		json["stealthed"]            = assassin->stealthed;
		json["stealthExpiresOnSide"] = assassin->stealthExpiresOnSide ? sideToJson(*assassin->stealthExpiresOnSide) : Json::Value{};
	} else if (const auto* bard = std::get_if<BardData>(&piece.payload)) {
		json["activated"] = bard->activated;
	}
	return json;
}

Json::Value seatToJson(const SeatInfo& seat) {
	Json::Value json{Json::objectValue};
	json["name"]  = seat.name;
	json["ready"] = seat.ready;
	return json;
}

Json::Value turnToJson(const TurnState& turn) {
	Json::Value json{Json::objectValue};
	json["phase"] = PHASE_IDLE;

	if (const auto* pending = std::get_if<AwaitingGuardDecision>(&turn)) {
		const auto& guard      = pending->guard;
		json["phase"]          = PHASE_GUARD;
		json["attacker"]       = guard.attacker;
		json["attackerOrigin"] = cellToJson(guard.attackerOrigin);
		json["mode"]           = guard.mode == AttackMode::Melee ? ATTACK_MELEE : ATTACK_BEAM_SHOT;
		json["target"]         = guard.target;
		json["targetCell"]     = cellToJson(guard.targetCell);
		json["defender"]       = sideToJson(guard.defender);
		json["guardians"]      = Json::Value{Json::arrayValue};
		for (const auto id: guard.guardians) {
			json["guardians"].append(id);
		}
	} else if (const auto* choice = std::get_if<AwaitingWizardAttackChoice>(&turn)) {
		json["phase"]  = PHASE_WIZARD;
		json["wizard"] = choice->wizard;
		json["target"] = cellToJson(choice->target);
	} else if (const auto* swap = std::get_if<AwaitingBardSwapTarget>(&turn)) {
		json["phase"]      = PHASE_BARD_SWAP;
		json["bard"]       = swap->bard;
		json["actingSide"] = sideToJson(swap->actingSide);
		json["partners"]   = Json::Value{Json::arrayValue};
		for (const auto cell: swap->partners) {
			json["partners"].append(cellToJson(cell));
		}
	}
	return json;
}


//! Member lookup that tolerates non-object values.
const Json::Value& member(const Json::Value& json, const char* key) {
	static const Json::Value null;
	return json.isObject() ? json[key] : null;
}

//! Decoding helpers. Each returns empty on a malformed value.
class Decoder {
public:
	std::optional<Side> side(const Json::Value& json) const {
		return json.isString() ? sideFromString(json.asString()) : std::nullopt;
	}

	std::optional<PieceKind> kind(const Json::Value& json) const {
		return json.isString() ? pieceKindFromString(json.asString()) : std::nullopt;
	}

	std::optional<Cell> cell(const Json::Value& json) const {
		if (!json.isObject() || !member(json, "row").isInt() || !member(json, "col").isInt()) {
			return std::nullopt;
		}
		const Cell cell{member(json, "row").asInt(), member(json, "col").asInt()};
		if (!m_graph.contains(cell)) {
			return std::nullopt;
		}
		return cell;
	}

	std::optional<unsigned> number(const Json::Value& json) const {
		return json.isUInt() ? std::optional<unsigned>{json.asUInt()} : std::nullopt;
	}

	std::optional<bool> flag(const Json::Value& json) const {
		return json.isBool() ? std::optional<bool>{json.asBool()} : std::nullopt;
	}

	std::optional<std::string> text(const Json::Value& json) const {
		return json.isString() ? std::optional<std::string>{json.asString()} : std::nullopt;
	}

	std::optional<Piece> piece(const Json::Value& json) const {
		if (!json.isObject()) {
			return std::nullopt;
		}
		const auto id        = number(member(json, "id"));
		const auto pieceKind = kind(member(json, "kind"));
		const auto pieceSide = side(member(json, "side"));
		const auto pieceCell = cell(member(json, "cell"));
		if (!id || !pieceKind || !pieceSide || !pieceCell || *id == 0u) {
			return std::nullopt;
		}

		Piece piece{.id = *id, .side = *pieceSide, .cell = *pieceCell, .payload = makePayload(*pieceKind)};
		if ((*pieceKind == PieceKind::Bard) != (*pieceSide == Side::Neutral)) {
			return std::nullopt;
		}

		if (auto* apprentice = std::get_if<ApprenticeData>(&piece.payload)) {
			const auto swapUsed = flag(member(json, "swapUsed"));
			if (!swapUsed) {
				return std::nullopt;
			}
			apprentice->swapUsed = *swapUsed;
		} else if (auto* dragon = std::get_if<DragonData>(&piece.payload)) {
			const auto tag = number(member(json, "tag"));
			if (!tag) {
				return std::nullopt;
			}
			dragon->tag = *tag;
		} else if (auto* assassin = std::get_if<AssassinData>(&piece.payload)) {
			const auto stealthed = flag(member(json, "stealthed"));
			const auto& expiry   = member(json, "stealthExpiresOnSide");
			if (!stealthed || (!expiry.isNull() && !side(expiry))) {
				return std::nullopt;
			}
			assassin->stealthed            = *stealthed;
			assassin->stealthExpiresOnSide = expiry.isNull() ? std::nullopt : side(expiry);
		} else if (auto* bard = std::get_if<BardData>(&piece.payload)) {
			const auto activated = flag(member(json, "activated"));
			if (!activated) {
				return std::nullopt;
			}
			bard->activated = *activated;
		}
		return piece;
	}

	bool kinds(const Json::Value& json, std::vector<PieceKind>& out) const {
		if (!json.isArray()) {
			return false;
		}
		for (const auto& entry: json) {
			const auto value = kind(entry);
			if (!value) {
				return false;
			}
			out.push_back(*value);
		}
		return true;
	}

	bool seat(const Json::Value& json, SeatInfo& out) const {
		const auto name  = text(member(json, "name"));
		const auto ready = flag(member(json, "ready"));
		if (!json.isObject() || !name || !ready) {
			return false;
		}
		out = SeatInfo{.name = *name, .ready = *ready};
		return true;
	}

	std::optional<TurnState> turn(const Json::Value& json, const PieceRegistry& pieces) const {
		const auto phase = json.isObject() ? text(member(json, "phase")) : std::nullopt;
		if (!phase) {
			return std::nullopt;
		}
		const auto exists = [&](std::optional<unsigned> id) { return id && pieces.find(*id) != nullptr; };

		if (*phase == PHASE_IDLE) {
			return IdleState{};
		}
		if (*phase == PHASE_GUARD) {
			const auto attacker = number(member(json, "attacker"));
			const auto origin   = cell(member(json, "attackerOrigin"));
			const auto mode     = text(member(json, "mode"));
			const auto target   = number(member(json, "target"));
			const auto at       = cell(member(json, "targetCell"));
			const auto defender = side(member(json, "defender"));
			if (!exists(attacker) || !origin || !mode || !exists(target) || !at || !defender || !member(json, "guardians").isArray()) {
				return std::nullopt;
			}
			if (*mode != ATTACK_MELEE && *mode != ATTACK_BEAM_SHOT) {
				return std::nullopt;
			}

			PendingGuard guard{
			        .attacker       = *attacker,
			        .attackerOrigin = *origin,
			        .mode           = *mode == ATTACK_MELEE ? AttackMode::Melee : AttackMode::BeamShot,
			        .target         = *target,
			        .targetCell     = *at,
			        .defender       = *defender,
			        .guardians      = {},
			};
			for (const auto& entry: member(json, "guardians")) {
				const auto id = number(entry);
				if (!exists(id)) {
					return std::nullopt;
				}
				guard.guardians.push_back(*id);
			}
			return AwaitingGuardDecision{std::move(guard)};
		}
		if (*phase == PHASE_WIZARD) {
			const auto wizard = number(member(json, "wizard"));
			const auto target = cell(member(json, "target"));
			if (!exists(wizard) || !target) {
				return std::nullopt;
			}
			return AwaitingWizardAttackChoice{.wizard = *wizard, .target = *target};
		}
		if (*phase == PHASE_BARD_SWAP) {
			const auto bard       = number(member(json, "bard"));
			const auto actingSide = side(member(json, "actingSide"));
			if (!exists(bard) || !actingSide || !member(json, "partners").isArray()) {
				return std::nullopt;
			}

			AwaitingBardSwapTarget swap{.bard = *bard, .actingSide = *actingSide, .partners = {}};
			for (const auto& entry: member(json, "partners")) {
				const auto partner = cell(entry);
				if (!partner) {
					return std::nullopt;
				}
				swap.partners.push_back(*partner);
			}
			return swap;
		}
		return std::nullopt;
	}

private:
	BoardGraph m_graph;
};

} // namespace

Json::Value toJson(const GameState& state) {
	Json::Value json{Json::objectValue};
	json["currentSide"] = sideToJson(state.currentSide);
	json["moveId"]      = state.moveId;
	json["winner"]      = state.winner ? sideToJson(*state.winner) : Json::Value{};
	json["nextId"]      = state.pieces.nextId();

	json["pieces"] = Json::Value{Json::arrayValue};
	for (const auto* piece: state.pieces.all()) {
		json["pieces"].append(pieceToJson(*piece));
	}

	json["scorch"] = Json::Value{Json::arrayValue};
	for (const auto& mark: state.terrain.scorchMarks()) {
		Json::Value entry{Json::objectValue};
		entry["cell"]      = cellToJson(mark.cell);
		entry["dragonTag"] = mark.dragonTag;
		entry["createdBy"] = sideToJson(mark.createdBy);
		json["scorch"].append(entry);
	}

	json["guardLights"] = Json::Value{Json::arrayValue};
	for (const auto& light: state.terrain.guardLights()) {
		Json::Value entry{Json::objectValue};
		entry["cell"]      = cellToJson(light.cell);
		entry["createdBy"] = sideToJson(light.createdBy);
		json["guardLights"].append(entry);
	}

	json["history"] = Json::Value{Json::arrayValue};
	for (const auto& record: state.history) {
		Json::Value entry{Json::objectValue};
		entry["full"]       = record.full;
		entry["firstView"]  = record.firstView;
		entry["secondView"] = record.secondView;
		json["history"].append(entry);
	}

	json["captured"]["first"]   = kindsToJson(state.captured.first);
	json["captured"]["second"]  = kindsToJson(state.captured.second);
	json["captured"]["neutral"] = kindsToJson(state.captured.neutral);

	json["seats"]["first"]  = seatToJson(state.seats.first);
	json["seats"]["second"] = seatToJson(state.seats.second);

	json["turn"] = turnToJson(state.turn);
	return json;
}

std::optional<GameState> fromJson(const Json::Value& json) {
	if (!json.isObject()) {
		return std::nullopt;
	}

	const Decoder decode;
	GameState state;

	const auto currentSide = decode.side(member(json, "currentSide"));
	const auto moveId      = decode.number(member(json, "moveId"));
	const auto nextId      = decode.number(member(json, "nextId"));
	if (!currentSide || *currentSide == Side::Neutral || !moveId || !nextId) {
		return std::nullopt;
	}
	state.currentSide = *currentSide;
	state.moveId      = *moveId;

	if (!member(json, "winner").isNull()) {
		state.winner = decode.side(member(json, "winner"));
		if (!state.winner) {
			return std::nullopt;
		}
	}

	if (!member(json, "pieces").isArray()) {
		return std::nullopt;
	}
	for (const auto& entry: member(json, "pieces")) {
		const auto piece = decode.piece(entry);
		if (!piece || !state.pieces.insert(*piece)) {
			return std::nullopt;
		}
	}
	state.pieces.setNextId(*nextId);

	if (!member(json, "scorch").isArray() || !member(json, "guardLights").isArray() || !member(json, "history").isArray()) {
		return std::nullopt;
	}
	for (const auto& entry: member(json, "scorch")) {
		const auto cell      = decode.cell(member(entry, "cell"));
		const auto tag       = decode.number(member(entry, "dragonTag"));
		const auto createdBy = decode.side(member(entry, "createdBy"));
		if (!cell || !tag || !createdBy) {
			return std::nullopt;
		}
		state.terrain.addScorch(ScorchMark{.cell = *cell, .dragonTag = *tag, .createdBy = *createdBy});
	}
	for (const auto& entry: member(json, "guardLights")) {
		const auto cell      = decode.cell(member(entry, "cell"));
		const auto createdBy = decode.side(member(entry, "createdBy"));
		if (!cell || !createdBy) {
			return std::nullopt;
		}
		state.terrain.addGuardLight(*cell, *createdBy);
	}
	for (const auto& entry: member(json, "history")) {
		const auto full       = decode.text(member(entry, "full"));
		const auto firstView  = decode.text(member(entry, "firstView"));
		const auto secondView = decode.text(member(entry, "secondView"));
		if (!full || !firstView || !secondView) {
			return std::nullopt;
		}
		state.history.push_back(MoveRecord{.full = *full, .firstView = *firstView, .secondView = *secondView});
	}

	const auto& captured = member(json, "captured");
	if (!decode.kinds(member(captured, "first"), state.captured.first) || !decode.kinds(member(captured, "second"), state.captured.second) ||
	    !decode.kinds(member(captured, "neutral"), state.captured.neutral)) {
		return std::nullopt;
	}

	const auto& seats = member(json, "seats");
	if (!decode.seat(member(seats, "first"), state.seats.first) || !decode.seat(member(seats, "second"), state.seats.second)) {
		return std::nullopt;
	}

	auto turn = decode.turn(member(json, "turn"), state.pieces);
	if (!turn) {
		return std::nullopt;
	}
	state.turn = std::move(*turn);
	return state;
}

} // namespace wiz::app
