#include "core/game.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace wiz {

std::optional<Side> detectWinner(const PieceRegistry& pieces) {
	const bool first  = pieces.hasWizard(Side::First);
	const bool second = pieces.hasWizard(Side::Second);
	if (first == second) {
		return std::nullopt;
	}
	return first ? Side::First : Side::Second;
}


Game::Game() : m_state{makeInitialState()} {
}

Game::Game(GameState state) : m_state{std::move(state)} {
}

void Game::reset() {
	auto seats         = m_state.seats;
	seats.first.ready  = false;
	seats.second.ready = false;

	m_state       = makeInitialState();
	m_state.seats = std::move(seats);
}

void Game::load(GameState state) {
	m_state = std::move(state);
	if (std::holds_alternative<SelectedState>(m_state.turn)) {
		m_state.turn = IdleState{};
	}
}

const GameState& Game::state() const {
	return m_state;
}

GameState& Game::mutableState() {
	return m_state;
}

const BoardGraph& Game::graph() const {
	return m_graph;
}

TurnPhase Game::phase() const {
	return static_cast<TurnPhase>(m_state.turn.index());
}

Side Game::currentSide() const {
	return m_state.currentSide;
}

std::optional<Side> Game::winner() const {
	return m_state.winner;
}

Candidates Game::candidates() const {
	const auto* selected = std::get_if<SelectedState>(&m_state.turn);
	return selected ? selected->candidates : Candidates{};
}

BeamResult Game::selectedBeam() const {
	const auto* selected = std::get_if<SelectedState>(&m_state.turn);
	if (!selected) {
		return {};
	}
	const auto* piece = m_state.pieces.find(selected->piece);
	if (!piece || piece->kind() != PieceKind::Wizard) {
		return {};
	}
	return traceBeam(*piece, contextFor(*piece));
}

bool Game::select(const Cell cell) {
	if (m_state.winner || !(std::holds_alternative<IdleState>(m_state.turn) || std::holds_alternative<SelectedState>(m_state.turn))) {
		return false;
	}

	const auto* piece = m_state.pieces.pieceAt(cell, m_state.currentSide);
	if (!piece || (piece->side != m_state.currentSide && piece->side != Side::Neutral)) {
		m_state.turn = IdleState{};
		return false;
	}

	m_state.turn = SelectedState{.piece = piece->id, .candidates = generateMoves(*piece, contextFor(*piece))};
	return true;
}

void Game::deselect() {
	if (std::holds_alternative<SelectedState>(m_state.turn)) {
		m_state.turn = IdleState{};
	}
}

bool Game::choose(const Cell cell) {
	const auto* selected = std::get_if<SelectedState>(&m_state.turn);
	if (!selected || m_state.winner) {
		return false;
	}

	const auto it = std::find_if(selected->candidates.begin(), selected->candidates.end(),
	                             [&](const CandidateAction& action) { return action.target == cell; });
	auto* piece   = m_state.pieces.find(selected->piece);
	if (it == selected->candidates.end() || !piece) {
		m_state.turn = IdleState{};
		return false;
	}

	const auto action = *it;
	m_state.turn      = IdleState{};

	switch (action.type) {
	case ActionType::Move:
		return resolveMove(*piece, action.target);
	case ActionType::Swap:
		return resolveSwap(*piece, action.target);
	case ActionType::Attack:
		if (piece->kind() != PieceKind::Wizard) {
			return beginAttack(*piece, action.target, AttackMode::Melee);
		}
		// Adjacent targets may also be taken by stepping onto them.
		if (m_graph.isAdjacent(piece->cell, action.target) && m_state.terrain.canStop(action.target, piece->side, PieceKind::Wizard)) {
			m_state.turn = AwaitingWizardAttackChoice{.wizard = piece->id, .target = action.target};
			return true;
		}
		return beginAttack(*piece, action.target, AttackMode::BeamShot);
	}
	return false;
}

bool Game::decideGuard(const std::optional<PieceId> paladinId) {
	const auto* pending = std::get_if<AwaitingGuardDecision>(&m_state.turn);
	if (!pending) {
		return false;
	}
	const auto guard = pending->guard;

	if (paladinId && std::find(guard.guardians.begin(), guard.guardians.end(), *paladinId) == guard.guardians.end()) {
		return false;
	}

	auto* attacker = m_state.pieces.find(guard.attacker);
	auto* target   = m_state.pieces.find(guard.target);
	if (!attacker || !target) {
		m_state.turn = IdleState{};
		return false;
	}

	if (!paladinId) {
		m_state.turn = IdleState{};
		executeAttack(*attacker, *target, guard.mode);
		finishTurn();
		return true;
	}

	const auto* paladin = m_state.pieces.find(*paladinId);
	if (!paladin) {
		return false;
	}
	m_state.turn = IdleState{};

	const Piece fallen     = *paladin;
	const Cell origin      = attacker->cell;
	const bool wasHidden   = attacker->isHidden();
	const auto targetLabel = describe(*target, guard.targetCell);

	capture(fallen);
	relocate(*target, fallen.cell);

	std::string action;
	if (guard.mode == AttackMode::Melee) {
		relocate(*attacker, guard.targetCell);
		followScorch(*attacker, origin, guard.targetCell);
		revealAssassin(*attacker);
		action = std::format("{} -> {}", describe(*attacker, origin), m_graph.label(guard.targetCell));
	} else {
		action = std::format("{} beams {}", describe(*attacker, origin), m_graph.label(guard.targetCell));
	}

	const auto suffix = std::format(" ({} guards {})", describe(fallen, fallen.cell), targetLabel);
	record(m_state.currentSide, wasHidden, action + suffix, "Hidden move" + suffix);
	finishTurn(GuardLight{.cell = guard.targetCell, .createdBy = guard.defender});
	return true;
}

bool Game::chooseWizardAttack(const AttackMode mode) {
	const auto* pending = std::get_if<AwaitingWizardAttackChoice>(&m_state.turn);
	if (!pending) {
		return false;
	}
	const auto choice = *pending;
	m_state.turn      = IdleState{};

	auto* wizard = m_state.pieces.find(choice.wizard);
	if (!wizard) {
		return false;
	}
	return beginAttack(*wizard, choice.target, mode);
}

bool Game::chooseBardSwap(const Cell cell) {
	const auto* pending = std::get_if<AwaitingBardSwapTarget>(&m_state.turn);
	if (!pending || std::find(pending->partners.begin(), pending->partners.end(), cell) == pending->partners.end()) {
		return false;
	}

	auto* bard    = m_state.pieces.find(pending->bard);
	auto* partner = m_state.pieces.pieceAt(cell);
	if (!bard || !partner || partner->side != pending->actingSide) {
		return false;
	}
	m_state.turn = IdleState{};

	const auto text = std::format("{} <-> {}", describe(*bard, bard->cell), describe(*partner, partner->cell));
	std::swap(bard->cell, partner->cell);
	revealAssassin(*partner);
	revealInZones(*partner);

	record(m_state.currentSide, false, text, text);
	finishTurn();
	return true;
}

MoveContext Game::contextFor(const Piece& piece) const {
	return MoveContext{
	        .graph      = m_graph,
	        .pieces     = m_state.pieces,
	        .terrain    = m_state.terrain,
	        .actingSide = actingSideFor(piece, m_state.currentSide),
	};
}

bool Game::resolveMove(Piece& piece, const Cell destination) {
	const auto actingSide = actingSideFor(piece, m_state.currentSide);

	// The cell only looked empty: a hidden piece stands there.
	if (const auto* occupant = m_state.pieces.pieceAt(destination)) {
		if (occupant->kind() == PieceKind::Bard || !isEnemy(*occupant, actingSide)) {
			return false;
		}
		if (piece.kind() != PieceKind::Bard) {
			return beginAttack(piece, destination, AttackMode::Melee);
		}

		// A bard removes the hidden assassin without a guard exchange and still owes its swap.
		const Piece victim = *occupant;
		const auto text    = std::format("{} x {}", describe(piece, piece.cell), describe(victim, destination));
		capture(victim);
		relocate(piece, destination);
		record(m_state.currentSide, false, text, text);
		enterBardSwap(piece, actingSide);
		return true;
	}

	const Cell origin    = piece.cell;
	const bool wasHidden = piece.isHidden();
	const auto text      = std::format("{} -> {}", describe(piece, origin), m_graph.label(destination));

	relocate(piece, destination);
	followScorch(piece, origin, destination);
	record(m_state.currentSide, wasHidden || piece.isHidden(), text, "Hidden move");

	if (piece.kind() == PieceKind::Bard) {
		enterBardSwap(piece, actingSide);
		return true;
	}
	finishTurn();
	return true;
}

bool Game::resolveSwap(Piece& piece, const Cell partnerCell) {
	auto* partner = m_state.pieces.pieceAt(partnerCell);
	if (!partner || partner->side != piece.side) {
		return false;
	}

	const auto text = std::format("{} <-> {}", describe(piece, piece.cell), describe(*partner, partner->cell));
	std::swap(piece.cell, partner->cell);

	for (auto* swapped: {&piece, partner}) {
		if (auto* apprentice = std::get_if<ApprenticeData>(&swapped->payload)) {
			apprentice->swapUsed = true;
		}
		revealAssassin(*swapped);
		revealInZones(*swapped);
	}

	record(m_state.currentSide, false, text, text);
	finishTurn();
	return true;
}

bool Game::beginAttack(Piece& attacker, const Cell targetCell, const AttackMode mode) {
	const auto* target = m_state.pieces.pieceAt(targetCell);
	if (!target || target->id == attacker.id) {
		return false;
	}

	if (target->kind() == PieceKind::Bard) {
		const auto text = std::format("{} attacks {} (no effect)", describe(attacker, attacker.cell), describe(*target, targetCell));
		record(m_state.currentSide, attacker.isHidden(), text, "Hidden move");
		finishTurn();
		return true;
	}

	auto guardians = findGuardingPaladins(m_graph, m_state.pieces, *target);
	if (!guardians.empty()) {
		m_state.turn = AwaitingGuardDecision{PendingGuard{
		        .attacker       = attacker.id,
		        .attackerOrigin = attacker.cell,
		        .mode           = mode,
		        .target         = target->id,
		        .targetCell     = targetCell,
		        .defender       = target->side,
		        .guardians      = std::move(guardians),
		}};
		return true;
	}

	executeAttack(attacker, *target, mode);
	finishTurn();
	return true;
}

void Game::executeAttack(Piece& attacker, const Piece& target, const AttackMode mode) {
	const Piece victim   = target;
	const Cell origin    = attacker.cell;
	const bool wasHidden = attacker.isHidden();
	const auto victimStr = describe(victim, victim.cell);

	capture(victim);

	std::string text;
	if (mode == AttackMode::Melee) {
		relocate(attacker, victim.cell);
		followScorch(attacker, origin, victim.cell);
		revealAssassin(attacker);
		text = std::format("{} x {}", describe(attacker, origin), victimStr);
	} else {
		text = std::format("{} beams {}", describe(attacker, origin), victimStr);
	}
	record(m_state.currentSide, wasHidden, text, "Hidden move x " + victimStr);
}

void Game::enterBardSwap(const Piece& bard, const Side actingSide) {
	std::vector<Cell> partners;
	for (const auto* piece: m_state.pieces.all()) {
		const auto kind = piece->kind();
		if (piece->id == bard.id || piece->side != actingSide || kind == PieceKind::Bard || kind == PieceKind::Dragon || kind == PieceKind::Wizard) {
			continue;
		}
		partners.push_back(piece->cell);
	}

	if (partners.empty()) {
		finishTurn();
		return;
	}
	m_state.turn = AwaitingBardSwapTarget{.bard = bard.id, .actingSide = actingSide, .partners = std::move(partners)};
}

void Game::capture(const Piece& victim) {
	const auto id   = victim.id;
	const auto side = victim.side;
	const auto kind = victim.kind();
	const auto* dragon = std::get_if<DragonData>(&victim.payload);
	const auto tag     = dragon ? std::optional<unsigned>{dragon->tag} : std::nullopt;

	m_state.pieces.remove(id);
	m_state.captured.lostBy(side).push_back(kind);

	m_state.pieces.forEach([](Piece& piece) {
		if (auto* bard = std::get_if<BardData>(&piece.payload)) {
			bard->activated = true;
		}
	});

	if (tag) {
		m_state.terrain.eraseScorch(*tag);
	}
}

void Game::relocate(Piece& piece, const Cell destination) {
	const auto from = m_graph.toSquare(piece.cell);
	piece.cell      = destination;
	updateStealth(piece, from, m_graph.toSquare(destination));

	if (piece.kind() == PieceKind::Paladin) {
		m_state.terrain.clearAt(destination);
	}
	revealInZones(piece);
}

void Game::revealInZones(Piece& moved) {
	if (moved.kind() == PieceKind::Assassin && moved.isHidden() && isInPaladinZone(m_graph, m_state.pieces, moved.cell, opponent(moved.side))) {
		revealAssassin(moved);
	}

	if (moved.kind() != PieceKind::Paladin) {
		return;
	}
	for (const auto& cell: protectionZone(m_graph, moved)) {
		auto* piece = m_state.pieces.pieceAt(cell);
		if (piece && piece->kind() == PieceKind::Assassin && isEnemy(*piece, moved.side)) {
			revealAssassin(*piece);
		}
	}
}

void Game::followScorch(const Piece& dragon, const Cell origin, const Cell destination) {
	const auto* data = std::get_if<DragonData>(&dragon.payload);
	if (!data) {
		return;
	}
	m_state.terrain.replaceScorch(data->tag, dragon.side, slidePath(m_graph, origin, destination));
}

void Game::record(const Side actor, const bool hidden, const std::string& full, const std::string& hiddenText) {
	MoveRecord entry{.full = full, .firstView = full, .secondView = full};
	if (hidden) {
		(actor == Side::First ? entry.secondView : entry.firstView) = hiddenText;
	}
	m_state.history.push_back(std::move(entry));
}

std::string Game::describe(const Piece& piece, const Cell cell) const {
	return std::format("{} {}", displayName(piece.kind()), m_graph.label(cell));
}

void Game::finishTurn(const std::optional<GuardLight> freshLight) {
	if (const auto winner = detectWinner(m_state.pieces)) {
		m_state.winner = winner;
	} else if (!m_state.pieces.hasWizard(Side::First)) {
		// Not reachable with one capture per step. The side that acted keeps the win.
		m_state.winner = m_state.currentSide;
	}

	const auto finished = m_state.currentSide;
	m_state.pieces.forEach([&](Piece& piece) {
		auto* assassin = std::get_if<AssassinData>(&piece.payload);
		if (assassin && assassin->stealthExpiresOnSide == finished) {
			assassin->stealthExpiresOnSide.reset();
		}
	});

	m_state.currentSide = opponent(finished);
	m_state.terrain.clearGuardLightsOf(m_state.currentSide);
	if (freshLight) {
		m_state.terrain.addGuardLight(freshLight->cell, freshLight->createdBy);
	}

	++m_state.moveId;
	m_state.turn = IdleState{};
}

} // namespace wiz
