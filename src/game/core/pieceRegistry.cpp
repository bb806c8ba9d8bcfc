#include "core/pieceRegistry.hpp"

#include <algorithm>
#include <utility>

namespace wiz {

PieceId PieceRegistry::add(const PieceKind kind, const Side side, const Cell cell) {
	const auto id = m_nextId++;

	Piece piece{.id = id, .side = side, .cell = cell, .payload = makePayload(kind)};
	if (auto* dragon = std::get_if<DragonData>(&piece.payload)) {
		dragon->tag = id;
	}
	m_pieces.emplace(id, std::move(piece));
	return id;
}

bool PieceRegistry::insert(const Piece& piece) {
	if (piece.id == 0u || m_pieces.contains(piece.id) || pieceAt(piece.cell) != nullptr) {
		return false;
	}
	m_pieces.emplace(piece.id, piece);
	m_nextId = std::max(m_nextId, piece.id + 1);
	return true;
}

bool PieceRegistry::remove(const PieceId id) {
	return m_pieces.erase(id) != 0u;
}

void PieceRegistry::clear() {
	m_pieces.clear();
	m_nextId = 1u;
}

Piece* PieceRegistry::find(const PieceId id) {
	const auto it = m_pieces.find(id);
	return it == m_pieces.end() ? nullptr : &it->second;
}

const Piece* PieceRegistry::find(const PieceId id) const {
	const auto it = m_pieces.find(id);
	return it == m_pieces.end() ? nullptr : &it->second;
}

Piece* PieceRegistry::pieceAt(const Cell cell) {
	for (auto& [id, piece]: m_pieces) {
		if (piece.cell == cell) {
			return &piece;
		}
	}
	return nullptr;
}

const Piece* PieceRegistry::pieceAt(const Cell cell, const std::optional<Side> viewer) const {
	for (const auto& [id, piece]: m_pieces) {
		if (piece.cell != cell) {
			continue;
		}
		if (viewer && isHiddenFrom(piece, *viewer)) {
			return nullptr;
		}
		return &piece;
	}
	return nullptr;
}

bool PieceRegistry::hasWizard(const Side side) const {
	return wizardOf(side) != nullptr;
}

const Piece* PieceRegistry::wizardOf(const Side side) const {
	for (const auto& [id, piece]: m_pieces) {
		if (piece.side == side && piece.kind() == PieceKind::Wizard) {
			return &piece;
		}
	}
	return nullptr;
}

std::vector<const Piece*> PieceRegistry::all() const {
	std::vector<const Piece*> result;
	result.reserve(m_pieces.size());
	for (const auto& [id, piece]: m_pieces) {
		result.push_back(&piece);
	}
	return result;
}

std::vector<PieceId> PieceRegistry::ids() const {
	std::vector<PieceId> result;
	result.reserve(m_pieces.size());
	for (const auto& [id, piece]: m_pieces) {
		result.push_back(id);
	}
	return result;
}

std::size_t PieceRegistry::size() const {
	return m_pieces.size();
}

bool PieceRegistry::empty() const {
	return m_pieces.empty();
}

void PieceRegistry::forEach(const std::function<void(Piece&)>& visitor) {
	for (auto& [id, piece]: m_pieces) {
		visitor(piece);
	}
}

PieceId PieceRegistry::nextId() const {
	return m_nextId;
}

void PieceRegistry::setNextId(const PieceId id) {
	const auto highest = m_pieces.empty() ? 0u : m_pieces.rbegin()->first;
	m_nextId           = std::max(id, highest + 1);
}


PieceRegistry makeInitialLayout() {
	struct Placement {
		PieceKind kind;
		Cell cell;
	};

	// First side, rows 10 to 16. The second side mirrors to (16 - row, col).
	static constexpr Placement FIRST_SIDE[] = {
	        {PieceKind::Wizard, {16, 0}},     {PieceKind::Dragon, {14, 1}},     {PieceKind::Ranger, {13, 0}},
	        {PieceKind::Ranger, {13, 3}},     {PieceKind::Paladin, {13, 1}},    {PieceKind::Paladin, {13, 2}},
	        {PieceKind::Assassin, {12, 1}},   {PieceKind::Assassin, {12, 3}},   {PieceKind::Griffin, {12, 2}},
	        {PieceKind::Apprentice, {10, 0}}, {PieceKind::Apprentice, {10, 1}}, {PieceKind::Apprentice, {10, 2}},
	        {PieceKind::Apprentice, {10, 3}}, {PieceKind::Apprentice, {10, 4}}, {PieceKind::Apprentice, {10, 5}},
	        {PieceKind::Apprentice, {10, 6}},
	};

	const int lastRow = 2 * BOARD_SIZE;

	PieceRegistry registry;
	for (const auto& [kind, cell]: FIRST_SIDE) {
		registry.add(kind, Side::First, cell);
	}
	for (const auto& [kind, cell]: FIRST_SIDE) {
		registry.add(kind, Side::Second, {lastRow - cell.row, cell.col});
	}
	registry.add(PieceKind::Bard, Side::Neutral, {BOARD_SIZE, BOARD_SIZE / 2});
	return registry;
}

} // namespace wiz
