#pragma once

#include "core/piece.hpp"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace wiz {

//! Pieces keyed by stable id.
//! Lookup by cell works in two modes:
//! - physical: any piece on the cell is returned.
//! - visible to a side: enemy pieces hidden from that side are treated as absent.
class PieceRegistry {
public:
	//! Create a piece with a fresh id and default payload. Dragons get their id as tag.
	PieceId add(PieceKind kind, Side side, Cell cell);

	//! Insert a piece with a given id. Fails on duplicate id or an occupied cell.
	bool insert(const Piece& piece);
	bool remove(PieceId id); //!< Returns false if the id is unknown.
	void clear();

	Piece* find(PieceId id);
	const Piece* find(PieceId id) const;

	Piece* pieceAt(Cell cell);
	const Piece* pieceAt(Cell cell, std::optional<Side> viewer = std::nullopt) const;

	bool hasWizard(Side side) const;
	const Piece* wizardOf(Side side) const;

	std::vector<const Piece*> all() const; //!< Pieces in id order.
	std::vector<PieceId> ids() const;
	std::size_t size() const;
	bool empty() const;

	void forEach(const std::function<void(Piece&)>& visitor);

	PieceId nextId() const;
	void setNextId(PieceId id); //!< Never lowered below an existing id.

private:
	std::map<PieceId, Piece> m_pieces;
	PieceId m_nextId{1u};
};

//! The fixed starting position: both sides mirrored over the centre row and one neutral bard.
PieceRegistry makeInitialLayout();

} // namespace wiz
