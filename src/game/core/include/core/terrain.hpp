#pragma once

#include "core/types.hpp"

#include <vector>

namespace wiz {

//! Dragon trail. Passable by everyone, only a paladin may stop on it.
struct ScorchMark {
	Cell cell;
	unsigned dragonTag;
	Side createdBy;

	bool operator==(const ScorchMark&) const = default;
};

//! Left by a guarding paladin. Opposing pieces may neither stop on nor pass it.
struct GuardLight {
	Cell cell;
	Side createdBy;

	bool operator==(const GuardLight&) const = default;
};

class Terrain {
public:
	bool hasScorch(Cell cell) const;
	bool hasGuardLight(Cell cell) const;
	bool hasOpposingLight(Cell cell, Side side) const; //!< A light created by any other side.

	bool canPass(Cell cell, Side side) const;                 //!< Traversal check for sliders.
	bool canStop(Cell cell, Side side, PieceKind kind) const; //!< Destination check.

	//! Replace every mark of the dragon with tag by marks on cells.
	void replaceScorch(unsigned dragonTag, Side createdBy, const std::vector<Cell>& cells);
	void eraseScorch(unsigned dragonTag);
	void addScorch(const ScorchMark& mark);

	void addGuardLight(Cell cell, Side createdBy);
	void clearGuardLightsOf(Side createdBy);

	//! Drop scorch and guard light under cell. Used when a paladin stops there.
	bool clearAt(Cell cell);
	void clear();

	const std::vector<ScorchMark>& scorchMarks() const;
	const std::vector<GuardLight>& guardLights() const;

private:
	std::vector<ScorchMark> m_scorch;
	std::vector<GuardLight> m_lights;
};

} // namespace wiz
