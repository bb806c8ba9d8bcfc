#include "core/terrain.hpp"

#include <algorithm>

namespace wiz {

bool Terrain::hasScorch(const Cell cell) const {
	return std::any_of(m_scorch.begin(), m_scorch.end(), [&](const ScorchMark& mark) { return mark.cell == cell; });
}

bool Terrain::hasGuardLight(const Cell cell) const {
	return std::any_of(m_lights.begin(), m_lights.end(), [&](const GuardLight& light) { return light.cell == cell; });
}

bool Terrain::hasOpposingLight(const Cell cell, const Side side) const {
	return std::any_of(m_lights.begin(), m_lights.end(), [&](const GuardLight& light) { return light.cell == cell && light.createdBy != side; });
}

bool Terrain::canPass(const Cell cell, const Side side) const {
	return !hasOpposingLight(cell, side);
}

bool Terrain::canStop(const Cell cell, const Side side, const PieceKind kind) const {
	if (hasOpposingLight(cell, side)) {
		return false;
	}
	return kind == PieceKind::Paladin || !hasScorch(cell);
}

void Terrain::replaceScorch(const unsigned dragonTag, const Side createdBy, const std::vector<Cell>& cells) {
	eraseScorch(dragonTag);
	for (const auto& cell: cells) {
		m_scorch.push_back({cell, dragonTag, createdBy});
	}
}

void Terrain::eraseScorch(const unsigned dragonTag) {
	std::erase_if(m_scorch, [&](const ScorchMark& mark) { return mark.dragonTag == dragonTag; });
}

void Terrain::addScorch(const ScorchMark& mark) {
	m_scorch.push_back(mark);
}

void Terrain::addGuardLight(const Cell cell, const Side createdBy) {
	m_lights.push_back({cell, createdBy});
}

void Terrain::clearGuardLightsOf(const Side createdBy) {
	std::erase_if(m_lights, [&](const GuardLight& light) { return light.createdBy == createdBy; });
}

bool Terrain::clearAt(const Cell cell) {
	const auto removed = std::erase_if(m_scorch, [&](const ScorchMark& mark) { return mark.cell == cell; }) +
	                     std::erase_if(m_lights, [&](const GuardLight& light) { return light.cell == cell; });
	return removed != 0u;
}

void Terrain::clear() {
	m_scorch.clear();
	m_lights.clear();
}

const std::vector<ScorchMark>& Terrain::scorchMarks() const {
	return m_scorch;
}

const std::vector<GuardLight>& Terrain::guardLights() const {
	return m_lights;
}

} // namespace wiz
