#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wiz {

//! Lattice node with planar coordinates centred at the origin.
struct Node {
	double x; //!< Horizontal position. Neighbours in a row are 1.0 apart.
	double y; //!< Vertical position. Rows are 0.5 apart.
	Cell cell;
};

using NodeRows  = std::vector<std::vector<Node>>;
using Adjacency = std::map<Cell, std::vector<Cell>>;

//! Build the node rows of a triangular lattice with side length size.
NodeRows buildNodes(int size);

//! Connect same-row neighbours and each node to the two nodes born under it.
Adjacency buildAdjacency(const NodeRows& rows);

//! Map a lattice address to the rotated square.
Square rotateToSquare(Cell cell, int size = BOARD_SIZE);

//! Inverse of rotateToSquare. Returns empty if the square lies outside the board.
std::optional<Cell> squareToCell(Square square, int size = BOARD_SIZE);

//! Immutable board for one lattice size.
class BoardGraph {
public:
	explicit BoardGraph(int size = BOARD_SIZE);

	int size() const;
	int rowCount() const;
	int rowLength(int row) const;

	bool contains(Cell cell) const;
	bool contains(Square square) const;

	const NodeRows& rows() const;
	std::vector<Cell> cells() const; //!< All cells in row-major order.

	const std::vector<Cell>& neighbors(Cell cell) const; //!< Empty for cells off the board.
	bool isAdjacent(Cell a, Cell b) const;

	Square toSquare(Cell cell) const;
	std::optional<Cell> toCell(Square square) const;

	//! Walk distance steps from cell in direction. Returns empty when leaving the board.
	std::optional<Cell> step(Cell cell, Direction direction, int distance = 1) const;

	//! Display label, e.g. "A1". File letter from x, rank from y + 1.
	std::string label(Cell cell) const;
	std::optional<Cell> parseLabel(const std::string& text) const;

private:
	int m_size;
	NodeRows m_rows;
	Adjacency m_adjacency;
};

} // namespace wiz
