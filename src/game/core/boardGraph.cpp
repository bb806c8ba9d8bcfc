#include "core/boardGraph.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace wiz {

static constexpr double STEP  = 1.0;
static constexpr double VSTEP = STEP * 0.5;

NodeRows buildNodes(const int size) {
	NodeRows rows;
	rows.reserve(static_cast<std::size_t>(2 * size + 1));

	for (int i = 0; i <= 2 * size; ++i) {
		const int count     = i <= size ? i + 1 : 2 * size + 1 - i;
		const double y      = (i - size) * VSTEP;
		const double xStart = -(count - 1) * STEP / 2.0;

		std::vector<Node> row;
		row.reserve(static_cast<std::size_t>(count));
		for (int j = 0; j < count; ++j) {
			row.push_back(Node{.x = xStart + j * STEP, .y = y, .cell = {i, j}});
		}
		rows.push_back(std::move(row));
	}
	return rows;
}

Adjacency buildAdjacency(const NodeRows& rows) {
	Adjacency adjacency;
	for (const auto& row: rows) {
		for (const auto& node: row) {
			adjacency[node.cell];
		}
	}

	const auto connect = [&](Cell a, Cell b) {
		adjacency[a].push_back(b);
		adjacency[b].push_back(a);
	};

	for (int r = 0; r < static_cast<int>(rows.size()); ++r) {
		const int length = static_cast<int>(rows[r].size());
		for (int c = 0; c + 1 < length; ++c) {
			connect({r, c}, {r, c + 1});
		}
	}

	for (int r = 0; r + 1 < static_cast<int>(rows.size()); ++r) {
		const int lengthA = static_cast<int>(rows[r].size());
		const int lengthB = static_cast<int>(rows[r + 1].size());

		if (lengthB == lengthA + 1) {
			for (int c = 0; c < lengthA; ++c) {
				connect({r, c}, {r + 1, c});
				connect({r, c}, {r + 1, c + 1});
			}
		} else if (lengthA == lengthB + 1) {
			for (int c = 0; c < lengthB; ++c) {
				connect({r + 1, c}, {r, c});
				connect({r + 1, c}, {r, c + 1});
			}
		}
	}
	return adjacency;
}

Square rotateToSquare(const Cell cell, const int size) {
	if (cell.row <= size) {
		return {cell.col, cell.row - cell.col};
	}
	const int offset = cell.row - size;
	return {cell.col + offset, size - cell.col};
}

std::optional<Cell> squareToCell(const Square square, const int size) {
	if (square.x < 0 || square.y < 0 || square.x > size || square.y > size) {
		return std::nullopt;
	}
	const int row = square.x + square.y;
	const int col = row <= size ? square.x : size - square.y;
	return Cell{row, col};
}


BoardGraph::BoardGraph(const int size) : m_size{size}, m_rows{buildNodes(size)}, m_adjacency{buildAdjacency(m_rows)} {
}

int BoardGraph::size() const {
	return m_size;
}

int BoardGraph::rowCount() const {
	return static_cast<int>(m_rows.size());
}

int BoardGraph::rowLength(const int row) const {
	if (row < 0 || row >= rowCount()) {
		return 0;
	}
	return static_cast<int>(m_rows[row].size());
}

bool BoardGraph::contains(const Cell cell) const {
	return cell.col >= 0 && cell.col < rowLength(cell.row);
}

bool BoardGraph::contains(const Square square) const {
	return squareToCell(square, m_size).has_value();
}

const NodeRows& BoardGraph::rows() const {
	return m_rows;
}

std::vector<Cell> BoardGraph::cells() const {
	std::vector<Cell> result;
	for (const auto& row: m_rows) {
		for (const auto& node: row) {
			result.push_back(node.cell);
		}
	}
	return result;
}

const std::vector<Cell>& BoardGraph::neighbors(const Cell cell) const {
	static const std::vector<Cell> NONE{};

	const auto it = m_adjacency.find(cell);
	return it == m_adjacency.end() ? NONE : it->second;
}

bool BoardGraph::isAdjacent(const Cell a, const Cell b) const {
	const auto& list = neighbors(a);
	return std::find(list.begin(), list.end(), b) != list.end();
}

Square BoardGraph::toSquare(const Cell cell) const {
	return rotateToSquare(cell, m_size);
}

std::optional<Cell> BoardGraph::toCell(const Square square) const {
	return squareToCell(square, m_size);
}

std::optional<Cell> BoardGraph::step(const Cell cell, const Direction direction, const int distance) const {
	if (!contains(cell)) {
		return std::nullopt;
	}
	const auto square = toSquare(cell);
	return toCell({square.x + direction.dx * distance, square.y + direction.dy * distance});
}

std::string BoardGraph::label(const Cell cell) const {
	const auto square = toSquare(cell);
	return std::format("{}{}", static_cast<char>('A' + square.x), square.y + 1);
}

std::optional<Cell> BoardGraph::parseLabel(const std::string& text) const {
	if (text.size() < 2 || text.size() > 3) {
		return std::nullopt;
	}
	const char file = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
	int rank        = 0;
	for (std::size_t i = 1; i < text.size(); ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			return std::nullopt;
		}
		rank = rank * 10 + (text[i] - '0');
	}
	return toCell({file - 'A', rank - 1});
}

} // namespace wiz
