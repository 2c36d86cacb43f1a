#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace minelogic {

/// A board coordinate. Ordered row-major so std::set<Cell> iterates
/// top-left to bottom-right.
struct Cell {
    int row = 0;
    int col = 0;

    Cell() = default;
    Cell(int row, int col) : row(row), col(col) {}

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
    bool operator<(const Cell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }

    std::string toString() const {
        return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Cell& cell) {
    return os << cell.toString();
}

struct CellHash {
    std::size_t operator()(const Cell& cell) const {
        uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(cell.row)) << 32) |
                       static_cast<uint32_t>(cell.col);
        return std::hash<uint64_t>()(key);
    }
};

} // namespace minelogic
