#pragma once

#include "board/cell.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace minelogic {

/// Board dimensions shared by the minefield and the inference engine.
struct GridSize {
    int height = 0;
    int width = 0;

    bool contains(const Cell& cell) const {
        return cell.row >= 0 && cell.row < height &&
               cell.col >= 0 && cell.col < width;
    }

    size_t cellCount() const {
        return static_cast<size_t>(height) * static_cast<size_t>(width);
    }

    void requireContains(const Cell& cell) const {
        if (!contains(cell)) {
            throw std::out_of_range("Cell " + cell.toString() + " outside " +
                std::to_string(height) + "x" + std::to_string(width) + " grid");
        }
    }

    /// The 8-connected neighborhood of `cell`, clipped to the grid.
    std::set<Cell> neighbors(const Cell& cell) const {
        std::set<Cell> result;
        for (int r = cell.row - 1; r <= cell.row + 1; r++) {
            for (int c = cell.col - 1; c <= cell.col + 1; c++) {
                Cell n(r, c);
                if (n == cell || !contains(n)) continue;
                result.insert(n);
            }
        }
        return result;
    }

    /// Every cell in row-major order.
    std::vector<Cell> allCells() const {
        std::vector<Cell> cells;
        cells.reserve(cellCount());
        for (int r = 0; r < height; r++) {
            for (int c = 0; c < width; c++) {
                cells.emplace_back(r, c);
            }
        }
        return cells;
    }
};

} // namespace minelogic
