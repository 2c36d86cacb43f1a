#include "board/minefield.hpp"

#include <random>
#include <stdexcept>
#include <string>

namespace minelogic {

Minefield::Minefield(int height, int width, int mines, uint32_t seed) {
    initGrid(height, width);
    if (mines < 0 || static_cast<size_t>(mines) > grid_.cellCount()) {
        throw std::invalid_argument("Cannot place " + std::to_string(mines) +
            " mines on a " + std::to_string(height) + "x" + std::to_string(width) + " grid");
    }

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> row_dist(0, height - 1);
    std::uniform_int_distribution<int> col_dist(0, width - 1);
    while (mines_.size() != static_cast<size_t>(mines)) {
        Cell cell(row_dist(rng), col_dist(rng));
        if (!isMine(cell)) placeMine(cell);
    }
}

Minefield::Minefield(int height, int width, const std::set<Cell>& mines) {
    initGrid(height, width);
    for (const auto& cell : mines) {
        grid_.requireContains(cell);
        placeMine(cell);
    }
}

void Minefield::initGrid(int height, int width) {
    if (height <= 0 || width <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive: " +
            std::to_string(height) + "x" + std::to_string(width));
    }
    grid_.height = height;
    grid_.width = width;
    board_.assign(grid_.cellCount(), false);
}

void Minefield::placeMine(const Cell& cell) {
    board_[static_cast<size_t>(cell.row) * grid_.width + cell.col] = true;
    mines_.insert(cell);
}

bool Minefield::isMine(const Cell& cell) const {
    grid_.requireContains(cell);
    return board_[static_cast<size_t>(cell.row) * grid_.width + cell.col];
}

int Minefield::nearbyMines(const Cell& cell) const {
    grid_.requireContains(cell);
    int count = 0;
    for (const auto& n : grid_.neighbors(cell)) {
        if (isMine(n)) count++;
    }
    return count;
}

void Minefield::render(std::ostream& os) const {
    const std::string rule(static_cast<size_t>(grid_.width) * 2 + 1, '-');
    for (int r = 0; r < grid_.height; r++) {
        os << rule << "\n";
        for (int c = 0; c < grid_.width; c++) {
            os << (isMine(Cell(r, c)) ? "|X" : "| ");
        }
        os << "|\n";
    }
    os << rule << "\n";
}

} // namespace minelogic
