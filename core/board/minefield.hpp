#pragma once

#include "board/cell.hpp"
#include "board/grid.hpp"

#include <cstdint>
#include <ostream>
#include <set>
#include <vector>

namespace minelogic {

/// The hidden board: mine placement and neighbor counts.
/// The inference engine never sees it; the game loop reads from it.
class Minefield {
public:
    /// Place `mines` distinct mines uniformly at random.
    /// Throws std::invalid_argument for non-positive dimensions or
    /// more mines than cells.
    Minefield(int height, int width, int mines, uint32_t seed);

    /// Use an explicit mine layout. Throws std::out_of_range if a mine
    /// lies outside the grid.
    Minefield(int height, int width, const std::set<Cell>& mines);

    bool isMine(const Cell& cell) const;

    /// Mines among the 8 neighbors of `cell`, not counting `cell` itself.
    int nearbyMines(const Cell& cell) const;

    /// True when the flagged cells are exactly the mines.
    bool won(const std::set<Cell>& flagged) const { return flagged == mines_; }

    bool contains(const Cell& cell) const { return grid_.contains(cell); }
    const std::set<Cell>& mines() const { return mines_; }
    size_t mineCount() const { return mines_.size(); }
    size_t safeCellCount() const { return grid_.cellCount() - mines_.size(); }
    const GridSize& grid() const { return grid_; }
    int height() const { return grid_.height; }
    int width() const { return grid_.width; }

    /// Text drawing of mine locations, one `|X` or `| ` per cell.
    void render(std::ostream& os) const;

private:
    GridSize grid_;
    std::set<Cell> mines_;
    std::vector<bool> board_;  // row-major, true = mine

    void initGrid(int height, int width);
    void placeMine(const Cell& cell);
};

} // namespace minelogic
