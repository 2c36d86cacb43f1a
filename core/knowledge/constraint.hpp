#pragma once

#include "board/cell.hpp"

#include <ostream>
#include <set>
#include <string>

namespace minelogic {

// ─── Constraint ────────────────────────────────────────────────
// A logical statement about the board: exactly `count` of `cells`
// are mines. Immutable value object; every derivation returns a new
// Constraint and the InferenceEngine replaces the old one.

class Constraint {
public:
    /// Throws std::invalid_argument unless 0 <= count <= cells.size().
    Constraint(std::set<Cell> cells, int count);

    const std::set<Cell>& cells() const { return cells_; }
    int count() const { return count_; }
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    /// All cells, if every cell must be a mine; otherwise empty.
    std::set<Cell> knownMines() const;

    /// All cells, if no cell can be a mine; otherwise empty.
    std::set<Cell> knownSafes() const;

    bool contains(const Cell& cell) const { return cells_.count(cell) > 0; }
    bool isSubsetOf(const Constraint& other) const;

    /// Copy without `cell`, count unchanged.
    Constraint withoutSafe(const Cell& cell) const;

    /// Copy without `cell`, count reduced by one.
    /// Throws std::logic_error if `cell` is not part of this constraint
    /// or if no mine is left to account for it.
    Constraint withoutMine(const Cell& cell) const;

    /// Subset rule: given `subset` whose cells are all in this constraint,
    /// the remaining cells hold exactly count() - subset.count() mines.
    /// Throws std::logic_error if `subset` is not a subset or the
    /// resulting count falls outside [0, |cells|].
    Constraint difference(const Constraint& subset) const;

    std::string toString() const;

    bool operator==(const Constraint& other) const {
        return count_ == other.count_ && cells_ == other.cells_;
    }
    bool operator!=(const Constraint& other) const { return !(*this == other); }

private:
    std::set<Cell> cells_;
    int count_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Constraint& constraint);

} // namespace minelogic
