#pragma once

#include "board/cell.hpp"
#include "board/grid.hpp"
#include "knowledge/constraint.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <vector>

namespace minelogic {

/// What one propagation run changed in the knowledge base.
struct PropagationStats {
    int passes = 0;
    int cells_marked_safe = 0;
    int cells_marked_mine = 0;
    int constraints_derived = 0;

    bool changed() const {
        return cells_marked_safe > 0 || cells_marked_mine > 0 || constraints_derived > 0;
    }
};

// ─── Inference Engine ──────────────────────────────────────────
// Knowledge base for one game. Holds the cells observed so far, the
// cells proven safe or mined, and the live constraints, and derives
// new certainties from them by propagating to a fixed point:
// - trivial extraction (count == 0 → safe, count == |cells| → mines)
// - subset difference ({A ⊆ B} → {B − A, B.count − A.count})
//
// Knowledge is monotonic: a cell proven safe or mine stays so, and
// no live constraint mentions a cell whose status is known.

class InferenceEngine {
public:
    InferenceEngine(int height, int width, uint32_t seed = 42);

    /// Record that `cell` is a mine and remove it from every constraint.
    /// No-op if already known. Throws std::logic_error if `cell` is known safe.
    void markMine(const Cell& cell);

    /// Record that `cell` is safe and remove it from every constraint.
    /// No-op if already known. Throws std::logic_error if `cell` is a known mine.
    void markSafe(const Cell& cell);

    /// Ingest a revealed cell and its adjacent-mine count, then propagate.
    /// Throws std::out_of_range for a cell outside the grid or a count
    /// above the cell's in-bounds neighbor count (8 inside, 5 on an edge,
    /// 3 in a corner). Throws std::logic_error, leaving state untouched,
    /// if the count contradicts mines already known.
    PropagationStats recordObservation(const Cell& cell, int adjacent_mines);

    /// Add a constraint directly (skipped if already present), without
    /// propagating. Cells with known status are folded in first.
    /// Returns true if the knowledge base grew.
    bool addConstraint(const Constraint& constraint);

    /// Apply both reduction rules until a full pass changes nothing.
    PropagationStats propagate();

    /// A known-safe cell not yet played, smallest in row-major order.
    std::optional<Cell> chooseSafeMove() const;

    /// A uniformly chosen cell that is neither played nor a known mine.
    std::optional<Cell> chooseRandomMove();

    // ── Inspection ──
    const std::set<Cell>& movesMade() const { return moves_made_; }
    const std::set<Cell>& knownSafes() const { return known_safe_; }
    const std::set<Cell>& knownMines() const { return known_mine_; }
    const std::vector<Constraint>& constraints() const { return constraints_; }

    bool isKnown(const Cell& cell) const {
        return known_safe_.count(cell) > 0 || known_mine_.count(cell) > 0;
    }

    /// In-bounds 8-neighborhood of `cell`.
    std::set<Cell> neighbors(const Cell& cell) const { return grid_.neighbors(cell); }

    const GridSize& grid() const { return grid_; }
    int height() const { return grid_.height; }
    int width() const { return grid_.width; }

private:
    GridSize grid_;
    std::set<Cell> moves_made_;
    std::set<Cell> known_safe_;
    std::set<Cell> known_mine_;
    std::vector<Constraint> constraints_;
    std::mt19937 rng_;

    bool hasConstraint(const Constraint& constraint) const;

    /// Step (c): derive subset differences; returns number added.
    int inferSubsets();

    /// Step (d): drop empty constraints and duplicates.
    void compact();
};

} // namespace minelogic
