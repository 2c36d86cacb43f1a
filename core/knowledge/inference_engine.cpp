#include "knowledge/inference_engine.hpp"

#include <algorithm>
#include <stdexcept>

namespace minelogic {

InferenceEngine::InferenceEngine(int height, int width, uint32_t seed)
    : rng_(seed) {
    if (height <= 0 || width <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive: " +
            std::to_string(height) + "x" + std::to_string(width));
    }
    grid_.height = height;
    grid_.width = width;
}

// ─── Cell status ───────────────────────────────────────────────

void InferenceEngine::markMine(const Cell& cell) {
    grid_.requireContains(cell);
    if (known_mine_.count(cell)) return;
    if (known_safe_.count(cell)) {
        throw std::logic_error("Cell " + cell.toString() + " is known safe, cannot mark as mine");
    }

    // Build the replacement list first so a contradiction leaves state untouched.
    std::vector<Constraint> updated;
    updated.reserve(constraints_.size());
    for (const auto& constraint : constraints_) {
        updated.push_back(constraint.contains(cell) ? constraint.withoutMine(cell) : constraint);
    }

    known_mine_.insert(cell);
    constraints_ = std::move(updated);
}

void InferenceEngine::markSafe(const Cell& cell) {
    grid_.requireContains(cell);
    if (known_safe_.count(cell)) return;
    if (known_mine_.count(cell)) {
        throw std::logic_error("Cell " + cell.toString() + " is a known mine, cannot mark as safe");
    }

    std::vector<Constraint> updated;
    updated.reserve(constraints_.size());
    for (const auto& constraint : constraints_) {
        updated.push_back(constraint.contains(cell) ? constraint.withoutSafe(cell) : constraint);
    }

    known_safe_.insert(cell);
    constraints_ = std::move(updated);
}

// ─── Observations ──────────────────────────────────────────────

PropagationStats InferenceEngine::recordObservation(const Cell& cell, int adjacent_mines) {
    grid_.requireContains(cell);
    std::set<Cell> neighborhood = grid_.neighbors(cell);
    if (adjacent_mines < 0 || static_cast<size_t>(adjacent_mines) > neighborhood.size()) {
        throw std::out_of_range("Adjacent mine count " + std::to_string(adjacent_mines) +
            " impossible for " + cell.toString() + " with " +
            std::to_string(neighborhood.size()) + " neighbors");
    }

    if (known_mine_.count(cell)) {
        throw std::logic_error("Cell " + cell.toString() + " is a known mine, cannot be observed");
    }

    // Validate the observation against current knowledge before touching any state.
    std::set<Cell> unknown;
    int mines_already_known = 0;
    for (const auto& n : neighborhood) {
        if (known_mine_.count(n)) {
            mines_already_known++;
        } else if (!known_safe_.count(n)) {
            unknown.insert(n);
        }
    }
    int remaining = adjacent_mines - mines_already_known;
    if (remaining < 0 || static_cast<size_t>(remaining) > unknown.size()) {
        throw std::logic_error("Observation " + cell.toString() + " = " +
            std::to_string(adjacent_mines) + " contradicts known mines");
    }

    markSafe(cell);
    moves_made_.insert(cell);

    if (!unknown.empty()) {
        Constraint observed(std::move(unknown), remaining);
        if (!hasConstraint(observed)) {
            constraints_.push_back(std::move(observed));
        }
    }

    return propagate();
}

bool InferenceEngine::addConstraint(const Constraint& constraint) {
    Constraint folded = constraint;
    for (const auto& cell : constraint.cells()) {
        grid_.requireContains(cell);
        if (known_mine_.count(cell)) {
            folded = folded.withoutMine(cell);
        } else if (known_safe_.count(cell)) {
            folded = folded.withoutSafe(cell);
        }
    }
    if (folded.empty() || hasConstraint(folded)) return false;
    constraints_.push_back(std::move(folded));
    return true;
}

// ─── Propagation ───────────────────────────────────────────────

PropagationStats InferenceEngine::propagate() {
    PropagationStats stats;
    compact();

    bool changed = true;
    while (changed) {
        changed = false;
        stats.passes++;

        std::set<Cell> safes;
        std::set<Cell> mines;
        for (const auto& constraint : constraints_) {
            auto s = constraint.knownSafes();
            safes.insert(s.begin(), s.end());
            auto m = constraint.knownMines();
            mines.insert(m.begin(), m.end());
        }

        for (const auto& cell : safes) {
            if (known_safe_.count(cell)) continue;
            markSafe(cell);
            stats.cells_marked_safe++;
            changed = true;
        }
        for (const auto& cell : mines) {
            if (known_mine_.count(cell)) continue;
            markMine(cell);
            stats.cells_marked_mine++;
            changed = true;
        }
        compact();

        int derived = inferSubsets();
        if (derived > 0) {
            stats.constraints_derived += derived;
            changed = true;
        }
        compact();
    }

    return stats;
}

int InferenceEngine::inferSubsets() {
    std::vector<Constraint> queued;
    for (size_t i = 0; i < constraints_.size(); i++) {
        const Constraint& a = constraints_[i];
        if (a.empty()) continue;
        for (size_t j = 0; j < constraints_.size(); j++) {
            if (i == j) continue;
            const Constraint& b = constraints_[j];
            if (!a.isSubsetOf(b)) continue;

            Constraint derived = b.difference(a);
            if (derived.empty()) continue;
            if (hasConstraint(derived)) continue;
            if (std::find(queued.begin(), queued.end(), derived) != queued.end()) continue;
            queued.push_back(std::move(derived));
        }
    }

    for (auto& constraint : queued) {
        constraints_.push_back(std::move(constraint));
    }
    return static_cast<int>(queued.size());
}

void InferenceEngine::compact() {
    std::vector<Constraint> kept;
    kept.reserve(constraints_.size());
    for (auto& constraint : constraints_) {
        if (constraint.empty()) continue;
        if (std::find(kept.begin(), kept.end(), constraint) != kept.end()) continue;
        kept.push_back(std::move(constraint));
    }
    constraints_ = std::move(kept);
}

bool InferenceEngine::hasConstraint(const Constraint& constraint) const {
    return std::find(constraints_.begin(), constraints_.end(), constraint) != constraints_.end();
}

// ─── Move selection ────────────────────────────────────────────

std::optional<Cell> InferenceEngine::chooseSafeMove() const {
    for (const auto& cell : known_safe_) {
        if (!moves_made_.count(cell)) return cell;
    }
    return std::nullopt;
}

std::optional<Cell> InferenceEngine::chooseRandomMove() {
    std::vector<Cell> candidates;
    for (const auto& cell : grid_.allCells()) {
        if (moves_made_.count(cell) || known_mine_.count(cell)) continue;
        candidates.push_back(cell);
    }
    if (candidates.empty()) return std::nullopt;

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng_)];
}

} // namespace minelogic
