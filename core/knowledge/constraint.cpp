#include "knowledge/constraint.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace minelogic {

Constraint::Constraint(std::set<Cell> cells, int count)
    : cells_(std::move(cells)), count_(count) {
    if (count_ < 0 || static_cast<size_t>(count_) > cells_.size()) {
        throw std::invalid_argument("Constraint count " + std::to_string(count_) +
            " out of range for " + std::to_string(cells_.size()) + " cells");
    }
}

std::set<Cell> Constraint::knownMines() const {
    if (!cells_.empty() && static_cast<size_t>(count_) == cells_.size()) {
        return cells_;
    }
    return {};
}

std::set<Cell> Constraint::knownSafes() const {
    if (count_ == 0) return cells_;
    return {};
}

bool Constraint::isSubsetOf(const Constraint& other) const {
    if (cells_.size() > other.cells_.size()) return false;
    return std::includes(other.cells_.begin(), other.cells_.end(),
                         cells_.begin(), cells_.end());
}

Constraint Constraint::withoutSafe(const Cell& cell) const {
    std::set<Cell> remaining = cells_;
    remaining.erase(cell);
    if (static_cast<size_t>(count_) > remaining.size()) {
        throw std::logic_error("Cell " + cell.toString() +
            " marked safe but required as a mine by " + toString());
    }
    return Constraint(std::move(remaining), count_);
}

Constraint Constraint::withoutMine(const Cell& cell) const {
    if (!contains(cell)) {
        throw std::logic_error("Cell " + cell.toString() + " not in " + toString());
    }
    if (count_ == 0) {
        throw std::logic_error("Cell " + cell.toString() +
            " marked as a mine but excluded by " + toString());
    }
    std::set<Cell> remaining = cells_;
    remaining.erase(cell);
    return Constraint(std::move(remaining), count_ - 1);
}

Constraint Constraint::difference(const Constraint& subset) const {
    if (!subset.isSubsetOf(*this)) {
        throw std::logic_error(subset.toString() + " is not a subset of " + toString());
    }
    std::set<Cell> remaining;
    std::set_difference(cells_.begin(), cells_.end(),
                        subset.cells_.begin(), subset.cells_.end(),
                        std::inserter(remaining, remaining.end()));
    int remaining_count = count_ - subset.count_;
    if (remaining_count < 0 || static_cast<size_t>(remaining_count) > remaining.size()) {
        throw std::logic_error("Contradictory constraints: " + toString() +
            " and " + subset.toString());
    }
    return Constraint(std::move(remaining), remaining_count);
}

std::string Constraint::toString() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& cell : cells_) {
        if (!first) oss << ", ";
        oss << cell;
        first = false;
    }
    oss << "} = " << count_;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Constraint& constraint) {
    return os << constraint.toString();
}

} // namespace minelogic
