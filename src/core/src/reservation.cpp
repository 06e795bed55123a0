#include "../include/nego_reservation.hpp"
#include "../include/nego_observer.hpp"
#include "../include/nego_errors.hpp"

#include <stdexcept>
#include <iterator>
#include <string>

namespace nego {

std::optional<NodeId> ReservationIndex::insert(const ReservationNode& node) {
    const ByteRange& r = node.range;
    if (r.empty()) {
        throw ContractViolation("empty reservation range for ciphersuite " + node.suite);
    }

    // First live node starting at or after our end cannot overlap;
    // the one just before it is the only candidate that can.
    auto next = by_start_.lower_bound(r.hi);
    if (next != by_start_.begin()) {
        auto prev = std::prev(next);
        if (arena_[prev->second].node.range.hi > r.lo) {
            return std::nullopt;
        }
    }

    NodeId id = arena_.size();
    arena_.push_back(Slot{node, true});
    by_start_.emplace(r.lo, id);
    return id;
}

void ReservationIndex::remove(NodeId id) {
    if (id >= arena_.size() || !arena_[id].live) {
        throw std::logic_error("removing reservation node " + std::to_string(id) +
                               " that is not live");
    }
    Slot& slot = arena_[id];
    by_start_.erase(slot.node.range.lo);
    slot.live = false;
}

void ReservationIndex::clear() {
    arena_.clear();
    by_start_.clear();
}

bool ReservationIndex::is_live(NodeId id) const {
    return id < arena_.size() && arena_[id].live;
}

const ReservationNode* ReservationIndex::find(NodeId id) const {
    return is_live(id) ? &arena_[id].node : nullptr;
}

size_t ReservationIndex::extent() const {
    if (by_start_.empty()) return 0;
    // Disjoint ranges: the last start also has the last end
    return arena_[by_start_.rbegin()->second].node.range.hi;
}

std::vector<ReservationNode> ReservationIndex::live_nodes() const {
    std::vector<ReservationNode> out;
    out.reserve(by_start_.size());
    for (const auto& [lo, id] : by_start_) {
        out.push_back(arena_[id].node);
    }
    return out;
}

void ReservationIndex::dump(LayoutObserver& observer, const std::string& phase) const {
    observer.on_layout_dump(phase, live_nodes());
}

} // namespace nego
