#ifndef NEGO_RESERVATION_HPP
#define NEGO_RESERVATION_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nego {

class LayoutObserver;

using NodeId = size_t;

/**
 * @brief Half-open byte range [lo, hi)
 */
struct ByteRange {
    size_t lo = 0;
    size_t hi = 0;

    size_t length() const { return hi - lo; }
    bool empty() const { return hi <= lo; }
    bool overlaps(const ByteRange& other) const {
        return lo < other.hi && other.lo < hi;
    }
};

/**
 * @brief One attempted or confirmed claim on header bytes
 */
struct ReservationNode {
    std::string suite;
    int level = 0;
    ByteRange range;
    uint32_t tag = 0;
};

/**
 * @brief Set of mutually non-overlapping reservations over [0, inf)
 *
 * Nodes live in an arena addressed by NodeId; removal tombstones the
 * slot. A map keyed by range start gives O(log n) overlap checks: since
 * live ranges are disjoint, only the live range starting closest below
 * a candidate's end can intersect it.
 *
 * Not thread-safe.
 */
class ReservationIndex {
public:
    ReservationIndex() = default;

    ReservationIndex(const ReservationIndex&) = delete;
    ReservationIndex& operator=(const ReservationIndex&) = delete;
    ReservationIndex(ReservationIndex&&) = default;
    ReservationIndex& operator=(ReservationIndex&&) = default;

    /**
     * @brief Claim node.range if it overlaps no live node
     * @return id of the stored node, or nullopt with no change
     * @throws ContractViolation if the range is empty
     */
    std::optional<NodeId> insert(const ReservationNode& node);

    /**
     * @brief Drop a live node
     * @throws std::logic_error if id is unknown or already removed
     */
    void remove(NodeId id);

    // Remove every node, live or dead
    void clear();

    bool is_live(NodeId id) const;
    const ReservationNode* find(NodeId id) const;

    size_t live_count() const { return by_start_.size(); }
    bool empty() const { return by_start_.empty(); }

    // Highest end offset among live nodes, 0 when empty
    size_t extent() const;

    // Live nodes ascending by start offset
    std::vector<ReservationNode> live_nodes() const;

    // Report live nodes to the observer, tagged with a phase label
    void dump(LayoutObserver& observer, const std::string& phase) const;

private:
    struct Slot {
        ReservationNode node;
        bool live = false;
    };

    std::vector<Slot> arena_;
    std::map<size_t, NodeId> by_start_;
};

} // namespace nego

#endif // NEGO_RESERVATION_HPP
