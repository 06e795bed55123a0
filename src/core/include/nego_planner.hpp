#ifndef NEGO_PLANNER_HPP
#define NEGO_PLANNER_HPP

#include "nego_suite.hpp"
#include "nego_positions.hpp"
#include "nego_reservation.hpp"
#include "nego_observer.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nego {

/**
 * @brief A suite together with its standardized level bound
 */
struct SuiteLevel {
    SuitePtr suite;
    int levels = 1;
};

/**
 * @brief Where one suite's point ended up
 */
struct Placement {
    SuitePtr suite;
    int level = 0;
    size_t offset = 0;
    size_t length = 0;
    uint32_t tag = 0;
    NodeId node = 0;

    size_t end() const { return offset + length; }
};

/**
 * @brief Result of a layout computation
 *
 * placements are in processing order (ascending worst-case extent).
 */
struct LayoutPlan {
    size_t header_length = 0;
    std::vector<Placement> placements;

    const Placement* find(const std::string& suite) const;
    bool empty() const { return placements.empty(); }
};

struct PlannerOptions {
    // >1 derives suites' positions on a worker pool
    size_t derive_workers = 1;
};

/**
 * @brief Greedy scarcity-ordered placement of suite points
 *
 * Suites with the smallest worst-case extent go first and get first
 * choice of low offsets. Each suite reserves its highest level, then
 * walks down until a level is blocked; the lowest reserved level wins.
 * Higher levels stay reserved until every suite is placed so that later
 * suites cannot land on them, then they are released.
 *
 * All reservations made by a failed plan() are undone before the
 * exception propagates.
 */
class PlacementPlanner {
public:
    explicit PlacementPlanner(ReservationIndex& index,
                              LayoutObserver& observer = null_observer(),
                              PlannerOptions options = PlannerOptions{});

    /**
     * @throws ContractViolation on empty input, null or duplicate suites,
     *         or an invalid level bound
     * @throws PlacementExhausted when a suite's highest level is taken
     */
    LayoutPlan plan(const std::vector<SuiteLevel>& suites);

    // Candidate positions for every suite, sorted by placement priority
    std::vector<SuitePositions> derive_all(const std::vector<SuiteLevel>& suites) const;

private:
    ReservationIndex& index_;
    LayoutObserver& observer_;
    PlannerOptions options_;
};

} // namespace nego

#endif // NEGO_PLANNER_HPP
