#ifndef NEGO_OBSERVER_HPP
#define NEGO_OBSERVER_HPP

#include "nego_positions.hpp"
#include "nego_reservation.hpp"
#include "nego_logger.hpp"

#include <string>
#include <vector>
#include <cstddef>

namespace nego {

/**
 * @brief Diagnostics hooks for layout computation
 *
 * Every hook defaults to a no-op. Implementations must not throw and
 * have no way to influence placement decisions.
 */
class LayoutObserver {
public:
    virtual ~LayoutObserver() = default;

    // Candidate positions computed for a suite
    virtual void on_positions(const SuitePositions&) {}

    // Suite is about to be placed; called in processing order
    virtual void on_suite_begin(const SuitePositions&) {}

    // A reservation was tried for one (suite, level)
    virtual void on_attempt(const ReservationNode&, bool /*reserved*/) {}

    // Suite settled on level chosen; levels chosen..top were reserved
    virtual void on_suite_placed(const std::string& /*suite*/, int /*chosen*/, int /*top*/) {}

    virtual void on_placement_failed(const std::string& /*suite*/) {}

    virtual void on_header_length(size_t) {}

    // Snapshot of live reservations ("intermediate" or "ciphersuite")
    virtual void on_layout_dump(const std::string& /*phase*/,
                                const std::vector<ReservationNode>& /*nodes*/) {}
};

/**
 * @brief Observer that writes everything to nego::Logger
 *
 * Per-level detail goes out at TRACE, per-suite summaries at DEBUG.
 */
class LoggingObserver : public LayoutObserver {
public:
    void on_positions(const SuitePositions& sp) override;
    void on_suite_begin(const SuitePositions& sp) override;
    void on_attempt(const ReservationNode& node, bool reserved) override;
    void on_suite_placed(const std::string& suite, int chosen, int top) override;
    void on_placement_failed(const std::string& suite) override;
    void on_header_length(size_t len) override;
    void on_layout_dump(const std::string& phase,
                        const std::vector<ReservationNode>& nodes) override;
};

// Shared no-op instance
LayoutObserver& null_observer();

} // namespace nego

#endif // NEGO_OBSERVER_HPP
