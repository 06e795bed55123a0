#ifndef NEGO_POSITIONS_HPP
#define NEGO_POSITIONS_HPP

#include "nego_suite.hpp"

#include <vector>
#include <cstdint>
#include <cstddef>

namespace nego {

// Level bounds above this would make the worst-case header absurdly large
inline constexpr int MAX_LEVELS = 30;

/**
 * @brief Candidate point positions of one suite, one per level
 *
 * Level i spans 2^i point-sized slots laid out after all lower levels;
 * the level's tag picks one of them. Level 0 has a single slot at
 * offset 0.
 */
struct SuitePositions {
    SuitePtr suite;
    std::vector<uint32_t> tags;       // per-level pseudorandom tag
    std::vector<size_t> offsets;      // per-level chosen slot offset
    size_t plen = 0;                  // point length in bytes
    size_t max = 0;                   // end of the highest level's slot

    int levels() const { return static_cast<int>(offsets.size()); }

    // First byte of level i's slot table
    size_t level_base(int level) const;
    // Number of slots at level i (2^i)
    static size_t slots_at(int level) { return size_t{1} << level; }
    size_t slot_index(int level) const;
};

/**
 * @brief Derive a suite's candidate positions
 *
 * Deterministic: depends only on the suite's public stream and
 * level_bound, so independent parties compute identical candidates.
 * @throws ContractViolation on null suite or level_bound outside [1, MAX_LEVELS]
 */
SuitePositions derive_positions(const SuitePtr& suite, int level_bound);

} // namespace nego

#endif // NEGO_POSITIONS_HPP
