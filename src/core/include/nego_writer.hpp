#ifndef NEGO_WRITER_HPP
#define NEGO_WRITER_HPP

#include "nego_suite.hpp"
#include "nego_crypto.hpp"
#include "nego_reservation.hpp"
#include "nego_planner.hpp"
#include "nego_observer.hpp"

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nego {

/**
 * @brief One recipient's entrypoint
 *
 * data is the entrypoint payload decryptable by the key owner. It may be
 * left empty while computing a layout and filled in before emission;
 * when present it must be exactly the header's entry length.
 */
struct Entry {
    SuitePtr suite;                    // suite the public key is drawn from
    std::vector<uint8_t> public_key;   // entrypoint owner's public key
    std::vector<uint8_t> data;
};

/**
 * @brief Lays out a negotiation header
 *
 * A negotiation header hides a variable number of entrypoints in a blob
 * of random-looking bytes. Each entrypoint is discoverable only by the
 * owner of one public key, and keys may come from any mix of suites
 * without coordination between them. Every suite in use gets one point
 * position in the header; owners find their entrypoint from that point.
 *
 * init() computes the layout once; emission code then sizes buffers
 * with header_length() and fills in points at each placement.
 *
 * Not safe for concurrent use.
 */
class Writer {
public:
    explicit Writer(LayoutObserver& observer = null_observer(),
                    PlannerOptions options = PlannerOptions{});

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /**
     * @brief Compute the header layout
     *
     * suite_levels lists every suite in use with its standardized level
     * bound (usually recommended_levels() of the expected suite count).
     * Every entry's suite must appear there.
     *
     * @param rand retained for emission; layout itself never draws from
     *             it. nullptr selects SodiumRandom.
     * @return header length in bytes
     * @throws ContractViolation, PlacementExhausted
     */
    size_t init(const std::vector<SuiteLevel>& suite_levels,
                size_t entry_len,
                const std::vector<Entry>& entries,
                std::shared_ptr<RandomSource> rand = nullptr);

    bool ready() const { return !layout_.empty(); }
    size_t header_length() const { return layout_.header_length; }
    size_t entry_length() const { return entry_len_; }

    const LayoutPlan& layout() const { return layout_; }
    std::optional<Placement> placement(const std::string& suite) const;
    const ReservationIndex& index() const { return index_; }

    // Distinct suites referenced by the entries, in first-seen order
    const std::vector<SuitePtr>& suites_in_use() const { return in_use_; }

    RandomSource& random() const;

private:
    void reset();
    void validate(const std::vector<SuiteLevel>& suite_levels,
                  size_t entry_len,
                  const std::vector<Entry>& entries);

    LayoutObserver& observer_;
    PlannerOptions options_;
    ReservationIndex index_;
    LayoutPlan layout_;
    size_t entry_len_ = 0;
    std::vector<SuitePtr> in_use_;
    std::shared_ptr<RandomSource> rand_;
};

} // namespace nego

#endif // NEGO_WRITER_HPP
