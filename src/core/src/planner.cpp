#include "../include/nego_planner.hpp"
#include "../include/nego_errors.hpp"
#include "../include/nego_worker_pool.hpp"

#include <algorithm>
#include <set>

namespace nego {

const Placement* LayoutPlan::find(const std::string& suite) const {
    for (const auto& p : placements) {
        if (p.suite->name() == suite) return &p;
    }
    return nullptr;
}

namespace {

// Per-suite scratch state for one plan() call
struct SuiteState {
    SuitePositions pos;
    std::vector<std::optional<NodeId>> nodes;   // reserved node per level
    int level = 0;                              // chosen level
};

// Nodes reserved during one plan(); undone unless committed
class Rollback {
public:
    explicit Rollback(ReservationIndex& index) : index_(index) {}

    void record(NodeId id) { ids_.push_back(id); }
    void commit() { ids_.clear(); }

    void undo() {
        for (auto it = ids_.rbegin(); it != ids_.rend(); ++it) {
            if (index_.is_live(*it)) index_.remove(*it);
        }
        ids_.clear();
    }

private:
    ReservationIndex& index_;
    std::vector<NodeId> ids_;
};

void validate(const std::vector<SuiteLevel>& suites) {
    if (suites.empty()) {
        throw ContractViolation("layout needs at least one ciphersuite");
    }
    std::set<std::string> seen;
    for (const auto& s : suites) {
        if (!s.suite) {
            throw ContractViolation("null ciphersuite in layout request");
        }
        if (!seen.insert(s.suite->name()).second) {
            throw ContractViolation("ciphersuite " + s.suite->name() + " listed twice");
        }
    }
}

// Try to reserve level i of a suite. Records the node on success.
bool reserve_level(SuiteState& st, int i, ReservationIndex& index,
                   Rollback& rollback, LayoutObserver& observer) {
    ReservationNode node;
    node.suite = st.pos.suite->name();
    node.level = i;
    node.range.lo = st.pos.offsets[i];
    node.range.hi = node.range.lo + st.pos.plen;
    node.tag = st.pos.tags[i];

    auto id = index.insert(node);
    observer.on_attempt(node, id.has_value());
    if (!id) return false;

    rollback.record(*id);
    st.nodes[i] = id;
    return true;
}

} // namespace

PlacementPlanner::PlacementPlanner(ReservationIndex& index,
                                   LayoutObserver& observer,
                                   PlannerOptions options)
    : index_(index)
    , observer_(observer)
    , options_(options)
{}

std::vector<SuitePositions> PlacementPlanner::derive_all(const std::vector<SuiteLevel>& suites) const {
    validate(suites);

    auto derive_one = [](const SuiteLevel& s) {
        return derive_positions(s.suite, s.levels);
    };

    std::vector<SuitePositions> out;
    if (options_.derive_workers > 1 && suites.size() > 1) {
        WorkerPool pool(std::min(options_.derive_workers, suites.size()));
        out = pool.map(suites, derive_one);
    } else {
        out.reserve(suites.size());
        for (const auto& s : suites) out.push_back(derive_one(s));
    }

    // Most restrictive first; equal extents fall back to name order
    std::sort(out.begin(), out.end(), [](const SuitePositions& a, const SuitePositions& b) {
        if (a.max != b.max) return a.max < b.max;
        return a.suite->name() < b.suite->name();
    });
    return out;
}

LayoutPlan PlacementPlanner::plan(const std::vector<SuiteLevel>& suites) {
    std::vector<SuiteState> states;
    for (auto& pos : derive_all(suites)) {
        observer_.on_positions(pos);
        SuiteState st;
        st.nodes.resize(pos.levels());
        st.pos = std::move(pos);
        states.push_back(std::move(st));
    }

    Rollback rollback(index_);
    size_t hdrlen = 0;

    try {
        for (auto& st : states) {
            observer_.on_suite_begin(st.pos);

            // The highest level is the last resort; if even that is
            // shadowed by an earlier suite there is nowhere to go.
            int top = st.pos.levels() - 1;
            int j = top;
            if (!reserve_level(st, j, index_, rollback, observer_)) {
                observer_.on_placement_failed(st.pos.suite->name());
                throw PlacementExhausted(st.pos.suite->name());
            }
            // Walk down while the next lower level is free too
            for (; j > 0; --j) {
                if (!reserve_level(st, j - 1, index_, rollback, observer_)) {
                    break;
                }
            }
            st.level = j;
            hdrlen = std::max(hdrlen, st.pos.offsets[j] + st.pos.plen);
            observer_.on_suite_placed(st.pos.suite->name(), j, top);
        }
    } catch (...) {
        rollback.undo();
        throw;
    }
    rollback.commit();

    observer_.on_header_length(hdrlen);
    index_.dump(observer_, "intermediate");

    // Only the chosen level stays reserved
    LayoutPlan plan;
    plan.header_length = hdrlen;
    for (auto& st : states) {
        for (int i = st.level + 1; i < st.pos.levels(); ++i) {
            if (st.nodes[i]) {
                index_.remove(*st.nodes[i]);
                st.nodes[i].reset();
            }
        }

        Placement p;
        p.suite = st.pos.suite;
        p.level = st.level;
        p.offset = st.pos.offsets[st.level];
        p.length = st.pos.plen;
        p.tag = st.pos.tags[st.level];
        p.node = *st.nodes[st.level];
        plan.placements.push_back(std::move(p));
    }

    index_.dump(observer_, "ciphersuite");
    return plan;
}

} // namespace nego
