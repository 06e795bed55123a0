#include "../include/nego_writer.hpp"
#include "../include/nego_errors.hpp"

#include <map>
#include <set>
#include <stdexcept>

namespace nego {

Writer::Writer(LayoutObserver& observer, PlannerOptions options)
    : observer_(observer)
    , options_(options)
{}

void Writer::reset() {
    index_.clear();
    layout_ = LayoutPlan{};
    entry_len_ = 0;
    in_use_.clear();
    rand_.reset();
}

void Writer::validate(const std::vector<SuiteLevel>& suite_levels,
                      size_t entry_len,
                      const std::vector<Entry>& entries) {
    if (suite_levels.empty()) {
        throw ContractViolation("negotiation header needs at least one ciphersuite");
    }
    if (entry_len == 0) {
        throw ContractViolation("entry length must be non-zero");
    }

    std::map<std::string, SuitePtr> known;
    for (const auto& sl : suite_levels) {
        if (sl.suite) known.emplace(sl.suite->name(), sl.suite);
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < entries.size(); ++i) {
        const Entry& e = entries[i];
        std::string where = "entry " + std::to_string(i);
        if (!e.suite) {
            throw ContractViolation(where + " has no ciphersuite");
        }
        auto it = known.find(e.suite->name());
        if (it == known.end()) {
            throw ContractViolation(where + " uses ciphersuite " + e.suite->name() +
                                    " with no level bound");
        }
        if (it->second->point_len() != e.suite->point_len()) {
            throw ContractViolation(where + " ciphersuite " + e.suite->name() + " has point length " +
                                    std::to_string(e.suite->point_len()) + ", layout uses " +
                                    std::to_string(it->second->point_len()));
        }
        if (e.public_key.empty()) {
            throw ContractViolation(where + " has an empty public key");
        }
        if (!e.data.empty() && e.data.size() != entry_len) {
            throw ContractViolation(where + " payload is " + std::to_string(e.data.size()) +
                                    " bytes, expected " + std::to_string(entry_len));
        }
        if (seen.insert(e.suite->name()).second) {
            in_use_.push_back(e.suite);
        }
    }
}

size_t Writer::init(const std::vector<SuiteLevel>& suite_levels,
                    size_t entry_len,
                    const std::vector<Entry>& entries,
                    std::shared_ptr<RandomSource> rand) {
    reset();

    try {
        validate(suite_levels, entry_len, entries);

        PlacementPlanner planner(index_, observer_, options_);
        layout_ = planner.plan(suite_levels);
    } catch (const std::exception&) {
        reset();
        throw;
    }

    entry_len_ = entry_len;
    rand_ = rand ? std::move(rand) : std::make_shared<SodiumRandom>();
    return layout_.header_length;
}

std::optional<Placement> Writer::placement(const std::string& suite) const {
    const Placement* p = layout_.find(suite);
    if (!p) return std::nullopt;
    return *p;
}

RandomSource& Writer::random() const {
    if (!rand_) {
        throw std::logic_error("Writer::random() before a successful init()");
    }
    return *rand_;
}

} // namespace nego
