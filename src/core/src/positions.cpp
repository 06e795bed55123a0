#include "../include/nego_positions.hpp"
#include "../include/nego_errors.hpp"

#include <limits>
#include <string>

namespace nego {

size_t SuitePositions::level_base(int level) const {
    // Levels 0..level-1 hold 2^level - 1 slots in total
    return ((size_t{1} << level) - 1) * plen;
}

size_t SuitePositions::slot_index(int level) const {
    return static_cast<size_t>(tags.at(level)) & (slots_at(level) - 1);
}

SuitePositions derive_positions(const SuitePtr& suite, int level_bound) {
    if (!suite) {
        throw ContractViolation("cannot derive positions for a null ciphersuite");
    }
    if (level_bound < 1 || level_bound > MAX_LEVELS) {
        throw ContractViolation("level bound " + std::to_string(level_bound) +
                                " for ciphersuite " + suite->name() +
                                " outside [1, " + std::to_string(MAX_LEVELS) + "]");
    }

    SuitePositions sp;
    sp.suite = suite;
    sp.plen = suite->point_len();
    if (sp.plen == 0 ||
        sp.plen > std::numeric_limits<size_t>::max() >> (level_bound + 1)) {
        throw ContractViolation("ciphersuite " + suite->name() +
                                " has an unusable point length");
    }
    sp.tags.resize(level_bound);
    sp.offsets.resize(level_bound);

    auto stream = suite->position_stream();

    size_t level_ofs = 0;
    for (int i = 0; i < level_bound; ++i) {
        size_t level_len = SuitePositions::slots_at(i);
        sp.tags[i] = stream->next_u32_be();
        size_t idx = static_cast<size_t>(sp.tags[i]) & (level_len - 1);
        sp.offsets[i] = level_ofs + idx * sp.plen;
        level_ofs += level_len * sp.plen;
    }

    sp.max = sp.offsets[level_bound - 1] + sp.plen;
    return sp;
}

} // namespace nego
