#include "../include/nego_suite.hpp"
#include "../include/nego_positions.hpp"
#include "../include/nego_errors.hpp"

#include <utility>

namespace nego {

StandardSuite::StandardSuite(std::string name, size_t point_len, SeedHash seed_hash)
    : name_(std::move(name))
    , point_len_(point_len)
    , seed_hash_(seed_hash)
{
    if (name_.empty()) {
        throw ContractViolation("ciphersuite name must not be empty");
    }
    if (point_len_ == 0) {
        throw ContractViolation("ciphersuite " + name_ + " has zero point length");
    }
}

std::unique_ptr<KeyStream> StandardSuite::position_stream() const {
    return std::make_unique<HashStream>(POSITION_SEED_PREFIX + name_, seed_hash_);
}

// ==================== SuiteRegistry ====================

SuiteRegistry SuiteRegistry::with_standard_suites() {
    SuiteRegistry reg;
    reg.add(std::make_shared<StandardSuite>("x25519-elligator2-chacha20", 32, SeedHash::BLAKE2B_256));
    reg.add(std::make_shared<StandardSuite>("ed25519-elligator2-sha512",  32, SeedHash::SHA256));
    reg.add(std::make_shared<StandardSuite>("ristretto255-blake2b",       32, SeedHash::BLAKE2B_256));
    reg.add(std::make_shared<StandardSuite>("x448-elligator2-shake256",   56, SeedHash::BLAKE2B_256));
    reg.add(std::make_shared<StandardSuite>("secp256k1-ellswift-sha256",  64, SeedHash::SHA256));
    return reg;
}

void SuiteRegistry::add(SuitePtr suite) {
    if (!suite) {
        throw ContractViolation("cannot register a null ciphersuite");
    }
    if (suite->name().empty() || suite->point_len() == 0) {
        throw ContractViolation("ciphersuite needs a name and a non-zero point length");
    }
    if (!suites_.emplace(suite->name(), suite).second) {
        throw ContractViolation("ciphersuite " + suite->name() + " already registered");
    }
}

SuitePtr SuiteRegistry::find(const std::string& name) const {
    auto it = suites_.find(name);
    return it != suites_.end() ? it->second : nullptr;
}

std::vector<SuitePtr> SuiteRegistry::all() const {
    std::vector<SuitePtr> out;
    out.reserve(suites_.size());
    for (const auto& [name, suite] : suites_) {
        out.push_back(suite);
    }
    return out;
}

int recommended_levels(size_t expected_suites) {
    int levels = 0;
    size_t capacity = 1;
    while (levels < MAX_LEVELS && capacity < expected_suites) {
        capacity <<= 1;
        ++levels;
    }
    return levels < 1 ? 1 : levels;
}

} // namespace nego
