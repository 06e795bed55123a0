#ifndef NEGO_SUITE_HPP
#define NEGO_SUITE_HPP

#include "nego_crypto.hpp"

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <cstddef>

namespace nego {

// Prefix of the public seed every suite's position stream is keyed with
inline constexpr const char* POSITION_SEED_PREFIX = "NegoCipherSuite:";

/**
 * @brief A self-contained ciphersuite as seen by header layout
 *
 * Layout only needs the suite's public identity, the length of its
 * uniform (random-looking) point encoding, and a public pseudorandom
 * stream to draw candidate positions from. Suites never coordinate
 * with each other.
 */
class Suite {
public:
    virtual ~Suite() = default;

    virtual const std::string& name() const = 0;

    // Length in bytes of one uniformly encoded point
    virtual size_t point_len() const = 0;

    // Fresh stream seeded with POSITION_SEED_PREFIX + name()
    virtual std::unique_ptr<KeyStream> position_stream() const = 0;
};

using SuitePtr = std::shared_ptr<const Suite>;

/**
 * @brief Suite defined by name, point length and seed hash
 */
class StandardSuite : public Suite {
public:
    StandardSuite(std::string name, size_t point_len, SeedHash seed_hash);

    const std::string& name() const override { return name_; }
    size_t point_len() const override { return point_len_; }
    SeedHash seed_hash() const { return seed_hash_; }

    std::unique_ptr<KeyStream> position_stream() const override;

private:
    std::string name_;
    size_t point_len_;
    SeedHash seed_hash_;
};

/**
 * @brief Name -> suite catalog
 *
 * with_standard_suites() returns the built-in set. Lookups are by exact
 * name; registration rejects duplicates.
 */
class SuiteRegistry {
public:
    SuiteRegistry() = default;

    static SuiteRegistry with_standard_suites();

    // Throws ContractViolation on null suite, empty name, zero point
    // length or duplicate name
    void add(SuitePtr suite);

    SuitePtr find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    std::vector<SuitePtr> all() const;
    size_t size() const { return suites_.size(); }

private:
    std::map<std::string, SuitePtr> suites_;
};

/**
 * @brief Level bound to standardize for a suite
 *
 * ceil(log2(expected_suites)), at least 1 and at most MAX_LEVELS.
 */
int recommended_levels(size_t expected_suites);

} // namespace nego

#endif // NEGO_SUITE_HPP
