#ifndef NEGO_ERRORS_HPP
#define NEGO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace nego {

/**
 * @brief Caller bug: bad level bound, empty suite set, malformed entry.
 *
 * Never retried internally.
 */
class ContractViolation : public std::invalid_argument {
public:
    explicit ContractViolation(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief A suite's last-resort (highest level) slot was already taken.
 *
 * Fatal for the layout computation. The caller may retry the whole
 * computation with different level bounds.
 */
class PlacementExhausted : public std::runtime_error {
public:
    explicit PlacementExhausted(const std::string& suite)
        : std::runtime_error("failed to find viable position for ciphersuite " + suite)
        , suite_(suite) {}

    const std::string& suite() const noexcept { return suite_; }

private:
    std::string suite_;
};

} // namespace nego

#endif // NEGO_ERRORS_HPP
