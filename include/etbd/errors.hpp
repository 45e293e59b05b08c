// =============================================================================
// errors.hpp — Exception types raised by the simulator.
//
//   ConfigurationError  – invalid parameters, detected before generation 0.
//   InvariantViolation  – an engine bug (population size or genotype length
//                         drifted).  Never reachable in correct code.
//
// Both are fatal to the run.  There is no partial-generation recovery.
// =============================================================================
#pragma once

#include <stdexcept>
#include <string>

namespace etbd {

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("configuration error: " + what) {}
};

class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error("invariant violation: " + what) {}
};

}  // namespace etbd
