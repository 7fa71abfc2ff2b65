#pragma once

#include <stdexcept>
#include <string>

namespace gridedge {

/**
 * Raised at the call boundary when an argument is outside the domain of an
 * operation. The message names the violated condition and the offending value.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Zero American odds, or a decimal price that is not above 1.0
class InvalidOddsError : public InvalidInputError {
public:
    explicit InvalidOddsError(const std::string& what)
        : InvalidInputError(what) {}
};

// Non-positive probability handed to the de-vig step
class InvalidProbabilityError : public InvalidInputError {
public:
    explicit InvalidProbabilityError(const std::string& what)
        : InvalidInputError(what) {}
};

} // namespace gridedge
