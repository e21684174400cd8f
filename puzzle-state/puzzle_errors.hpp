#ifndef __PUZZLE_ERRORS_HPP___
#define __PUZZLE_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @file puzzle_errors.hpp
 * @brief Exception types raised when an initial configuration is rejected.
 */

/**
 * @brief A tile sequence that is not a valid board (wrong length, values out of
 * range, duplicate or missing tiles, unparsable text, illegal move).
 */
class InvalidStateError : public std::invalid_argument {
public:
    explicit InvalidStateError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A well-formed board from which the goal cannot be reached.
 *
 * Raised by the search entry points before any node is generated.
 */
class UnsolvableStateError : public std::invalid_argument {
public:
    explicit UnsolvableStateError(const std::string& what) : std::invalid_argument(what) {}
};

#endif // __PUZZLE_ERRORS_HPP___
