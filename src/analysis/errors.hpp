#pragma once

#include <stdexcept>
#include <string>

// Caller supplied distributions, outcome counts or regions that violate
// the analysis contract. Raised before anything is computed.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

// Size budget below zero (or NaN) passed to the region selector.
class InvalidBudgetError : public std::invalid_argument {
public:
    explicit InvalidBudgetError(const std::string& what) : std::invalid_argument(what) {}
};
