#pragma once

#include <stdexcept>
#include <string>

namespace poolrisk {

// Precondition violated by a caller-supplied value (balances, amplification,
// precision, alpha, path set, configuration field).
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Newton iteration exhausted its budget without meeting the convergence test.
class NonConvergence : public std::runtime_error {
public:
    NonConvergence(const std::string& what, size_t iterations)
        : std::runtime_error(what), iterations_(iterations) {}

    size_t iterations() const { return iterations_; }

private:
    size_t iterations_;
};

// Truncation step outside the bounds of a price path.
class InvalidRange : public std::out_of_range {
public:
    explicit InvalidRange(const std::string& what) : std::out_of_range(what) {}
};

// Division by zero or a non-finite intermediate.
class ArithmeticError : public std::domain_error {
public:
    explicit ArithmeticError(const std::string& what) : std::domain_error(what) {}
};

} // namespace poolrisk
