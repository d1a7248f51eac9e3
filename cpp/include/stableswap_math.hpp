// StableSwap invariant and marginal price (templated on numeric type)
//
// Operation order is fixed: balances are visited in ascending order and the
// association of every product/division is part of the contract, so results
// reproduce bit for bit across callers.
#ifndef POOLRISK_STABLESWAP_MATH_HPP
#define POOLRISK_STABLESWAP_MATH_HPP

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "real_type.hpp"

namespace poolrisk {

constexpr size_t DEFAULT_MAX_ITERATIONS = 128;

namespace detail {

template <typename T>
std::string describe(const T& v) {
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

} // namespace detail

template <typename T>
struct InvariantResult {
    T value;
    size_t iterations;  // Newton updates performed; 0 for an empty pool
};

template <typename T>
class InvariantSolverT {
public:
    using Traits = NumTraits<T>;

    // Asymmetric tie-break: a decreasing step must be strictly inside the
    // precision, an increasing step may sit exactly on it.
    static bool has_converged(const T& prev, const T& next, const T& precision) {
        const T diff = Traits::abs(prev - next);
        return (next <= prev && diff < precision) || (next > prev && diff <= precision);
    }

    static InvariantResult<T> solve_detailed(
        const std::vector<T>& balances,
        uint64_t amplification,
        const T& precision,
        size_t max_iterations = DEFAULT_MAX_ITERATIONS
    ) {
        if (balances.empty()) {
            throw InvalidInput("newton_D: balance vector is empty");
        }
        if (amplification == 0) {
            throw InvalidInput("newton_D: amplification must be >= 1");
        }
        if (!Traits::is_finite(precision) || !(precision > Traits::ZERO())) {
            throw InvalidInput("newton_D: precision must be positive, got " + detail::describe(precision));
        }
        if (max_iterations == 0) {
            throw InvalidInput("newton_D: max_iterations must be >= 1");
        }
        for (size_t k = 0; k < balances.size(); ++k) {
            if (!Traits::is_finite(balances[k]) || balances[k] < Traits::ZERO()) {
                throw InvalidInput("newton_D: balance[" + std::to_string(k) + "] is invalid: "
                                   + detail::describe(balances[k]));
            }
        }

        std::vector<T> xp_sorted(balances);
        std::sort(xp_sorted.begin(), xp_sorted.end());

        T S = Traits::ZERO();
        for (const auto& x : xp_sorted) S += x;
        if (S == Traits::ZERO()) {
            return {Traits::ZERO(), 0};
        }
        if (!(xp_sorted.front() > Traits::ZERO())) {
            throw InvalidInput("newton_D: zero balance in a non-empty pool");
        }

        const T n = static_cast<T>(balances.size());
        const T ann = static_cast<T>(amplification) * n;
        const bool trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");

        T D = S;
        for (size_t it = 0; it < max_iterations; ++it) {
            T D_P = D;
            for (const auto& x : xp_sorted) {
                D_P *= D / (x * n);
            }

            const T D_prev = D;
            D = (ann * S + D_P * n) * D / ((ann - Traits::ONE()) * D + (n + Traits::ONE()) * D_P);

            if (trace) {
                std::cout << "TRACE newton_D it=" << (it + 1)
                          << " D_prev=" << detail::describe(D_prev)
                          << " D=" << detail::describe(D) << "\n";
            }
            if (!Traits::is_finite(D)) {
                throw NonConvergence("newton_D: iterate became non-finite at iteration "
                                     + std::to_string(it + 1), it + 1);
            }
            if (has_converged(D_prev, D, precision)) {
                return {D, it + 1};
            }
        }

        throw NonConvergence("newton_D: did not converge within " + std::to_string(max_iterations)
                             + " iterations (last D=" + detail::describe(D) + ")", max_iterations);
    }

    static T solve(
        const std::vector<T>& balances,
        uint64_t amplification,
        const T& precision,
        size_t max_iterations = DEFAULT_MAX_ITERATIONS
    ) {
        return solve_detailed(balances, amplification, precision, max_iterations).value;
    }
};

template <typename T>
class PriceCalculatorT {
public:
    using Traits = NumTraits<T>;

    // Marginal rate x_j per x_i at invariant d:
    //   xj * (ann*xi + c) / (ann*xj + c) / xi,  c = d^(n+1) / (n^n * prod(x))
    // In the constant-product limit this reduces to xj / xi, i.e. the price of
    // coin i expressed in units of coin j.
    static T price(
        const std::vector<T>& balances,
        uint64_t amplification,
        const T& d,
        size_t base_index,
        size_t quote_index
    ) {
        if (balances.empty()) {
            throw InvalidInput("get_p: balance vector is empty");
        }
        if (amplification == 0) {
            throw InvalidInput("get_p: amplification must be >= 1");
        }
        if (!Traits::is_finite(d) || !(d > Traits::ZERO())) {
            throw InvalidInput("get_p: degenerate pool, D=" + detail::describe(d));
        }
        if (base_index >= balances.size() || quote_index >= balances.size()) {
            throw InvalidInput("get_p: index out of range (i=" + std::to_string(base_index)
                               + ", j=" + std::to_string(quote_index)
                               + ", n=" + std::to_string(balances.size()) + ")");
        }
        for (size_t k = 0; k < balances.size(); ++k) {
            if (!Traits::is_finite(balances[k]) || !(balances[k] > Traits::ZERO())) {
                throw InvalidInput("get_p: balance[" + std::to_string(k) + "] must be positive, got "
                                   + detail::describe(balances[k]));
            }
        }

        const T n = static_cast<T>(balances.size());
        const T ann = static_cast<T>(amplification) * n;

        std::vector<T> sorted_bal(balances);
        std::sort(sorted_bal.begin(), sorted_bal.end());

        T c = d;
        for (const auto& x : sorted_bal) {
            c = c * d / (n * x);
        }

        const T& xi = balances[base_index];
        const T& xj = balances[quote_index];

        const T p = xj * (ann * xi + c) / (ann * xj + c) / xi;
        if (!Traits::is_finite(p) || !(p > Traits::ZERO())) {
            throw ArithmeticError("get_p: price is not a positive finite value: " + detail::describe(p));
        }
        return p;
    }
};

using InvariantSolver = InvariantSolverT<RealT>;
using PriceCalculator = PriceCalculatorT<RealT>;

} // namespace poolrisk

#endif // POOLRISK_STABLESWAP_MATH_HPP
