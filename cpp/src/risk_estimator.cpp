#include "risk_estimator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>

#include "errors.hpp"
#include "stableswap_math.hpp"

namespace poolrisk {

using Traits = NumTraits<RealT>;

RealT initial_drawdown(const PricePath& path, std::optional<size_t> at_step) {
    if (path.empty()) {
        throw InvalidInput("drawdown: price path is empty");
    }
    size_t end = path.size();
    if (at_step) {
        if (*at_step == 0) {
            throw InvalidRange("drawdown: at_step must be >= 1");
        }
        if (*at_step > path.size()) {
            throw InvalidRange("drawdown: at_step " + std::to_string(*at_step)
                               + " exceeds path length " + std::to_string(path.size()));
        }
        end = *at_step;
    }

    for (size_t k = 0; k < end; ++k) {
        if (!Traits::is_finite(path[k])) {
            throw InvalidInput("drawdown: non-finite value at step " + std::to_string(k));
        }
    }
    const RealT first = path[0];
    if (first == Traits::ZERO()) {
        throw ArithmeticError("drawdown: first value of the path is zero");
    }
    if (first < Traits::ZERO()) {
        throw InvalidInput("drawdown: first value of the path is negative: " + detail::describe(first));
    }

    const RealT lowest = *std::min_element(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(end));
    return lowest / first - Traits::ONE();
}

std::vector<RealT> percentage_returns(const PricePath& path) {
    std::vector<RealT> out;
    if (path.size() < 2) return out;
    out.reserve(path.size() - 1);
    for (size_t k = 1; k < path.size(); ++k) {
        if (path[k - 1] == Traits::ZERO()) {
            throw ArithmeticError("returns: zero value at step " + std::to_string(k - 1));
        }
        out.push_back(path[k] / path[k - 1] - Traits::ONE());
    }
    return out;
}

std::vector<RealT> RiskEstimator::drawdowns(const std::vector<PricePath>& paths,
                                            std::optional<size_t> at_step) const {
    if (paths.empty()) {
        throw InvalidInput("drawdowns: path collection is empty");
    }

    std::vector<RealT> samples(paths.size(), Traits::ZERO());
    std::vector<std::exception_ptr> errors(paths.size());
    std::atomic<size_t> next_idx{0};

    auto worker = [&]() {
        while (true) {
            const size_t idx = next_idx.fetch_add(1);
            if (idx >= paths.size()) break;
            try {
                samples[idx] = initial_drawdown(paths[idx], at_step);
            } catch (...) {
                errors[idx] = std::current_exception();
            }
        }
    };

    const size_t thread_count = std::min(std::max<size_t>(1, cfg_.threads), paths.size());
    if (thread_count == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& th : threads) th.join();
    }

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return samples;
}

size_t RiskEstimator::rank_index(size_t sample_count, RealT alpha) {
    if (sample_count == 0) {
        throw InvalidInput("rank_index: no samples");
    }
    if (!Traits::is_finite(alpha) || !(alpha > Traits::ZERO()) || alpha > Traits::ONE()) {
        throw InvalidInput("rank_index: alpha must be in (0, 1], got " + detail::describe(alpha));
    }
    const RealT pos = Traits::floor(static_cast<RealT>(sample_count) * alpha);
    const size_t idx = static_cast<size_t>(Traits::to_double(pos));
    return std::min(idx, sample_count - 1);
}

RiskReport RiskEstimator::estimate(const std::vector<PricePath>& paths,
                                   RealT alpha,
                                   std::optional<size_t> at_step) const {
    std::vector<RealT> samples = drawdowns(paths, at_step);

    // mildest first, deepest loss last
    std::sort(samples.begin(), samples.end(), std::greater<RealT>());

    RiskReport report;
    report.sample_count = samples.size();
    report.alpha = alpha;
    report.at_step = at_step;
    report.rank_index = rank_index(samples.size(), alpha);
    report.value_at_risk = samples[report.rank_index];

    const RealT denom = Traits::ONE() + report.value_at_risk;
    if (!(denom > Traits::ZERO())) {
        throw ArithmeticError("threshold: value at risk of " + detail::describe(report.value_at_risk)
                              + " leaves no collateral to scale");
    }
    report.multiplier = Traits::ONE() / denom;
    return report;
}

} // namespace poolrisk
