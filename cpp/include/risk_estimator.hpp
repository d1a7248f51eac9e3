#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "real_type.hpp"

namespace poolrisk {

// One simulated or historical trajectory, step 0 first.
using PricePath = std::vector<RealT>;

struct RiskReport {
    RealT value_at_risk{0};
    RealT multiplier{1};
    size_t rank_index{0};
    size_t sample_count{0};
    RealT alpha{0};
    std::optional<size_t> at_step;
};

// min(path[0, at_step)) / path[0] - 1. Zero for a path that never drops below
// its first value.
RealT initial_drawdown(const PricePath& path, std::optional<size_t> at_step = std::nullopt);

// Step-over-step relative change, one element shorter than the path.
std::vector<RealT> percentage_returns(const PricePath& path);

class RiskEstimator {
public:
    struct Config {
        size_t threads{1};
    };

    RiskEstimator() = default;
    explicit RiskEstimator(Config cfg) : cfg_(cfg) {}

    // Drawdown samples in input order. Independent of the configured thread
    // count; if several paths fail, the error of the lowest index is thrown.
    std::vector<RealT> drawdowns(const std::vector<PricePath>& paths,
                                 std::optional<size_t> at_step = std::nullopt) const;

    RiskReport estimate(const std::vector<PricePath>& paths,
                        RealT alpha,
                        std::optional<size_t> at_step = std::nullopt) const;

    RealT threshold_multiplier(const std::vector<PricePath>& paths,
                               RealT alpha,
                               std::optional<size_t> at_step = std::nullopt) const {
        return estimate(paths, alpha, at_step).multiplier;
    }

    // floor(sample_count * alpha), clamped to the last sample for alpha == 1.
    static size_t rank_index(size_t sample_count, RealT alpha);

    const Config& config() const { return cfg_; }

private:
    Config cfg_{};
};

} // namespace poolrisk
