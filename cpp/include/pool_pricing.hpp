#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "balance_source.hpp"
#include "real_type.hpp"
#include "risk_estimator.hpp"
#include "stableswap_math.hpp"

namespace poolrisk {

struct PoolConfig {
    Token base;
    Token quote;
    std::string account;
    uint64_t amplification{100};
    RealT trade_fee{static_cast<RealT>(0)};       // carried for downstream consumers
    RealT precision{static_cast<RealT>(1e-6)};
    size_t max_iterations{DEFAULT_MAX_ITERATIONS};

    void validate() const;
};

struct PriceQuote {
    RealT price{0};
    RealT D{0};
    std::array<RealT, 2> balances{RealT(0), RealT(0)};  // [base, quote]
    std::optional<uint64_t> block;
    bool inverse{false};
};

// Prices one stableswap pair. The balance source is injected and must outlive
// the context. The last successful price is kept for observers and is the
// only mutable state.
class PoolPricingContext {
public:
    PoolPricingContext(PoolConfig cfg, BalanceSource& source);

    PriceQuote quote(std::optional<uint64_t> at_block = std::nullopt, bool inverse = false);
    PriceQuote quote_at_balances(const std::array<RealT, 2>& balances, bool inverse = false);

    RealT current_price(std::optional<uint64_t> at_block = std::nullopt, bool inverse = false) {
        return quote(at_block, inverse).price;
    }
    RealT price_at_balances(const std::array<RealT, 2>& balances, bool inverse = false) {
        return quote_at_balances(balances, inverse).price;
    }

    std::optional<RealT> last_price() const;
    const PoolConfig& config() const { return cfg_; }

private:
    PoolConfig cfg_;
    BalanceSource& source_;
    mutable std::mutex mu_;
    std::optional<RealT> last_price_;
};

struct PriceHistory {
    std::vector<uint64_t> blocks;
    PricePath prices;
    std::vector<RealT> returns;
};

// Prices the pool at each block in turn.
PriceHistory price_history(PoolPricingContext& ctx, const std::vector<uint64_t>& blocks, bool inverse = false);

} // namespace poolrisk
