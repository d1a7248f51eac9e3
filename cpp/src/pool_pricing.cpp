#include "pool_pricing.hpp"

#include <utility>

#include "errors.hpp"

namespace poolrisk {

using Traits = NumTraits<RealT>;

void PoolConfig::validate() const {
    if (amplification == 0) {
        throw InvalidInput("pool config: amplification must be >= 1");
    }
    if (!Traits::is_finite(precision) || !(precision > Traits::ZERO())) {
        throw InvalidInput("pool config: precision must be positive");
    }
    if (!Traits::is_finite(trade_fee) || trade_fee < Traits::ZERO() || !(trade_fee < Traits::ONE())) {
        throw InvalidInput("pool config: trade_fee must be in [0, 1)");
    }
    if (max_iterations == 0) {
        throw InvalidInput("pool config: max_iterations must be >= 1");
    }
    if (base.name.empty() || quote.name.empty()) {
        throw InvalidInput("pool config: token names must not be empty");
    }
    if (base.name == quote.name || base.id == quote.id) {
        throw InvalidInput("pool config: base and quote must be distinct tokens");
    }
}

PoolPricingContext::PoolPricingContext(PoolConfig cfg, BalanceSource& source)
    : cfg_(std::move(cfg)), source_(source) {
    cfg_.validate();
}

PriceQuote PoolPricingContext::quote(std::optional<uint64_t> at_block, bool inverse) {
    const BalanceMap balances = source_.get_balances(cfg_.account, at_block);

    auto pick = [&](const Token& token) {
        auto it = balances.find(token.name);
        if (it == balances.end()) {
            throw InvalidInput("balance source returned no balance for " + token.name
                               + " in account " + cfg_.account);
        }
        return it->second;
    };

    PriceQuote q = quote_at_balances({pick(cfg_.base), pick(cfg_.quote)}, inverse);
    q.block = at_block;
    return q;
}

PriceQuote PoolPricingContext::quote_at_balances(const std::array<RealT, 2>& balances, bool inverse) {
    const std::vector<RealT> xp{balances[0], balances[1]};

    PriceQuote q;
    q.balances = balances;
    q.inverse = inverse;
    q.D = InvariantSolver::solve(xp, cfg_.amplification, cfg_.precision, cfg_.max_iterations);

    // (i=1, j=0) over [base, quote]: quote token priced in base units.
    const RealT p = PriceCalculator::price(xp, cfg_.amplification, q.D, 1, 0);
    q.price = inverse ? Traits::ONE() / p : p;

    {
        std::lock_guard<std::mutex> lk(mu_);
        last_price_ = q.price;
    }
    return q;
}

std::optional<RealT> PoolPricingContext::last_price() const {
    std::lock_guard<std::mutex> lk(mu_);
    return last_price_;
}

PriceHistory price_history(PoolPricingContext& ctx, const std::vector<uint64_t>& blocks, bool inverse) {
    if (blocks.empty()) {
        throw InvalidInput("price history: no blocks to price");
    }
    PriceHistory history;
    history.blocks = blocks;
    history.prices.reserve(blocks.size());
    for (uint64_t block : blocks) {
        history.prices.push_back(ctx.current_price(block, inverse));
    }
    history.returns = percentage_returns(history.prices);
    return history;
}

} // namespace poolrisk
