#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "real_type.hpp"

namespace poolrisk {

struct Token {
    std::string name;      // key of the normalized balance map
    uint64_t id{0};        // key of raw balances in the ledger
    unsigned decimals{0};
};

// 10^77 is the largest power of ten below 2^256.
constexpr unsigned MAX_TOKEN_DECIMALS = 77;

// token name -> balance with decimals divided out
using BalanceMap = std::map<std::string, RealT>;

// raw / 10^decimals, splitting quotient and remainder in 256-bit integers
// before converting so large raw balances keep their fractional digits.
RealT normalize_balance(const uint256& raw, unsigned decimals);

// Same, from a decimal digit string as returned by the ledger.
RealT normalize_balance(const std::string& raw, unsigned decimals);

class BalanceSource {
public:
    virtual ~BalanceSource() = default;

    // Balances held by `account`, already normalized. Without `at_block` the
    // most recent state is returned.
    virtual BalanceMap get_balances(const std::string& account,
                                    std::optional<uint64_t> at_block) = 0;
};

} // namespace poolrisk
