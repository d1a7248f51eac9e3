#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "balance_source.hpp"
#include "pool_pricing.hpp"
#include "real_type.hpp"
#include "risk_estimator.hpp"

namespace poolrisk {

namespace json = boost::json;
namespace fs = std::filesystem;

struct PoolFile {
    PoolConfig pool;
    fs::path config_dir;
    fs::path balances_path;         // empty when meta.balances is absent
    std::string raw_balances_path;  // as written in the file
};

std::string read_file(const fs::path& path);
json::value parse_json(const std::string& contents, const std::string& origin);

RealT to_real(const json::value& v);

PoolFile parse_pool_file(const json::value& root, const fs::path& config_dir);
PoolFile load_pool_file(const fs::path& path);

// {"paths": [[...], ...]} or a bare array of arrays
std::vector<PricePath> parse_paths(const json::value& root);
std::vector<PricePath> load_paths(const fs::path& path);

// Balance source over a snapshot document:
//   {"accounts": {"<account>": [{"block": N, "balances": {"<token id>": "<raw>"}}]}}
// Raw amounts are normalized with the decimals of the matching token; ids of
// other tokens are ignored.
class JsonBalanceSource final : public BalanceSource {
public:
    JsonBalanceSource(const json::value& root, std::vector<Token> tokens);

    static JsonBalanceSource from_file(const fs::path& path, std::vector<Token> tokens);

    BalanceMap get_balances(const std::string& account,
                            std::optional<uint64_t> at_block) override;

    std::vector<uint64_t> blocks(const std::string& account) const;
    uint64_t latest_block(const std::string& account) const;

private:
    using RawBalances = std::map<uint64_t, std::string>;  // token id -> raw amount
    using History = std::map<uint64_t, RawBalances>;      // block -> balances

    const History& history(const std::string& account) const;

    std::map<std::string, History> accounts_;
    std::vector<Token> tokens_;
};

json::object to_json(const PriceQuote& q, const PoolConfig& cfg);
json::object to_json(const RiskReport& r);
json::object to_json(const PriceHistory& h);

} // namespace poolrisk
