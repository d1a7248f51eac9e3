#include "json_io.hpp"

#include <boost/json/src.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include "errors.hpp"

namespace poolrisk {

using Traits = NumTraits<RealT>;

namespace {

std::string as_std_string(const json::value& v) {
    return std::string(v.as_string().c_str());
}

uint64_t to_uint(const json::value& v, const std::string& field) {
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64()) {
        if (v.as_int64() < 0) throw InvalidInput(field + " must not be negative");
        return static_cast<uint64_t>(v.as_int64());
    }
    if (v.is_double()) {
        const double d = v.as_double();
        if (!(d >= 0.0) || d != std::floor(d)) {
            throw InvalidInput(field + " must be a non-negative integer");
        }
        if (d >= 18446744073709551616.0) {
            throw InvalidInput(field + " does not fit in 64 bits");
        }
        return static_cast<uint64_t>(d);
    }
    if (v.is_string()) {
        const std::string s = as_std_string(v);
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw InvalidInput(field + " must be a non-negative integer, got '" + s + "'");
        }
        try {
            return static_cast<uint64_t>(std::stoull(s));
        } catch (const std::out_of_range&) {
            throw InvalidInput(field + " does not fit in 64 bits: '" + s + "'");
        }
    }
    throw InvalidInput(field + " must be a non-negative integer");
}

const json::value& require(const json::object& obj, const char* key, const std::string& where) {
    if (auto* v = obj.if_contains(key)) return *v;
    throw InvalidInput(where + ": missing field '" + key + "'");
}

const json::object& require_object(const json::value& v, const std::string& where) {
    if (!v.is_object()) throw InvalidInput(where + ": expected an object");
    return v.as_object();
}

Token parse_token(const json::value& v, const std::string& where) {
    const auto& obj = require_object(v, where);
    Token token;
    const auto& name = require(obj, "name", where);
    if (!name.is_string()) throw InvalidInput(where + ": 'name' must be a string");
    token.name = as_std_string(name);
    token.id = to_uint(require(obj, "id", where), where + ".id");
    if (auto* d = obj.if_contains("decimals")) {
        const uint64_t decimals = to_uint(*d, where + ".decimals");
        if (decimals > MAX_TOKEN_DECIMALS) {
            throw InvalidInput(where + ".decimals must be <= " + std::to_string(MAX_TOKEN_DECIMALS)
                               + ", got " + std::to_string(decimals));
        }
        token.decimals = static_cast<unsigned>(decimals);
    }
    return token;
}

std::string raw_amount(const json::value& v, const std::string& where) {
    if (v.is_string()) return as_std_string(v);
    if (v.is_uint64()) return std::to_string(v.as_uint64());
    if (v.is_int64() && v.as_int64() >= 0) return std::to_string(v.as_int64());
    throw InvalidInput(where + ": raw balance must be a non-negative integer or digit string");
}

double out(const RealT& v) { return Traits::to_double(v); }

} // namespace

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InvalidInput("failed to open file: " + path.string());
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

json::value parse_json(const std::string& contents, const std::string& origin) {
    json::error_code ec;
    json::value root = json::parse(contents, ec);
    if (ec) {
        throw InvalidInput(origin + ": malformed JSON: " + ec.message());
    }
    return root;
}

RealT to_real(const json::value& v) {
    if (v.is_double()) return static_cast<RealT>(v.as_double());
    if (v.is_int64())  return static_cast<RealT>(v.as_int64());
    if (v.is_uint64()) return static_cast<RealT>(v.as_uint64());
    if (v.is_string()) {
        const std::string s = as_std_string(v);
        if (s.empty()) throw InvalidInput("expected a number, got an empty string");
        return real_from_string(s);
    }
    throw InvalidInput("expected a number");
}

PoolFile parse_pool_file(const json::value& root, const fs::path& config_dir) {
    PoolFile file;
    file.config_dir = config_dir;

    const auto& obj = require_object(root, "pool config");
    if (auto* meta = obj.if_contains("meta")) {
        const auto& m = require_object(*meta, "meta");
        if (auto* b = m.if_contains("balances")) {
            if (!b->is_string()) throw InvalidInput("meta: 'balances' must be a path string");
            file.raw_balances_path = as_std_string(*b);
            fs::path raw = file.raw_balances_path;
            if (!raw.is_absolute()) {
                raw = config_dir / raw;
            }
            file.balances_path = fs::absolute(raw);
        }
    }

    const auto& pool = require_object(require(obj, "pool", "pool config"), "pool");
    PoolConfig& cfg = file.pool;
    const auto& account = require(pool, "account", "pool");
    if (!account.is_string()) throw InvalidInput("pool: 'account' must be a string");
    cfg.account = as_std_string(account);
    cfg.base = parse_token(require(pool, "base", "pool"), "pool.base");
    cfg.quote = parse_token(require(pool, "quote", "pool"), "pool.quote");
    cfg.amplification = to_uint(require(pool, "amplification", "pool"), "pool.amplification");
    if (auto* v = pool.if_contains("trade_fee")) cfg.trade_fee = to_real(*v);
    if (auto* v = pool.if_contains("precision")) cfg.precision = to_real(*v);
    if (auto* v = pool.if_contains("max_iterations")) {
        cfg.max_iterations = static_cast<size_t>(to_uint(*v, "pool.max_iterations"));
    }
    cfg.validate();
    return file;
}

PoolFile load_pool_file(const fs::path& path) {
    const json::value root = parse_json(read_file(path), path.string());
    return parse_pool_file(root, path.parent_path());
}

std::vector<PricePath> parse_paths(const json::value& root) {
    const json::array* arr = nullptr;
    if (root.is_array()) {
        arr = &root.as_array();
    } else if (root.is_object()) {
        if (auto* p = root.as_object().if_contains("paths")) {
            if (p->is_array()) arr = &p->as_array();
        }
    }
    if (!arr) throw InvalidInput("expected a 'paths' array");

    std::vector<PricePath> paths;
    paths.reserve(arr->size());
    for (size_t k = 0; k < arr->size(); ++k) {
        const auto& row = (*arr)[k];
        if (!row.is_array()) {
            throw InvalidInput("path " + std::to_string(k) + " is not an array");
        }
        PricePath path;
        path.reserve(row.as_array().size());
        for (const auto& v : row.as_array()) {
            path.push_back(to_real(v));
        }
        paths.push_back(std::move(path));
    }
    return paths;
}

std::vector<PricePath> load_paths(const fs::path& path) {
    return parse_paths(parse_json(read_file(path), path.string()));
}

JsonBalanceSource::JsonBalanceSource(const json::value& root, std::vector<Token> tokens)
    : tokens_(std::move(tokens)) {
    const auto& obj = require_object(root, "balances");
    const auto& accounts = require_object(require(obj, "accounts", "balances"), "balances.accounts");
    for (const auto& kv : accounts) {
        const std::string account(kv.key());
        const std::string where = "balances.accounts." + account;
        if (!kv.value().is_array()) throw InvalidInput(where + ": expected an array of snapshots");

        History& snapshots = accounts_[account];
        for (const auto& entry : kv.value().as_array()) {
            const auto& snap = require_object(entry, where);
            const uint64_t block = to_uint(require(snap, "block", where), where + ".block");
            const auto& raw = require_object(require(snap, "balances", where), where + ".balances");
            RawBalances balances;
            for (const auto& b : raw) {
                const std::string id_str(b.key());
                const uint64_t id = to_uint(json::value(id_str), where + " token id");
                balances[id] = raw_amount(b.value(), where);
            }
            snapshots[block] = std::move(balances);
        }
    }
}

JsonBalanceSource JsonBalanceSource::from_file(const fs::path& path, std::vector<Token> tokens) {
    return JsonBalanceSource(parse_json(read_file(path), path.string()), std::move(tokens));
}

const JsonBalanceSource::History& JsonBalanceSource::history(const std::string& account) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end() || it->second.empty()) {
        throw InvalidInput("no balance snapshots for account " + account);
    }
    return it->second;
}

BalanceMap JsonBalanceSource::get_balances(const std::string& account,
                                           std::optional<uint64_t> at_block) {
    const History& h = history(account);
    auto snap = h.end();
    if (at_block) {
        snap = h.find(*at_block);
        if (snap == h.end()) {
            throw InvalidInput("no balance snapshot for account " + account
                               + " at block " + std::to_string(*at_block));
        }
    } else {
        snap = std::prev(h.end());
    }

    BalanceMap balances;
    for (const auto& token : tokens_) {
        auto raw = snap->second.find(token.id);
        if (raw == snap->second.end()) continue;
        balances[token.name] = normalize_balance(raw->second, token.decimals);
    }
    return balances;
}

std::vector<uint64_t> JsonBalanceSource::blocks(const std::string& account) const {
    std::vector<uint64_t> result;
    for (const auto& kv : history(account)) result.push_back(kv.first);
    return result;
}

uint64_t JsonBalanceSource::latest_block(const std::string& account) const {
    return std::prev(history(account).end())->first;
}

json::object to_json(const PriceQuote& q, const PoolConfig& cfg) {
    json::object obj;
    obj["account"] = cfg.account;
    obj["base"] = cfg.base.name;
    obj["quote"] = cfg.quote.name;
    if (q.block) {
        obj["block"] = *q.block;
    } else {
        obj["block"] = nullptr;
    }
    obj["inverse"] = q.inverse;
    obj["balances"] = json::array{out(q.balances[0]), out(q.balances[1])};
    obj["D"] = out(q.D);
    obj["price"] = out(q.price);
    return obj;
}

json::object to_json(const RiskReport& r) {
    json::object obj;
    obj["alpha"] = out(r.alpha);
    if (r.at_step) {
        obj["at_step"] = static_cast<uint64_t>(*r.at_step);
    } else {
        obj["at_step"] = nullptr;
    }
    obj["samples"] = static_cast<uint64_t>(r.sample_count);
    obj["rank_index"] = static_cast<uint64_t>(r.rank_index);
    obj["value_at_risk"] = out(r.value_at_risk);
    obj["threshold_multiplier"] = out(r.multiplier);
    return obj;
}

json::object to_json(const PriceHistory& h) {
    json::array blocks;
    json::array prices;
    json::array returns;
    blocks.reserve(h.blocks.size());
    prices.reserve(h.prices.size());
    returns.reserve(h.returns.size());
    for (auto b : h.blocks) blocks.push_back(b);
    for (const auto& p : h.prices) prices.push_back(out(p));
    for (const auto& r : h.returns) returns.push_back(out(r));

    json::object obj;
    obj["blocks"] = std::move(blocks);
    obj["prices"] = std::move(prices);
    obj["returns"] = std::move(returns);
    return obj;
}

} // namespace poolrisk
