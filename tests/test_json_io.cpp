#include <gtest/gtest.h>
#include "errors.hpp"
#include "json_io.hpp"

#include <fstream>
#include <string>

using namespace poolrisk;

namespace {

double d(const RealT& v) { return NumTraits<RealT>::to_double(v); }

const char* const POOL_JSON = R"({
  "meta": {"balances": "snapshots/balances.json"},
  "pool": {
    "account": "7L53bUTBbfuj14UpdCNPwmgzzHSkrsnWMHdcmbuzyZZwDxg9",
    "amplification": 100,
    "trade_fee": 0.0004,
    "precision": "0.000001",
    "max_iterations": 64,
    "base":  {"name": "USDT", "id": 10, "decimals": 6},
    "quote": {"name": "USDC", "id": 22, "decimals": 18}
  }
})";

const char* const BALANCES_JSON = R"({
  "accounts": {
    "pool-a": [
      {"block": 300, "balances": {"10": "2000000000", "22": "1000000000000000000000", "5": "7"}},
      {"block": 100, "balances": {"10": 1000000000, "22": "1000000000000000000000"}}
    ],
    "pool-b": []
  }
})";

std::vector<Token> pair_tokens() {
    return {Token{"USDT", 10, 6}, Token{"USDC", 22, 18}};
}

} // namespace

// ─── Pool configuration ──────────────────────────────────────────────────────

TEST(JsonIo_PoolFile, ParsesAllFields) {
    const auto file = parse_pool_file(parse_json(POOL_JSON, "pool.json"), fs::path("/etc/poolrisk"));
    EXPECT_EQ(file.pool.account, "7L53bUTBbfuj14UpdCNPwmgzzHSkrsnWMHdcmbuzyZZwDxg9");
    EXPECT_EQ(file.pool.amplification, 100u);
    EXPECT_NEAR(d(file.pool.trade_fee), 0.0004, 1e-15);
    EXPECT_NEAR(d(file.pool.precision), 1e-6, 1e-18);
    EXPECT_EQ(file.pool.max_iterations, 64u);
    EXPECT_EQ(file.pool.base.name, "USDT");
    EXPECT_EQ(file.pool.base.id, 10u);
    EXPECT_EQ(file.pool.quote.decimals, 18u);
}

TEST(JsonIo_PoolFile, RelativeBalancesPathResolvedAgainstConfigDir) {
    const auto file = parse_pool_file(parse_json(POOL_JSON, "pool.json"), fs::path("/etc/poolrisk"));
    EXPECT_EQ(file.raw_balances_path, "snapshots/balances.json");
    EXPECT_EQ(file.balances_path, fs::path("/etc/poolrisk/snapshots/balances.json"));
}

TEST(JsonIo_PoolFile, MissingAmplification_InvalidInput) {
    const char* doc = R"({"pool": {"account": "x",
        "base": {"name": "A", "id": 1}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, ZeroAmplification_InvalidInput) {
    const char* doc = R"({"pool": {"account": "x", "amplification": 0,
        "base": {"name": "A", "id": 1}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, NegativeDecimals_InvalidInput) {
    const char* doc = R"({"pool": {"account": "x", "amplification": 5,
        "base": {"name": "A", "id": 1, "decimals": -6}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, AmplificationBeyondSixtyFourBits_InvalidInput) {
    const char* doc = R"({"pool": {"account": "x", "amplification": 1e20,
        "base": {"name": "A", "id": 1}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, WholeDoubleAmplificationAccepted) {
    const char* doc = R"({"pool": {"account": "x", "amplification": 200.0,
        "base": {"name": "A", "id": 1}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_EQ(parse_pool_file(parse_json(doc, "inline"), fs::path(".")).pool.amplification, 200u);
}

TEST(JsonIo_PoolFile, DecimalsAboveUnsignedRange_InvalidInput) {
    // 4294967302 would wrap to 6 if narrowed without a check
    const char* doc = R"({"pool": {"account": "x", "amplification": 5,
        "base": {"name": "A", "id": 1, "decimals": 4294967302}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, DecimalsAboveUint256Precision_InvalidInput) {
    const char* doc = R"({"pool": {"account": "x", "amplification": 5,
        "base": {"name": "A", "id": 1, "decimals": 78}, "quote": {"name": "B", "id": 2}}})";
    EXPECT_THROW(parse_pool_file(parse_json(doc, "inline"), fs::path(".")), InvalidInput);
}

TEST(JsonIo_PoolFile, LoadFromDisk) {
    const fs::path dir = fs::temp_directory_path() / "poolrisk_json_io_test";
    fs::create_directories(dir);
    const fs::path cfg = dir / "pool.json";
    {
        std::ofstream out(cfg);
        out << POOL_JSON;
    }
    const auto file = load_pool_file(cfg);
    EXPECT_EQ(file.config_dir, dir);
    EXPECT_EQ(file.balances_path, fs::absolute(dir / "snapshots/balances.json"));
    fs::remove_all(dir);
}

TEST(JsonIo_PoolFile, MissingFile_InvalidInput) {
    EXPECT_THROW(load_pool_file(fs::path("/nonexistent/poolrisk/pool.json")), InvalidInput);
}

TEST(JsonIo_Parse, MalformedJson_InvalidInput) {
    EXPECT_THROW(parse_json("{\"pool\": [1, 2", "inline"), InvalidInput);
}

// ─── Price paths ─────────────────────────────────────────────────────────────

TEST(JsonIo_Paths, ObjectWithPathsArray) {
    const auto paths = parse_paths(parse_json(R"({"paths": [[1.0, 0.9, 1.1], [2, 2.5]]})", "inline"));
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].size(), 3u);
    EXPECT_EQ(paths[1][0], RealT(2));
    EXPECT_NEAR(d(paths[0][1]), 0.9, 1e-15);
}

TEST(JsonIo_Paths, BareArrayWithNumericStrings) {
    const auto paths = parse_paths(parse_json(R"([["1.5", "1.25"], [3]])", "inline"));
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0][0], RealT(1.5));
    EXPECT_EQ(paths[0][1], RealT(1.25));
}

TEST(JsonIo_Paths, RowNotAnArray_InvalidInput) {
    EXPECT_THROW(parse_paths(parse_json(R"({"paths": [[1.0], 5]})", "inline")), InvalidInput);
}

TEST(JsonIo_Paths, NonNumericValue_InvalidInput) {
    EXPECT_THROW(parse_paths(parse_json(R"({"paths": [[1.0, true]]})", "inline")), InvalidInput);
}

TEST(JsonIo_Paths, MissingPathsKey_InvalidInput) {
    EXPECT_THROW(parse_paths(parse_json(R"({"series": []})", "inline")), InvalidInput);
}

// ─── JsonBalanceSource ───────────────────────────────────────────────────────

TEST(JsonIo_BalanceSource, LatestBlockByDefault) {
    JsonBalanceSource src(parse_json(BALANCES_JSON, "inline"), pair_tokens());
    const auto balances = src.get_balances("pool-a", std::nullopt);
    ASSERT_EQ(balances.size(), 2u);
    EXPECT_EQ(balances.at("USDT"), RealT(2000));
    EXPECT_EQ(balances.at("USDC"), RealT(1000));
    EXPECT_EQ(src.latest_block("pool-a"), 300u);
}

TEST(JsonIo_BalanceSource, SpecificBlockAndIntegerRawAmounts) {
    JsonBalanceSource src(parse_json(BALANCES_JSON, "inline"), pair_tokens());
    const auto balances = src.get_balances("pool-a", 100);
    EXPECT_EQ(balances.at("USDT"), RealT(1000));
    EXPECT_EQ(balances.at("USDC"), RealT(1000));
}

TEST(JsonIo_BalanceSource, BlocksSortedAscending) {
    JsonBalanceSource src(parse_json(BALANCES_JSON, "inline"), pair_tokens());
    EXPECT_EQ(src.blocks("pool-a"), (std::vector<uint64_t>{100, 300}));
}

TEST(JsonIo_BalanceSource, UnknownBlockOrAccount_InvalidInput) {
    JsonBalanceSource src(parse_json(BALANCES_JSON, "inline"), pair_tokens());
    EXPECT_THROW(src.get_balances("pool-a", 200), InvalidInput);
    EXPECT_THROW(src.get_balances("pool-z", std::nullopt), InvalidInput);
    EXPECT_THROW(src.get_balances("pool-b", std::nullopt), InvalidInput);
}

TEST(JsonIo_BalanceSource, NegativeRawAmount_InvalidInput) {
    const char* doc = R"({"accounts": {"a": [{"block": 1, "balances": {"10": -5}}]}})";
    EXPECT_THROW({ JsonBalanceSource src(parse_json(doc, "inline"), pair_tokens()); }, InvalidInput);
}

TEST(JsonIo_BalanceSource, FeedsPricingContext) {
    JsonBalanceSource src(parse_json(BALANCES_JSON, "inline"), pair_tokens());
    PoolConfig cfg;
    cfg.base = pair_tokens()[0];
    cfg.quote = pair_tokens()[1];
    cfg.account = "pool-a";
    cfg.amplification = 10;
    cfg.precision = static_cast<RealT>(1e-9);
    PoolPricingContext ctx(cfg, src);
    EXPECT_NEAR(d(ctx.current_price(100)), 1.0, 1e-9);
    EXPECT_NEAR(d(ctx.current_price()), 1.0766113, 1e-5);
}

// ─── Reports ─────────────────────────────────────────────────────────────────

TEST(JsonIo_Report, RiskReportFields) {
    RiskReport r;
    r.alpha = RealT(0.5);
    r.sample_count = 5;
    r.rank_index = 2;
    r.value_at_risk = RealT(-0.5);
    r.multiplier = RealT(2);
    const auto obj = to_json(r);
    EXPECT_EQ(obj.at("samples").as_uint64(), 5u);
    EXPECT_EQ(obj.at("rank_index").as_uint64(), 2u);
    EXPECT_DOUBLE_EQ(obj.at("value_at_risk").as_double(), -0.5);
    EXPECT_DOUBLE_EQ(obj.at("threshold_multiplier").as_double(), 2.0);
    EXPECT_TRUE(obj.at("at_step").is_null());
}

TEST(JsonIo_Report, PriceQuoteFields) {
    PoolConfig cfg;
    cfg.base = Token{"USDT", 10, 6};
    cfg.quote = Token{"USDC", 22, 18};
    cfg.account = "pool-a";
    PriceQuote q;
    q.price = RealT(1.5);
    q.D = RealT(3000);
    q.balances = {RealT(2000), RealT(1000)};
    q.block = 300;
    const auto obj = to_json(q, cfg);
    EXPECT_EQ(obj.at("block").as_uint64(), 300u);
    EXPECT_EQ(std::string(obj.at("base").as_string().c_str()), "USDT");
    EXPECT_DOUBLE_EQ(obj.at("price").as_double(), 1.5);
    EXPECT_EQ(obj.at("balances").as_array().size(), 2u);
}
