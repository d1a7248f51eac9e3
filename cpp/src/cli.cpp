#include "cli.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

#include "errors.hpp"
#include "pool_pricing.hpp"
#include "risk_estimator.hpp"

namespace poolrisk {
namespace cli {

const char* const USAGE =
    "usage:\n"
    "  poolrisk price <pool_config.json> [--balances FILE] [--block N] [--inverse]\n"
    "  poolrisk history <pool_config.json> [--balances FILE] [--inverse]\n"
    "  poolrisk threshold <paths.json> --alpha X [--at-step N] [--threads N]\n";

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

json::object run_pricing(const Options& opts, std::ostream& out) {
    const PoolFile file = load_pool_file(opts.input_path);
    const fs::path balances_path = resolve_balances(file, opts);
    auto source = JsonBalanceSource::from_file(balances_path, {file.pool.base, file.pool.quote});
    const auto& account = file.pool.account;
    out << "Loaded pool " << file.pool.base.name << "/" << file.pool.quote.name
        << " (A=" << file.pool.amplification << ") with "
        << source.blocks(account).size() << " snapshots from " << balances_path << "\n";

    PoolPricingContext ctx(file.pool, source);

    json::object result;
    if (opts.command == "price") {
        auto q = ctx.quote(opts.block, opts.inverse);
        if (!q.block) q.block = source.latest_block(account);
        result = to_json(q, file.pool);
    } else {
        const auto t0 = std::chrono::steady_clock::now();
        const auto history = price_history(ctx, source.blocks(account), opts.inverse);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        out << "priced " << history.prices.size() << " blocks in " << ms << " ms\n";
        result = to_json(history);
        result["base"] = file.pool.base.name;
        result["quote"] = file.pool.quote.name;
        result["inverse"] = opts.inverse;
    }
    return result;
}

json::object run_threshold(const Options& opts, std::ostream& out) {
    const auto paths = load_paths(opts.input_path);
    out << "Loaded " << paths.size() << " paths from " << opts.input_path << "\n";

    RiskEstimator::Config cfg;
    cfg.threads = opts.threads;
    const RiskEstimator estimator(cfg);
    const auto report = estimator.estimate(paths, *opts.alpha, opts.at_step);

    json::object result = to_json(report);
    result["paths_file"] = opts.input_path.string();
    result["threads"] = static_cast<uint64_t>(cfg.threads);
    return result;
}

} // namespace

size_t default_threads() {
    size_t threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (const char* thr = std::getenv("POOLRISK_THREADS")) {
        if (all_digits(thr)) {
            try {
                threads = std::max<size_t>(1, std::stoul(thr));
            } catch (const std::out_of_range&) {
                std::cerr << "warning: ignoring POOLRISK_THREADS=" << thr << "\n";
            }
        } else {
            std::cerr << "warning: ignoring POOLRISK_THREADS=" << thr << "\n";
        }
    }
    return threads;
}

Options parse_cli(int argc, const char* const* argv) {
    if (argc < 3) {
        throw InvalidInput(std::string("missing arguments\n") + USAGE);
    }
    Options opts;
    opts.threads = default_threads();
    opts.command = argv[1];
    if (opts.command != "price" && opts.command != "history" && opts.command != "threshold") {
        throw InvalidInput("unknown command '" + opts.command + "'\n" + USAGE);
    }
    opts.input_path = fs::absolute(fs::path(argv[2]));

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw InvalidInput("missing value for " + arg);
            return argv[++i];
        };
        auto count = [&]() -> uint64_t {
            const std::string v = value();
            if (!all_digits(v)) {
                throw InvalidInput(arg + " expects a non-negative integer, got '" + v + "'");
            }
            try {
                return static_cast<uint64_t>(std::stoull(v));
            } catch (const std::out_of_range&) {
                throw InvalidInput(arg + " does not fit in 64 bits: '" + v + "'");
            }
        };
        if (arg == "--balances") {
            opts.balances_override = fs::absolute(fs::path(value()));
        } else if (arg == "--block") {
            opts.block = count();
        } else if (arg == "--inverse") {
            opts.inverse = true;
        } else if (arg == "--alpha") {
            opts.alpha = real_from_string(value());
        } else if (arg == "--at-step") {
            opts.at_step = static_cast<size_t>(count());
        } else if (arg == "--threads") {
            opts.threads = std::max<size_t>(1, static_cast<size_t>(count()));
        } else {
            throw InvalidInput("unknown option " + arg + "\n" + USAGE);
        }
    }
    if (opts.command == "threshold" && !opts.alpha) {
        throw InvalidInput("threshold requires --alpha");
    }
    return opts;
}

fs::path resolve_balances(const PoolFile& file, const Options& opts) {
    const fs::path path = opts.balances_override ? *opts.balances_override : file.balances_path;
    if (path.empty()) {
        throw InvalidInput("pool config has no meta.balances and no --balances override was given");
    }
    if (!fs::exists(path)) {
        throw InvalidInput("balance file not found: " + path.string());
    }
    return path;
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        const Options opts = parse_cli(argc, argv);
        const json::object output = (opts.command == "threshold") ? run_threshold(opts, out)
                                                                  : run_pricing(opts, out);
        out << json::serialize(output) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        err << "error: " << e.what() << '\n';
        return 1;
    }
}

} // namespace cli
} // namespace poolrisk
