#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "json_io.hpp"
#include "real_type.hpp"

namespace poolrisk {
namespace cli {

struct Options {
    std::string command;
    fs::path input_path;
    std::optional<fs::path> balances_override;
    std::optional<uint64_t> block;
    bool inverse{false};
    std::optional<RealT> alpha;
    std::optional<size_t> at_step;
    size_t threads{1};
};

extern const char* const USAGE;

// Worker count from POOLRISK_THREADS, hardware concurrency otherwise.
size_t default_threads();

Options parse_cli(int argc, const char* const* argv);

// --balances when given, otherwise meta.balances resolved against the config
// directory. The file must exist.
fs::path resolve_balances(const PoolFile& file, const Options& opts);

// Runs one command. Progress lines and the final JSON report go to `out`;
// failures print `error: <message>` to `err` and return 1.
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace poolrisk
