// poolrisk: stableswap pool price and drawdown threshold harness
// -------------------------------------------------------------
// - price:     prices a pair from a balance snapshot file (latest or --block).
// - history:   prices every block of the snapshot file and reports returns.
// - threshold: loads simulated/historical price paths and reports the VaR
//              based threshold multiplier at --alpha.
// Progress goes to stdout, the JSON report is the final stdout line.
//
#include <iostream>

#include "cli.hpp"

int main(int argc, char** argv) {
    return poolrisk::cli::run(argc, argv, std::cout, std::cerr);
}
