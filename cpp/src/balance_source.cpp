#include "balance_source.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"

namespace poolrisk {

namespace {

const char* const UINT256_MAX_DIGITS =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";

} // namespace

RealT normalize_balance(const uint256& raw, unsigned decimals) {
    using Traits = NumTraits<RealT>;
    if (decimals > MAX_TOKEN_DECIMALS) {
        throw InvalidInput("normalize: decimals " + std::to_string(decimals) + " above "
                           + std::to_string(MAX_TOKEN_DECIMALS));
    }
    if (decimals == 0) {
        return Traits::from_uint256(raw);
    }
    const uint256 unit = boost::multiprecision::pow(uint256(10), decimals);
    const uint256 whole = raw / unit;
    const uint256 frac = raw % unit;
    return Traits::from_uint256(whole) + Traits::from_uint256(frac) / Traits::pow10(decimals);
}

RealT normalize_balance(const std::string& raw, unsigned decimals) {
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        throw InvalidInput("normalize: raw balance '" + raw + "' is not an unsigned decimal integer");
    }
    // cpp_int reads a leading 0 as an octal prefix
    const auto first_nz = raw.find_first_not_of('0');
    const std::string digits = (first_nz == std::string::npos) ? std::string("0") : raw.substr(first_nz);
    const std::string limit = UINT256_MAX_DIGITS;
    if (digits.size() > limit.size() || (digits.size() == limit.size() && digits > limit)) {
        throw InvalidInput("normalize: raw balance '" + raw + "' exceeds 256 bits");
    }
    uint256 value;
    try {
        value = uint256(digits);
    } catch (const std::exception& e) {
        throw InvalidInput("normalize: cannot parse raw balance '" + raw + "': " + e.what());
    }
    return normalize_balance(value, decimals);
}

} // namespace poolrisk
