#pragma once

#include <cmath>
#include <cstdlib>
#include <string>

#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include "errors.hpp"

#if defined(POOLRISK_T_DEC50)
#  define POOLRISK_T_TYPE boost::multiprecision::cpp_dec_float_50
#elif defined(POOLRISK_T_FLOAT)
#  define POOLRISK_T_TYPE float
#elif defined(POOLRISK_T_LONG_DOUBLE)
#  define POOLRISK_T_TYPE long double
#elif defined(POOLRISK_T_DOUBLE)
#  define POOLRISK_T_TYPE double
#else
#  define POOLRISK_T_TYPE double
#endif

namespace poolrisk {

using RealT = POOLRISK_T_TYPE;
using uint256 = boost::multiprecision::uint256_t;
using dec50 = boost::multiprecision::cpp_dec_float_50;

template <typename T>
struct NumTraits;

template <>
struct NumTraits<double> {
    using T = double;
    static T ZERO() { return 0.0; }
    static T ONE() { return 1.0; }
    static T abs(const T& x) { return std::fabs(x); }
    static T floor(const T& x) { return std::floor(x); }
    static bool is_finite(const T& x) { return std::isfinite(x); }
    static T from_uint256(const uint256& x) { return x.convert_to<T>(); }
    static T pow10(unsigned e) { return std::pow(10.0, static_cast<int>(e)); }
    static double to_double(const T& x) { return x; }
};

template <>
struct NumTraits<float> {
    using T = float;
    static T ZERO() { return 0.0f; }
    static T ONE() { return 1.0f; }
    static T abs(const T& x) { return std::fabs(x); }
    static T floor(const T& x) { return std::floor(x); }
    static bool is_finite(const T& x) { return std::isfinite(x); }
    static T from_uint256(const uint256& x) { return x.convert_to<T>(); }
    static T pow10(unsigned e) { return std::pow(10.0f, static_cast<int>(e)); }
    static double to_double(const T& x) { return static_cast<double>(x); }
};

template <>
struct NumTraits<long double> {
    using T = long double;
    static T ZERO() { return 0.0L; }
    static T ONE() { return 1.0L; }
    static T abs(const T& x) { return std::fabs(x); }
    static T floor(const T& x) { return std::floor(x); }
    static bool is_finite(const T& x) { return std::isfinite(x); }
    static T from_uint256(const uint256& x) { return x.convert_to<T>(); }
    static T pow10(unsigned e) { return std::pow(10.0L, static_cast<int>(e)); }
    static double to_double(const T& x) { return static_cast<double>(x); }
};

template <>
struct NumTraits<dec50> {
    using T = dec50;
    static T ZERO() { return T(0); }
    static T ONE() { return T(1); }
    static T abs(const T& x) { return boost::multiprecision::abs(x); }
    static T floor(const T& x) { return boost::multiprecision::floor(x); }
    static bool is_finite(const T& x) { return (boost::math::isfinite)(x); }
    static T from_uint256(const uint256& x) { return T(x.str()); }
    static T pow10(unsigned e) { return boost::multiprecision::pow(T(10), static_cast<int>(e)); }
    static double to_double(const T& x) { return x.convert_to<double>(); }
};

// Parses a decimal string into the engine's real type without a detour through double.
inline RealT real_from_string(const std::string& s) {
#if defined(POOLRISK_T_DEC50)
    try {
        return RealT(s.c_str());
    } catch (const std::runtime_error&) {
        throw InvalidInput("not a number: '" + s + "'");
    }
#else
    char* end = nullptr;
    const long double v = std::strtold(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        throw InvalidInput("not a number: '" + s + "'");
    }
    return static_cast<RealT>(v);
#endif
}

} // namespace poolrisk
