#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/miller_rabin.hpp>
#include <boost/random/mersenne_twister.hpp>

#include <fieldkit/params.hpp>

namespace fieldkit {

namespace mp = boost::multiprecision;

/************************************************************
 * Integer type wide enough to hold the product of two
 * reduced values. Arbitrary precision types are their own
 * wide type.
 ************************************************************/
template <typename Integer>
struct wide_integer { using type = Integer; };

template <std::signed_integral Integer> requires (sizeof(Integer) <= 4)
struct wide_integer<Integer> { using type = int64_t; };

template <std::signed_integral Integer> requires (sizeof(Integer) == 8)
struct wide_integer<Integer> { using type = mp::int128_t; };

template <typename Integer>
using wide_integer_t = typename wide_integer<Integer>::type;

template <typename Integer>
constexpr bool is_fixed_width_v = std::numeric_limits<Integer>::is_bounded;

/* Bounded types need a wide type with at least twice their digits */
template <typename Integer>
constexpr bool has_wide_product_v = !is_fixed_width_v<Integer>
    || std::numeric_limits<wide_integer_t<Integer>>::digits
           >= 2 * std::numeric_limits<Integer>::digits;

template <typename Number, typename From>
Number narrow_cast(const From& x) {
    if constexpr (std::is_same_v<Number, From>) {
        return x;
    }
    else if constexpr (requires { x.template convert_to<Number>(); }) {
        return x.template convert_to<Number>();
    }
    else {
        return static_cast<Number>(x);
    }
}

/* Reduce a value already known to be non-negative */
template <typename Number>
Number modulo(const Number& x, const Number& m) {
    return (x >= m) ? Number(x % m) : x;
}

/* Reduce any value into [0, m) */
template <typename Number>
Number modulo_neg(const Number& x, const Number& m) {
    if (x < 0) {
        Number r = x % m;
        return (r < 0) ? Number(r + m) : r;
    }
    return modulo(x, m);
}

/* Miller-Rabin with a locally seeded engine, safe to call concurrently */
template <typename Integer>
bool is_prime(const Integer& n, unsigned trials = params::miller_rabin_trials) {
    if (n < 2)
        return false;
    boost::random::mt19937 gen;
    return mp::miller_rabin_test(n, trials, gen);
}

}  // namespace fieldkit
