#pragma once

#include <cstddef>
#include <cstdint>

namespace fieldkit::params {

constexpr int64_t modulus_50bits = 1125625028935681LL;
constexpr int64_t modulus_60bits = 4611686018326724609LL;
constexpr int64_t modulus_mersenne61 = 2305843009213693951LL;

/* 2^256 - 351 * 2^32 + 1 */
constexpr const char *modulus_stark256 =
    "115792089237316195423570985008687907853269984665640564039457584006405596119041";

/************************************************************
 * Generator for roots of unity modulo modulus_stark256.
 *
 * 7 is a quadratic non-residue, so 7^((p-1)/2^k) is a
 * primitive 2^k-th root for every k <= 32. Pass it to
 * root_of_unity explicitly: factoring p - 1 by trial
 * division does not finish for this modulus.
 ************************************************************/
constexpr int stark256_generator = 7;

enum class primality_check : unsigned char {
    trusted,
    miller_rabin,
};

constexpr primality_check default_primality_check = primality_check::miller_rabin;
constexpr unsigned miller_rabin_trials = 25;

}  // namespace fieldkit::params
