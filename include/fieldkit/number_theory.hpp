#pragma once

#include <algorithm>
#include <vector>

#include <fieldkit/prime_field.hpp>

namespace fieldkit {

/************************************************************
 * Distinct prime factors of n by trial division.
 *
 * Runs in O(sqrt(q)) where q is the second largest prime
 * factor of n, which is fine for NTT-friendly moduli whose
 * p - 1 is mostly a power of two.
 ************************************************************/
template <typename Integer>
std::vector<Integer> distinct_prime_factors(Integer n) {
    std::vector<Integer> factors;
    for (Integer f = 2; f * f <= n; ++f) {
        if (n % f == 0) {
            factors.push_back(f);
            while (n % f == 0)
                n /= f;
        }
    }
    if (n > 1)
        factors.push_back(n);
    return factors;
}

/* Whether g generates Z_p^*, given the distinct prime factors of p - 1 */
template <IsFieldInteger Integer>
bool is_generator(const field_element<Integer>& g, const std::vector<Integer>& factors) {
    if (g.is_zero())
        return false;
    const Integer order = g.modulus() - 1;
    return std::none_of(factors.begin(), factors.end(), [&](const Integer& q) {
        return g.pow(Integer(order / q)).data() == 1;
    });
}

/************************************************************
 * Smallest generator of Z_p^*.
 *
 * A field built with primality_check::trusted is tested
 * here, since p - 1 is only the group order for prime p.
 *
 * @throw invalid_modulus_error  if p is composite
 ************************************************************/
template <IsFieldInteger Integer>
void require_prime_modulus(const Integer& p, const char *reason) {
    if (!is_prime(p)) {
        DEBUG << reason << ", got composite " << p;
        FIELDKIT_THROW( invalid_modulus_error()
                        << throw_reason(reason)
                        << throw_error_code(error_code::invalid_modulus) );
    }
}

template <IsFieldInteger Integer>
field_element<Integer> primitive_root(const basic_prime_field<Integer>& field) {
    if (!field.checked())
        require_prime_modulus(field.modulus(), "Primitive roots need a prime modulus");

    const auto factors = distinct_prime_factors(Integer(field.modulus() - 1));
    for (Integer c = 1; c < field.modulus(); ++c) {
        auto g = field.element(c);
        if (is_generator(g, factors))
            return g;
    }

    DEBUG << "No primitive root modulo " << field.modulus();
    FIELDKIT_THROW( field_error()
                    << throw_reason("Multiplicative group is not cyclic")
                    << throw_error_code(error_code::invalid_argument) );
}

/************************************************************
 * A primitive n-th root of unity, g^((p-1)/n).
 *
 * @param field      Target field
 * @param n          Order of the root, must divide p - 1
 * @param generator  A generator of Z_p^*
 * @throw field_error  with error_code::invalid_argument if n
 *                     does not divide p - 1
 ************************************************************/
template <IsFieldInteger Integer, typename Order>
field_element<Integer> root_of_unity(const basic_prime_field<Integer>& field,
                                     const Order& n,
                                     const field_element<Integer>& generator)
{
    const Integer group_order = field.modulus() - 1;
    const Integer order(n);
    if (order < 1 || group_order % order != 0) {
        DEBUG << "Order " << order << " does not divide " << group_order;
        FIELDKIT_THROW( field_error()
                        << throw_reason("Root order must divide p - 1")
                        << throw_error_code(error_code::invalid_argument) );
    }
    return field.one() * generator.pow(Integer(group_order / order));
}

/* Uses primitive_root, so p - 1 must be factorable by trial division */
template <IsFieldInteger Integer, typename Order>
field_element<Integer> root_of_unity(const basic_prime_field<Integer>& field, const Order& n) {
    return root_of_unity(field, n, primitive_root(field));
}

/************************************************************
 * Smallest k > 0 with a^k == 1.
 *
 * Elements do not record how their field was validated, so
 * the modulus is tested here: over a composite p the group
 * order is not p - 1.
 *
 * @throw field_error            for the zero element
 * @throw invalid_modulus_error  if p is composite
 ************************************************************/
template <IsFieldInteger Integer>
Integer multiplicative_order(const field_element<Integer>& a) {
    if (a.is_zero()) {
        FIELDKIT_THROW( field_error()
                        << throw_reason("Zero has no multiplicative order")
                        << throw_error_code(error_code::invalid_argument) );
    }
    require_prime_modulus(a.modulus(), "Multiplicative order needs a prime modulus");

    Integer order = a.modulus() - 1;
    for (const auto& q : distinct_prime_factors(order)) {
        while (order % q == 0 && a.pow(Integer(order / q)).data() == 1)
            order /= q;
    }
    return order;
}

}  // namespace fieldkit
