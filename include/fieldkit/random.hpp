#pragma once

#include <boost/multiprecision/random.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include <fieldkit/prime_field.hpp>

namespace fieldkit {

/* Uniform element of [0, p) */
template <IsFieldInteger Integer, typename RandomEngine>
field_element<Integer> random_element(const basic_prime_field<Integer>& field, RandomEngine& engine) {
    boost::random::uniform_int_distribution<Integer> dist(Integer{0}, Integer(field.modulus() - 1));
    return field.element(dist(engine));
}

/* Uniform element of [1, p) */
template <IsFieldInteger Integer, typename RandomEngine>
field_element<Integer> random_nonzero_element(const basic_prime_field<Integer>& field, RandomEngine& engine) {
    boost::random::uniform_int_distribution<Integer> dist(Integer{1}, Integer(field.modulus() - 1));
    return field.element(dist(engine));
}

}  // namespace fieldkit
