#pragma once

#include <vector>

#include <fieldkit/prime_field.hpp>

namespace fieldkit {

/************************************************************
 * Invert many elements with a single field inversion
 * (Montgomery's trick).
 *
 * Zero entries have no inverse and are passed through as
 * zero. All entries must belong to one field.
 *
 * Example:
 *     batch_inverse({F(2), F(0), F(3)}) -> {1/2, 0, 1/3}
 *
 * @param values  Elements to invert
 * @return  Inverses in the same order
 * @throw incompatible_modulus_error  on mixed fields
 ************************************************************/
template <IsFieldInteger Integer>
std::vector<field_element<Integer>>
batch_inverse(const std::vector<field_element<Integer>>& values) {
    using element_t = field_element<Integer>;

    if (values.empty())
        return {};

    const element_t one = values.front().pow(0);

    // partials[i] is the product of the nonzero entries before i
    std::vector<element_t> partials;
    partials.reserve(values.size() + 1);
    partials.push_back(one);
    for (const auto& v : values) {
        if (!v.same_field(one)) {
            DEBUG << "Mixed moduli " << one.modulus() << " and " << v.modulus();
            FIELDKIT_THROW( incompatible_modulus_error()
                            << throw_reason("Batch contains elements of different fields")
                            << throw_error_code(error_code::incompatible_modulus) );
        }
        partials.push_back(v.is_zero() ? partials.back() : partials.back() * v);
    }

    element_t inv = partials.back().inverse();
    std::vector<element_t> outputs(values);
    for (size_t i = values.size(); i > 0; i--) {
        if (values[i - 1].is_zero())
            continue;
        outputs[i - 1] = partials[i - 1] * inv;
        inv = inv * values[i - 1];
    }
    return outputs;
}

}  // namespace fieldkit
