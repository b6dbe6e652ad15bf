#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/integer/mod_inverse.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

#include <fieldkit/common.hpp>
#include <fieldkit/exception.hpp>
#include <fieldkit/params.hpp>
#include <fieldkit/util/log.hpp>

namespace fieldkit {

template <typename Integer>
concept IsFieldInteger = std::numeric_limits<Integer>::is_specialized
    && std::numeric_limits<Integer>::is_integer
    && std::numeric_limits<Integer>::is_signed
    && has_wide_product_v<Integer>;

template <IsFieldInteger Integer> class basic_prime_field;

/************************************************************
 * An element of Z_p.
 *
 * The value is always the canonical representative in
 * [0, p). Elements are immutable: every operator returns a
 * new element. Binary operators throw
 * incompatible_modulus_error when the operands come from
 * fields with different moduli.
 ************************************************************/
template <IsFieldInteger Integer>
class field_element {
public:
    using value_type = Integer;
    using wide_type = wide_integer_t<Integer>;
    using field_type = basic_prime_field<Integer>;

    field_element(const field_element&) = default;
    field_element(field_element&&) = default;
    field_element& operator=(const field_element&) = default;
    field_element& operator=(field_element&&) = default;

    const value_type& data() const noexcept { return element_; }
    const value_type& modulus() const noexcept { return *modulus_; }

    bool is_zero() const { return element_ == 0; }

    bool same_field(const field_element& other) const {
        return modulus_ == other.modulus_ || *modulus_ == *other.modulus_;
    }

    template <typename Number>
    explicit operator Number() const { return narrow_cast<Number>(element_); }

    field_element operator-() const {
        if (is_zero())
            return *this;
        return with_value(value_type(modulus() - element_));
    }

    friend field_element operator+(const field_element& a, const field_element& b) {
        a.check_compatible(b);
        value_type r = a.element_ + b.element_;
        if (r >= a.modulus())
            r -= a.modulus();
        return a.with_value(std::move(r));
    }

    friend field_element operator-(const field_element& a, const field_element& b) {
        a.check_compatible(b);
        value_type r = a.element_ - b.element_;
        if (r < 0)
            r += a.modulus();
        return a.with_value(std::move(r));
    }

    friend field_element operator*(const field_element& a, const field_element& b) {
        a.check_compatible(b);
        wide_type product = wide_type(a.element_) * wide_type(b.element_);
        product %= wide_type(a.modulus());
        return a.with_value(narrow_cast<value_type>(product));
    }

    friend field_element operator/(const field_element& a, const field_element& b) {
        a.check_compatible(b);
        return a * b.inverse();
    }

    /* Elements of different fields compare unequal, they never throw */
    friend bool operator==(const field_element& a, const field_element& b) {
        return a.same_field(b) && a.element_ == b.element_;
    }

    /************************************************************
     * Multiplicative inverse by the extended Euclidean
     * algorithm on (value, p).
     *
     * @throw division_by_zero_error  for the zero element
     * @throw not_invertible_error    if gcd(value, p) != 1,
     *                                which needs a composite p
     ************************************************************/
    field_element inverse() const {
        if (is_zero()) {
            DEBUG << "Attempt to invert zero modulo " << modulus();
            FIELDKIT_THROW( division_by_zero_error()
                            << throw_reason("Zero has no multiplicative inverse")
                            << throw_error_code(error_code::division_by_zero) );
        }

        value_type inv = boost::integer::mod_inverse(element_, modulus());
        if (inv == 0) {
            DEBUG << "No inverse of " << element_ << " modulo " << modulus();
            FIELDKIT_THROW( not_invertible_error()
                            << throw_reason("Element shares a factor with the modulus")
                            << throw_error_code(error_code::not_invertible) );
        }
        return with_value(std::move(inv));
    }

    /************************************************************
     * Square-and-multiply exponentiation, O(log n) products.
     *
     * x^0 is one for every x, zero included. A negative
     * exponent raises the inverse, so 0^-n throws
     * division_by_zero_error.
     ************************************************************/
    template <typename Exponent>
    field_element pow(const Exponent& n) const {
        mp::cpp_int e(n);
        field_element base = *this;
        if (e < 0) {
            base = inverse();
            e = -e;
        }

        field_element result = with_value(value_type(1));
        while (e > 0) {
            if (mp::bit_test(e, 0))
                result = result * base;
            e >>= 1;
            if (e > 0)
                base = base * base;
        }
        return result;
    }

    std::string to_string() const {
        std::ostringstream os;
        os << element_;
        return os.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const field_element& e) {
        return os << e.element_;
    }

private:
    friend class basic_prime_field<Integer>;

    field_element(std::shared_ptr<const value_type> modulus, value_type v)
        : modulus_(std::move(modulus)), element_(std::move(v)) { }

    field_element with_value(value_type v) const { return field_element(modulus_, std::move(v)); }

    void check_compatible(const field_element& other) const {
        if (!same_field(other)) {
            DEBUG << "Mixed moduli " << modulus() << " and " << other.modulus();
            FIELDKIT_THROW( incompatible_modulus_error()
                            << throw_reason("Operands belong to different prime fields")
                            << throw_error_code(error_code::incompatible_modulus) );
        }
    }

    std::shared_ptr<const value_type> modulus_;
    value_type element_;
};

template <IsFieldInteger Integer, typename Exponent>
field_element<Integer> pow(const field_element<Integer>& base, const Exponent& n) {
    return base.pow(n);
}

/************************************************************
 * Factory for elements of Z_p.
 *
 * The modulus is validated once, at construction, and shared
 * by every element the field produces.
 *
 * @param p      The prime modulus
 * @param check  Whether to run a Miller-Rabin test on p, or
 *               trust the caller
 * @throw invalid_modulus_error  if p < 2, p fails the
 *                               primality test, or p does not
 *                               fit the backend
 ************************************************************/
template <IsFieldInteger Integer>
class basic_prime_field {
public:
    using value_type = Integer;
    using wide_type = wide_integer_t<Integer>;
    using element_type = field_element<Integer>;

    explicit basic_prime_field(value_type p,
                               params::primality_check check = params::default_primality_check)
        : modulus_(std::make_shared<const value_type>(validate(std::move(p), check))),
          checked_(check == params::primality_check::miller_rabin)
    {
        DEBUG << "Prime field over modulus " << *modulus_
              << (checked_ ? " (checked)" : " (trusted)");
    }

    const value_type& modulus() const noexcept { return *modulus_; }
    bool checked() const noexcept { return checked_; }

    element_type element(const value_type& v) const {
        return element_type(modulus_, modulo_neg(v, *modulus_));
    }

    template <std::integral T> requires (!std::same_as<T, value_type>)
    element_type element(T v) const {
        if constexpr (std::is_unsigned_v<T> && is_fixed_width_v<value_type>
                      && sizeof(T) >= sizeof(wide_type)) {
            T r = v % static_cast<T>(*modulus_);
            return element_type(modulus_, static_cast<value_type>(r));
        }
        else {
            wide_type r = modulo_neg(wide_type(v), wide_type(*modulus_));
            return element_type(modulus_, narrow_cast<value_type>(r));
        }
    }

    element_type zero() const { return element_type(modulus_, value_type(0)); }
    element_type one() const { return element_type(modulus_, value_type(1)); }

    /* n / d, throws division_by_zero_error if d is a multiple of p */
    template <typename Num, typename Den>
    element_type fraction(const Num& n, const Den& d) const {
        return element(n) / element(d);
    }

    friend bool operator==(const basic_prime_field& a, const basic_prime_field& b) {
        return a.modulus() == b.modulus();
    }

private:
    static value_type validate(value_type p, params::primality_check check) {
        if (p < 2) {
            DEBUG << "Rejected modulus " << p;
            FIELDKIT_THROW( invalid_modulus_error()
                            << throw_reason("Modulus must be greater than 1")
                            << throw_error_code(error_code::invalid_modulus) );
        }

        // a + b must stay representable for reduced a, b
        if constexpr (is_fixed_width_v<value_type>) {
            if (p > std::numeric_limits<value_type>::max() / 2) {
                DEBUG << "Rejected modulus " << p << " for fixed width backend";
                FIELDKIT_THROW( invalid_modulus_error()
                                << throw_reason("Modulus too wide for the integer backend")
                                << throw_error_code(error_code::invalid_modulus) );
            }
        }

        switch (check) {
        case params::primality_check::miller_rabin:
            if (!is_prime(p)) {
                DEBUG << "Rejected composite modulus " << p;
                FIELDKIT_THROW( invalid_modulus_error()
                                << throw_reason("Modulus is not prime")
                                << throw_error_code(error_code::invalid_modulus) );
            }
            break;
        case params::primality_check::trusted:
            WARNING << "Primality of modulus " << p << " not verified";
            break;
        }
        return p;
    }

    std::shared_ptr<const value_type> modulus_;
    bool checked_;
};

using prime_field = basic_prime_field<mp::cpp_int>;
using prime_field32 = basic_prime_field<int32_t>;
using prime_field64 = basic_prime_field<int64_t>;

}  // namespace fieldkit
