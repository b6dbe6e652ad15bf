#pragma once

#include <exception>
#include <ostream>
#include <string>

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

#define FIELDKIT_THROW(x) BOOST_THROW_EXCEPTION(x)

namespace fieldkit {

enum class error_code : unsigned char {
    invalid_modulus,
    incompatible_modulus,
    not_invertible,
    division_by_zero,
    invalid_argument,
};

inline const char* error_code_name(error_code code) noexcept {
    switch (code) {
    case error_code::invalid_modulus:      return "invalid_modulus";
    case error_code::incompatible_modulus: return "incompatible_modulus";
    case error_code::not_invertible:       return "not_invertible";
    case error_code::division_by_zero:     return "division_by_zero";
    case error_code::invalid_argument:     return "invalid_argument";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, error_code code) {
    return os << error_code_name(code);
}

using throw_reason = boost::error_info<struct tag_throw_reason, std::string>;
using throw_error_code = boost::error_info<struct tag_throw_error_code, error_code>;

struct field_error : virtual std::exception, virtual boost::exception {
    const char *what() const noexcept override {
        if (const std::string *reason = boost::get_error_info<throw_reason>(*this)) {
            return reason->c_str();
        }
        return "fieldkit::field_error";
    }

    error_code code() const noexcept {
        if (const error_code *c = boost::get_error_info<throw_error_code>(*this)) {
            return *c;
        }
        return error_code::invalid_argument;
    }
};

/* p < 2, composite p, or p too wide for a fixed-width backend */
struct invalid_modulus_error : field_error { };

/* Operands taken from two different fields */
struct incompatible_modulus_error : field_error { };

/* Nonzero element sharing a factor with a composite (unchecked) modulus */
struct not_invertible_error : field_error { };

struct division_by_zero_error : not_invertible_error { };

}  // namespace fieldkit
