#pragma once

#include <gmpxx.h>

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace binom {

// Raised when a value that must be an integer is of a non-integer type.
class TypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

namespace detail {

template <typename T>
struct is_integer_type
    : std::bool_constant<std::is_integral_v<T>
                         && !std::is_same_v<T, bool>
                         && !std::is_same_v<T, char>
                         && !std::is_same_v<T, signed char>
                         && !std::is_same_v<T, unsigned char>
                         && !std::is_same_v<T, wchar_t>
                         && !std::is_same_v<T, char16_t>
                         && !std::is_same_v<T, char32_t>> {};

// mpz_class and unevaluated GMP integer expressions (a + b, -a, ...).
template <typename T>
struct is_gmp_integer : std::false_type {};

template <typename U>
struct is_gmp_integer<__gmp_expr<mpz_t, U>> : std::true_type {};

template <typename T>
inline constexpr bool is_gmp_integer_v = is_gmp_integer<std::decay_t<T>>::value;

template <typename T>
inline constexpr bool is_integer_type_v = is_integer_type<std::decay_t<T>>::value
                                          || is_gmp_integer_v<T>;

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
std::string describe(const T& x) {
    if constexpr (std::is_floating_point_v<T>) {
        // 4.0 must not read as an integer
        std::ostringstream oss;
        oss << x;
        std::string out = oss.str();
        if (std::isfinite(x) && out.find_first_of(".e") == std::string::npos) {
            out += ".0";
        }
        return out;
    } else if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        oss << x;
        return oss.str();
    } else {
        return "value";
    }
}

[[noreturn]] void fail_not_integer(const std::string& what);
[[noreturn]] void fail_negative(const std::string& what);
[[noreturn]] void fail_greater(const std::string& x, const std::string& y);

// Exact conversion of an integer-typed value, any width or signedness.
template <typename T>
mpz_class to_mpz(const T& x) {
    using U = std::decay_t<T>;
    if constexpr (is_gmp_integer_v<U>) {
        return mpz_class(x);
    } else if constexpr (std::is_signed_v<U>) {
        static_assert(sizeof(U) <= sizeof(long), "integer type wider than long");
        return mpz_class(static_cast<long>(x));
    } else {
        static_assert(sizeof(U) <= sizeof(unsigned long), "integer type wider than unsigned long");
        return mpz_class(static_cast<unsigned long>(x));
    }
}

// Narrows an already validated (non-negative integer) value to a machine count.
// Throws std::overflow_error if it does not fit.
std::uint64_t checked_count(const mpz_class& x);

template <typename T>
std::uint64_t as_count(const T& x) {
    using U = std::decay_t<T>;
    if constexpr (is_gmp_integer_v<U>) {
        return checked_count(mpz_class(x));
    } else if constexpr (is_integer_type_v<U>) {
        return static_cast<std::uint64_t>(x);
    } else {
        fail_not_integer(describe(x));
    }
}

} // namespace detail

// Type check first, sign check second. Floating-point arguments are rejected
// even when integral valued (4.0).
template <typename T>
void validate_non_negative_integer(const T& x) {
    using U = std::decay_t<T>;
    if constexpr (!detail::is_integer_type_v<U>) {
        detail::fail_not_integer(detail::describe(x));
    } else if constexpr (detail::is_gmp_integer_v<U>) {
        const mpz_class value(x);
        if (sgn(value) < 0) {
            detail::fail_negative(value.get_str());
        }
    } else if constexpr (std::is_signed_v<U>) {
        if (x < 0) {
            detail::fail_negative(std::to_string(x));
        }
    }
}

// Validates x, then y, then x <= y. The first failing check throws.
template <typename X, typename Y>
void validate_less_equal(const X& x, const Y& y) {
    validate_non_negative_integer(x);
    validate_non_negative_integer(y);
    if constexpr (detail::is_integer_type_v<X> && detail::is_integer_type_v<Y>) {
        const mpz_class lhs = detail::to_mpz(x);
        const mpz_class rhs = detail::to_mpz(y);
        if (lhs > rhs) {
            detail::fail_greater(lhs.get_str(), rhs.get_str());
        }
    }
}

} // namespace binom
