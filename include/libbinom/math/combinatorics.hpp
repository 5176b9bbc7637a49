#pragma once

#include "libbinom/core/validation.hpp"

#include <gmpxx.h>
#include <cstdint>

namespace binom::comb {

// Unchecked kernels on machine counts. Results are exact.
mpz_class factorial_count(std::uint64_t n);

// Requires r <= n.
mpz_class combinations_count(std::uint64_t n, std::uint64_t r);

// n! for any non-negative integer-typed n.
// Throws binom::TypeError for non-integer types, std::domain_error for n < 0.
template <typename N>
mpz_class factorial(const N& n) {
    validate_non_negative_integer(n);
    return factorial_count(detail::as_count(n));
}

// n! / (r! (n-r)!) with exact integer division.
template <typename N, typename R>
mpz_class combinations(const N& n, const R& r) {
    validate_non_negative_integer(n);
    validate_non_negative_integer(r);
    validate_less_equal(r, n);
    return combinations_count(detail::as_count(n), detail::as_count(r));
}

} // namespace binom::comb
