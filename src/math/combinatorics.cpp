#include "libbinom/math/combinatorics.hpp"

#include <stdexcept>

namespace binom::comb {

mpz_class factorial_count(std::uint64_t n) {
    mpz_class result = 1;
    for (std::uint64_t i = 2; i <= n; ++i) {
        result *= static_cast<unsigned long>(i);
    }
    return result;
}

mpz_class combinations_count(std::uint64_t n, std::uint64_t r) {
    if (r > n) {
        throw std::domain_error("combinations_count: r must not exceed n");
    }
    const mpz_class numer = factorial_count(n);
    const mpz_class denom = factorial_count(r) * factorial_count(n - r);
    mpz_class result;
    mpz_divexact(result.get_mpz_t(), numer.get_mpz_t(), denom.get_mpz_t());
    return result;
}

} // namespace binom::comb
