#include <catch2/catch_all.hpp>

#include "libbinom/math/combinatorics.hpp"

#include <gmpxx.h>
#include <stdexcept>
#include <string>

TEST_CASE("Factorial of small values", "[factorial]") {
    REQUIRE(binom::comb::factorial(0) == 1);
    REQUIRE(binom::comb::factorial(1) == 1);
    REQUIRE(binom::comb::factorial(2) == 2);
    REQUIRE(binom::comb::factorial(3) == 6);
    REQUIRE(binom::comb::factorial(4) == 24);
    REQUIRE(binom::comb::factorial(5) == 120);
}

TEST_CASE("Factorial is exact beyond 64 bits", "[factorial][exact]") {
    REQUIRE(binom::comb::factorial(25) == mpz_class("15511210043330985984000000"));
    REQUIRE(binom::comb::factorial(mpz_class(30)) == mpz_class("265252859812191058636308480000000"));
}

TEST_CASE("Factorial satisfies n! = n (n-1)!", "[factorial]") {
    for (int n = 2; n <= 60; ++n) {
        INFO("n=" << n);
        const mpz_class expected = n * binom::comb::factorial(n - 1);
        REQUIRE(binom::comb::factorial(n) == expected);
    }
}

TEST_CASE("Factorial input validation", "[factorial][validation]") {
    REQUIRE_THROWS_AS(binom::comb::factorial(-4), std::domain_error);
    REQUIRE_THROWS_AS(binom::comb::factorial(4.5), binom::TypeError);
    REQUIRE_THROWS_AS(binom::comb::factorial(4.0), binom::TypeError);
    REQUIRE_THROWS_AS(binom::comb::factorial(std::string("cat")), binom::TypeError);
}

TEST_CASE("Factorial rejects counts beyond machine range", "[factorial][validation]") {
    const mpz_class huge("1000000000000000000000000000000");
    REQUIRE_THROWS_AS(binom::comb::factorial(huge), std::overflow_error);
}

TEST_CASE("Factorial and combinations accept GMP integer expressions", "[factorial][combinations][gmp]") {
    const mpz_class a(3), b(2);
    REQUIRE(binom::comb::factorial(a + b) == 120);
    REQUIRE(binom::comb::factorial(a * b) == 720);
    REQUIRE(binom::comb::combinations(a + 1, b) == 6);
    REQUIRE_THROWS_AS(binom::comb::factorial(b - a), std::domain_error);
    REQUIRE_THROWS_AS(binom::comb::combinations(a, a + b), std::domain_error);
}

TEST_CASE("Combinations of four elements", "[combinations]") {
    REQUIRE(binom::comb::combinations(4, 0) == 1);
    REQUIRE(binom::comb::combinations(4, 1) == 4);
    REQUIRE(binom::comb::combinations(4, 2) == 6);
    REQUIRE(binom::comb::combinations(4, 3) == 4);
    REQUIRE(binom::comb::combinations(4, 4) == 1);
}

TEST_CASE("Combinations are symmetric", "[combinations]") {
    for (int n = 0; n <= 40; ++n) {
        for (int r = 0; r <= n; ++r) {
            REQUIRE(binom::comb::combinations(n, r) == binom::comb::combinations(n, n - r));
        }
    }
}

TEST_CASE("Combinations are exact for large n", "[combinations][exact]") {
    REQUIRE(binom::comb::combinations(100, 50) == mpz_class("100891344545564193334812497256"));
    mpz_class ref;
    mpz_bin_uiui(ref.get_mpz_t(), 200, 73);
    REQUIRE(binom::comb::combinations(200, 73) == ref);
}

TEST_CASE("Combinations input validation", "[combinations][validation]") {
    REQUIRE_THROWS_AS(binom::comb::combinations(-4, 1), std::domain_error);
    REQUIRE_THROWS_AS(binom::comb::combinations(4, -1), std::domain_error);
    REQUIRE_THROWS_AS(binom::comb::combinations(2, 4), std::domain_error);
    REQUIRE_THROWS_AS(binom::comb::combinations(4.5, 1), binom::TypeError);
    REQUIRE_THROWS_AS(binom::comb::combinations(4, 1.5), binom::TypeError);
    // n is checked before r
    REQUIRE_THROWS_AS(binom::comb::combinations(4.5, -1), binom::TypeError);
}

TEST_CASE("combinations_count rejects r > n", "[combinations]") {
    REQUIRE_THROWS_AS(binom::comb::combinations_count(3, 5), std::domain_error);
    REQUIRE(binom::comb::combinations_count(10, 3) == 120);
}
