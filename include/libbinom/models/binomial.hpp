#pragma once

#include "libbinom/core/validation.hpp"

#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace binom::dist {

// Decimal places used by the presentation routines.
struct ReportConfig {
    int param_precision = 2;
    int value_precision = 4;
};

using Distribution = std::map<std::uint64_t, double>;

// Binomial experiment with n trials and success probability p.
// Parameters are validated once at construction and never change afterwards.
class Binomial {
public:
    // Throws binom::TypeError if num_trials is not integer-typed,
    // std::domain_error if num_trials < 0 or prob_success is outside [0, 1].
    template <typename N>
    Binomial(const N& num_trials, double prob_success)
        : n_(checked_trials(num_trials)),
          p_(checked_probability(prob_success)),
          q_(1.0 - p_),
          pmf_(build_distribution()) {}

    std::uint64_t num_trials() const { return n_; }
    double prob_success() const { return p_; }
    double prob_failure() const { return q_; }

    double expected_value() const;
    double variance() const;

    // (q - p) / sqrt(n p q). Non-finite when n p q == 0.
    double skewness() const;

    // Recomputed on every call; numerically equal to the table cached at construction.
    Distribution distribution() const;
    const Distribution& cached_distribution() const { return pmf_; }

    // P(X = k).
    template <typename K>
    double probability_k(const K& k) const {
        validate_non_negative_integer(k);
        validate_less_equal(k, n_);
        return pmf(detail::as_count(k));
    }

    // P(X <= k).
    template <typename K>
    double cumulative(const K& k) const {
        validate_non_negative_integer(k);
        validate_less_equal(k, n_);
        return sum_range(0, detail::as_count(k));
    }

    // P(k1 <= X <= k2).
    template <typename K1, typename K2>
    double cumulative_range(const K1& k1, const K2& k2) const {
        validate_non_negative_integer(k1);
        validate_non_negative_integer(k2);
        validate_less_equal(k1, n_);
        validate_less_equal(k2, n_);
        validate_less_equal(k1, k2);
        return sum_range(detail::as_count(k1), detail::as_count(k2));
    }

    // "Binomial experiment: n = 5, p = 0.50, q = 0.50"
    std::string to_string(const ReportConfig& cfg = {}) const;

    // One "P(X=k) = ..." line per outcome, from the cached table.
    void print_distribution(std::ostream& os, const ReportConfig& cfg = {}) const;

    // Expected value, variance and skewness, one per line.
    void print_stats(std::ostream& os, const ReportConfig& cfg = {}) const;

private:
    template <typename N>
    static std::uint64_t checked_trials(const N& num_trials) {
        validate_non_negative_integer(num_trials);
        return detail::as_count(num_trials);
    }

    static double checked_probability(double p);

    // Unchecked, k <= n_. Throws std::overflow_error if C(n, k) exceeds double range.
    double pmf(std::uint64_t k) const;
    double sum_range(std::uint64_t lo, std::uint64_t hi) const;
    Distribution build_distribution() const;

    const std::uint64_t n_;
    const double p_;
    const double q_;
    const Distribution pmf_;
};

std::ostream& operator<<(std::ostream& os, const Binomial& b);

} // namespace binom::dist
