#include "libbinom/models/binomial.hpp"
#include "libbinom/math/combinatorics.hpp"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace binom::dist {

namespace {
    // Largest binary exponent representable by a finite double.
    constexpr std::size_t MAX_DOUBLE_BITS = std::numeric_limits<double>::max_exponent;

    inline double exact_to_double(const mpz_class& z) {
        if (mpz_sizeinbase(z.get_mpz_t(), 2) > MAX_DOUBLE_BITS) {
            std::ostringstream oss;
            oss << "integer with " << mpz_sizeinbase(z.get_mpz_t(), 10)
                << " digits is too large to convert to double";
            throw std::overflow_error(oss.str());
        }
        return z.get_d();
    }

    // C(n, n/2) >= 2^n / (n + 1), so past this bound some table entry cannot
    // be a finite double. Rejects huge n before any factorial is computed.
    inline void check_table_fits(std::uint64_t n) {
        const double nd = static_cast<double>(n);
        if (nd - std::log2(nd + 1.0) > static_cast<double>(MAX_DOUBLE_BITS)) {
            std::ostringstream oss;
            oss << "n = " << n << " trials: binomial coefficients exceed double range";
            throw std::overflow_error(oss.str());
        }
    }
} // namespace

double Binomial::checked_probability(double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::domain_error("prob_success must be between 0 and 1, inclusive");
    }
    return p;
}

double Binomial::pmf(std::uint64_t k) const {
    const double c = exact_to_double(comb::combinations_count(n_, k));
    return c * std::pow(p_, static_cast<double>(k))
             * std::pow(q_, static_cast<double>(n_ - k));
}

double Binomial::sum_range(std::uint64_t lo, std::uint64_t hi) const {
    double total = 0.0;
    for (std::uint64_t k = lo; k <= hi; ++k) {
        total += pmf(k);
    }
    return total;
}

Distribution Binomial::build_distribution() const {
    check_table_fits(n_);
    Distribution out;
    for (std::uint64_t k = 0; k <= n_; ++k) {
        out.emplace(k, pmf(k));
    }
    return out;
}

double Binomial::expected_value() const {
    return static_cast<double>(n_) * p_;
}

double Binomial::variance() const {
    return static_cast<double>(n_) * p_ * q_;
}

double Binomial::skewness() const {
    return (q_ - p_) / std::sqrt(variance());
}

Distribution Binomial::distribution() const {
    return build_distribution();
}

std::string Binomial::to_string(const ReportConfig& cfg) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(cfg.param_precision)
        << "Binomial experiment: n = " << n_
        << ", p = " << p_
        << ", q = " << q_;
    return oss.str();
}

void Binomial::print_distribution(std::ostream& os, const ReportConfig& cfg) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(cfg.value_precision);
    for (const auto& [k, prob] : pmf_) {
        oss << "P(X=" << k << ") = " << prob << '\n';
    }
    os << oss.str();
}

void Binomial::print_stats(std::ostream& os, const ReportConfig& cfg) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(cfg.value_precision)
        << "Expected Value (μ): " << expected_value() << '\n'
        << "Variance (σ²): " << variance() << '\n'
        << "Skewness (γ₁): " << skewness() << '\n';
    os << oss.str();
}

std::ostream& operator<<(std::ostream& os, const Binomial& b) {
    return os << b.to_string();
}

} // namespace binom::dist
