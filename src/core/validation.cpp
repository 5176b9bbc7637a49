#include "libbinom/core/validation.hpp"

namespace binom::detail {

void fail_not_integer(const std::string& what) {
    throw TypeError(what + " must be an integer");
}

void fail_negative(const std::string& what) {
    throw std::domain_error(what + " must be non-negative");
}

void fail_greater(const std::string& x, const std::string& y) {
    std::ostringstream oss;
    oss << x << " must be less than or equal to " << y;
    throw std::domain_error(oss.str());
}

std::uint64_t checked_count(const mpz_class& x) {
    if (sgn(x) < 0 || !x.fits_ulong_p()) {
        throw std::overflow_error(x.get_str() + " is too large for a trial count");
    }
    return static_cast<std::uint64_t>(x.get_ui());
}

} // namespace binom::detail
