#include "libbinom/math/combinatorics.hpp"
#include "libbinom/models/binomial.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

void walkthrough(const binom::dist::Binomial& b) {
    std::cout << b << "\n";
    b.print_distribution(std::cout);
    b.print_stats(std::cout);
    std::cout << "============================================\n";
}

} // namespace

int main(){
    char own;
    long long n;
    double p;

    const binom::dist::Binomial b1(5, 0.5);
    walkthrough(b1);

    std::cout << "Expected value is " << b1.expected_value() << "\n";
    std::cout << "Variance is " << b1.variance() << "\n";
    std::cout << "Skewness is " << b1.skewness() << "\n";
    std::cout << "Probability of exactly 4 successes is " << b1.probability_k(4) << "\n";
    std::cout << "Cumulative probability up to 4 successes is " << b1.cumulative(4) << "\n";
    std::cout << "Cumulative probability from 2 to 3 successes is " << b1.cumulative_range(2, 3) << "\n";
    std::cout << "============================================\n";

    const binom::dist::Binomial b2(6, 0.25);
    walkthrough(b2);
    // the table and probability_k agree
    std::cout << "Probability of exactly 2 successes is " << b2.distribution().at(2) << "\n";
    std::cout << "Probability of exactly 2 successes is " << b2.probability_k(2) << "\n";
    std::cout << "C(52, 5) = " << binom::comb::combinations(52, 5) << "\n";
    std::cout << "============================================\n";

    while (true) {
        std::cout << "Input your own experiment? y/n ";
        if (std::cin >> own && (own == 'y' || own == 'n')) break;
        if (std::cin.eof()) return 0;
        std::cout << "Please answer y or n.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    if (own == 'n') return 0;

    while (true) {
        std::cout << "Number of trials n: ";
        if (std::cin >> n && n >= 0) break;
        if (std::cin.eof()) return 1;
        std::cout << "Please input a non-negative integer.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    while (true) {
        std::cout << "Probability of success p: ";
        if (std::cin >> p && p >= 0.0 && p <= 1.0) break;
        if (std::cin.eof()) return 1;
        std::cout << "Please input a probability between 0 and 1.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    try {
        walkthrough(binom::dist::Binomial(n, p));
    } catch (const std::overflow_error& e) {
        std::cerr << "Too many trials for double precision: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
