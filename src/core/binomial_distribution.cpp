#include "core/binomial_distribution.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

BinomialDistribution::BinomialDistribution(const int n, const double p) : n(n), p(p) {
    if (n < 0) {
        throw std::invalid_argument("Binomial trials must be non-negative, got " +
                                    std::to_string(n));
    }
    log_fact.resize(n + 1);
    log_fact[0] = 0.0;
    for (int i = 1; i <= n; i++) {
        log_fact[i] = log_fact[i - 1] + std::log(i);
    }
}

double BinomialDistribution::log_binomial_coefficient(const int k) const {
    return log_fact[n] - log_fact[k] - log_fact[n - k];
}

double BinomialDistribution::pmf(const int k) const {
    if (k < 0 || k > n) {
        return 0.0;
    }
    if (p > 0.0 && p < 1.0) {
        return std::exp(log_binomial_coefficient(k) + k * std::log(p) +
                        (n - k) * std::log1p(-p));
    }
    if (p == 0.0) {
        return k == 0 ? 1.0 : 0.0;
    }
    if (p == 1.0) {
        return k == n ? 1.0 : 0.0;
    }
    // Outside [0, 1] log(p) is undefined; may overflow for large n.
    return std::exp(log_binomial_coefficient(k)) * std::pow(p, k) * std::pow(1.0 - p, n - k);
}

double binomial_pmf(const int k, const int n, const double p) {
    return BinomialDistribution(n, p).pmf(k);
}
