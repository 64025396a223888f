#pragma once

#include <vector>

// Binomial(n, p) mass from a log-factorial table, evaluated in log space for p in (0, 1).
class BinomialDistribution {
   public:
    BinomialDistribution(const int n, const double p);

    double pmf(const int k) const;

    double log_binomial_coefficient(const int k) const;

    int trials() const { return n; }
    double probability() const { return p; }

   private:
    int n;
    double p;
    std::vector<double> log_fact;
};

double binomial_pmf(const int k, const int n, const double p);
