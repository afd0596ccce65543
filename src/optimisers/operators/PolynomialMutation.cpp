#include "optimisers/operators/PolynomialMutation.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace ionbench {

PolynomialMutation::PolynomialMutation(double eta, double probVar)
    : eta_(eta), probVar_(probVar)
{
    if (eta_ < 0.0) {
        THROW_INVALID_PARAM("PolynomialMutation::PolynomialMutation", "Distribution index must be non-negative.");
    }
    if (probVar_ < 0.0 || probVar_ > 1.0) {
        THROW_INVALID_PARAM("PolynomialMutation::PolynomialMutation", "Probability must lie in [0, 1].");
    }
}

Eigen::VectorXd PolynomialMutation::mutate(const Eigen::VectorXd& x,
                                           const Eigen::VectorXd& lower,
                                           const Eigen::VectorXd& upper,
                                           std::mt19937& rng) const {
    if (lower.size() != x.size() || upper.size() != x.size()) {
        THROW_INVALID_PARAM("PolynomialMutation::mutate", "Vector and bounds must have the same length.");
    }
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    const double mutPow = 1.0 / (eta_ + 1.0);

    Eigen::VectorXd y = x;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        if (unif(rng) > probVar_) {
            continue;
        }
        const bool finite = std::isfinite(lower[i]) && std::isfinite(upper[i]);
        const double span = finite ? upper[i] - lower[i] : std::max(std::abs(y[i]), 1.0);
        if (span <= 0.0) {
            continue;
        }
        // Relative distances to each bound; one leaves the distribution untruncated.
        const double delta1 = finite ? std::clamp((y[i] - lower[i]) / span, 0.0, 1.0) : 1.0;
        const double delta2 = finite ? std::clamp((upper[i] - y[i]) / span, 0.0, 1.0) : 1.0;

        const double u = unif(rng);
        double deltaq;
        if (u < 0.5) {
            const double xy = 1.0 - delta1;
            const double val = 2.0 * u + (1.0 - 2.0 * u) * std::pow(xy, eta_ + 1.0);
            deltaq = std::pow(val, mutPow) - 1.0;
        } else {
            const double xy = 1.0 - delta2;
            const double val = 2.0 * (1.0 - u) + 2.0 * (u - 0.5) * std::pow(xy, eta_ + 1.0);
            deltaq = 1.0 - std::pow(val, mutPow);
        }
        y[i] = std::clamp(y[i] + deltaq * span, lower[i], upper[i]);
    }
    return y;
}

} // namespace ionbench
