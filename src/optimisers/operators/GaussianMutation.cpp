#include "optimisers/operators/GaussianMutation.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace ionbench {

GaussianMutation::GaussianMutation(double rate, double scale)
    : rate_(rate), scale_(scale)
{
    if (rate_ < 0.0 || rate_ > 1.0) {
        THROW_INVALID_PARAM("GaussianMutation::GaussianMutation", "Rate must lie in [0, 1].");
    }
    if (scale_ < 0.0) {
        THROW_INVALID_PARAM("GaussianMutation::GaussianMutation", "Scale must be non-negative.");
    }
}

Eigen::VectorXd GaussianMutation::mutate(const Eigen::VectorXd& x,
                                         const Eigen::VectorXd& lower,
                                         const Eigen::VectorXd& upper,
                                         std::mt19937& rng) const {
    if (lower.size() != x.size() || upper.size() != x.size()) {
        THROW_INVALID_PARAM("GaussianMutation::mutate", "Vector and bounds must have the same length.");
    }
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::normal_distribution<double> normal(0.0, 1.0);

    Eigen::VectorXd y = x;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        if (unif(rng) < rate_) {
            y[i] += scale_ * std::sqrt(std::abs(y[i])) * normal(rng);
        }
    }
    return y.cwiseMax(lower).cwiseMin(upper);
}

} // namespace ionbench
