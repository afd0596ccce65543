#include "optimisers/operators/CauchyMutation.hpp"
#include "exceptions/Exceptions.hpp"

namespace ionbench {

CauchyMutation::CauchyMutation(double prob, double scale)
    : prob_(prob), scale_(scale)
{
    if (prob_ < 0.0 || prob_ > 1.0) {
        THROW_INVALID_PARAM("CauchyMutation::CauchyMutation", "Probability must lie in [0, 1].");
    }
    if (!(scale_ > 0.0)) {
        THROW_INVALID_PARAM("CauchyMutation::CauchyMutation", "Scale must be positive.");
    }
}

Eigen::VectorXd CauchyMutation::mutate(const Eigen::VectorXd& x,
                                       const Eigen::VectorXd& lower,
                                       const Eigen::VectorXd& upper,
                                       std::mt19937& rng) const {
    if (lower.size() != x.size() || upper.size() != x.size()) {
        THROW_INVALID_PARAM("CauchyMutation::mutate", "Vector and bounds must have the same length.");
    }
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    Eigen::VectorXd y = x;
    if (unif(rng) >= prob_) {
        return y.cwiseMax(lower).cwiseMin(upper);
    }

    Eigen::VectorXd direction(x.size());
    for (Eigen::Index i = 0; i < direction.size(); ++i) {
        direction[i] = unif(rng);
    }
    const double norm = direction.norm();
    if (norm > 0.0) {
        direction /= norm;
    }
    std::cauchy_distribution<double> cauchy(0.0, scale_);
    y += cauchy(rng) * direction;
    return y.cwiseMax(lower).cwiseMin(upper);
}

} // namespace ionbench
