#ifndef GAUSSIAN_MUTATION_HPP
#define GAUSSIAN_MUTATION_HPP

#include "optimisers/interfaces/IMutationOperator.hpp"

namespace ionbench {

/**
 * @brief Per-variable normal perturbation with standard deviation scale * sqrt(|x|).
 */
class GaussianMutation : public IMutationOperator {
public:
    /**
     * @param rate Probability that each variable is perturbed.
     * @param scale Multiplier of sqrt(|x|) giving the standard deviation.
     * @throws InvalidParameterException If rate lies outside [0, 1] or scale < 0.
     */
    explicit GaussianMutation(double rate = 0.01, double scale = 0.05);

    Eigen::VectorXd mutate(const Eigen::VectorXd& x,
                           const Eigen::VectorXd& lower,
                           const Eigen::VectorXd& upper,
                           std::mt19937& rng) const override;

private:
    double rate_;
    double scale_;
};

} // namespace ionbench

#endif // GAUSSIAN_MUTATION_HPP
