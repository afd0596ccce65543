#ifndef CAUCHY_MUTATION_HPP
#define CAUCHY_MUTATION_HPP

#include "optimisers/interfaces/IMutationOperator.hpp"

namespace ionbench {

/**
 * @brief Moves the whole vector along a random positive direction by a Cauchy-distributed
 *        distance.
 *
 * With probability @c prob, x += m * d where d is a unit vector with U(0, 1) components
 * and m ~ Cauchy(0, scale). The heavy tail occasionally produces long jumps.
 */
class CauchyMutation : public IMutationOperator {
public:
    /**
     * @throws InvalidParameterException If prob lies outside [0, 1] or scale <= 0.
     */
    explicit CauchyMutation(double prob = 0.9, double scale = 0.18);

    Eigen::VectorXd mutate(const Eigen::VectorXd& x,
                           const Eigen::VectorXd& lower,
                           const Eigen::VectorXd& upper,
                           std::mt19937& rng) const override;

private:
    double prob_;
    double scale_;
};

} // namespace ionbench

#endif // CAUCHY_MUTATION_HPP
