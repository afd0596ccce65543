#ifndef POLYNOMIAL_MUTATION_HPP
#define POLYNOMIAL_MUTATION_HPP

#include "optimisers/interfaces/IMutationOperator.hpp"

namespace ionbench {

/**
 * @brief Deb's bounded polynomial mutation.
 *
 * Each variable is mutated with probability @c probVar. The perturbation is scaled by
 * ub - lb; on an axis with an infinite bound it is scaled by max(|x|, 1) instead.
 */
class PolynomialMutation : public IMutationOperator {
public:
    /**
     * @throws InvalidParameterException If eta < 0 or probVar lies outside [0, 1].
     */
    explicit PolynomialMutation(double eta = 20.0, double probVar = 0.1);

    Eigen::VectorXd mutate(const Eigen::VectorXd& x,
                           const Eigen::VectorXd& lower,
                           const Eigen::VectorXd& upper,
                           std::mt19937& rng) const override;

private:
    double eta_;
    double probVar_;
};

} // namespace ionbench

#endif // POLYNOMIAL_MUTATION_HPP
