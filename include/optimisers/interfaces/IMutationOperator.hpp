#ifndef I_MUTATION_OPERATOR_HPP
#define I_MUTATION_OPERATOR_HPP

#include <Eigen/Dense>
#include <random>

namespace ionbench {

/**
 * @brief Random perturbation of a single input-space vector.
 */
class IMutationOperator {
public:
    virtual ~IMutationOperator() = default;

    /**
     * @brief Returns a mutated copy of @p x, clipped to [lower, upper].
     */
    virtual Eigen::VectorXd mutate(const Eigen::VectorXd& x,
                                   const Eigen::VectorXd& lower,
                                   const Eigen::VectorXd& upper,
                                   std::mt19937& rng) const = 0;
};

} // namespace ionbench

#endif // I_MUTATION_OPERATOR_HPP
