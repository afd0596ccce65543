#ifndef I_CROSSOVER_OPERATOR_HPP
#define I_CROSSOVER_OPERATOR_HPP

#include <Eigen/Dense>
#include <random>
#include <utility>

namespace ionbench {

/**
 * @brief Pairwise recombination of two input-space parents.
 */
class ICrossoverOperator {
public:
    virtual ~ICrossoverOperator() = default;

    /**
     * @brief Produces two offspring from two parents.
     *
     * @param parent1 First parent.
     * @param parent2 Second parent.
     * @param lower Lower bounds in input space (entries may be -inf).
     * @param upper Upper bounds in input space (entries may be +inf).
     * @param rng Generator driving every random choice.
     * @return The two offspring, each within [lower, upper].
     */
    virtual std::pair<Eigen::VectorXd, Eigen::VectorXd> cross(const Eigen::VectorXd& parent1,
                                                              const Eigen::VectorXd& parent2,
                                                              const Eigen::VectorXd& lower,
                                                              const Eigen::VectorXd& upper,
                                                              std::mt19937& rng) const = 0;
};

} // namespace ionbench

#endif // I_CROSSOVER_OPERATOR_HPP
