#ifndef SINGLE_POINT_CROSSOVER_HPP
#define SINGLE_POINT_CROSSOVER_HPP

#include "optimisers/interfaces/ICrossoverOperator.hpp"

namespace ionbench {

/**
 * @brief Swaps the tails of two parents after a random cut point.
 */
class SinglePointCrossover : public ICrossoverOperator {
public:
    /**
     * @param prob Probability that a pair is recombined.
     * @throws InvalidParameterException If prob lies outside [0, 1].
     */
    explicit SinglePointCrossover(double prob = 0.5);

    std::pair<Eigen::VectorXd, Eigen::VectorXd> cross(const Eigen::VectorXd& parent1,
                                                      const Eigen::VectorXd& parent2,
                                                      const Eigen::VectorXd& lower,
                                                      const Eigen::VectorXd& upper,
                                                      std::mt19937& rng) const override;

private:
    double prob_;
};

} // namespace ionbench

#endif // SINGLE_POINT_CROSSOVER_HPP
