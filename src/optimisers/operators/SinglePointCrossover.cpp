#include "optimisers/operators/SinglePointCrossover.hpp"
#include "exceptions/Exceptions.hpp"

namespace ionbench {

SinglePointCrossover::SinglePointCrossover(double prob)
    : prob_(prob)
{
    if (prob_ < 0.0 || prob_ > 1.0) {
        THROW_INVALID_PARAM("SinglePointCrossover::SinglePointCrossover", "Probability must lie in [0, 1].");
    }
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> SinglePointCrossover::cross(const Eigen::VectorXd& parent1,
                                                                        const Eigen::VectorXd& parent2,
                                                                        const Eigen::VectorXd& lower,
                                                                        const Eigen::VectorXd& upper,
                                                                        std::mt19937& rng) const {
    const Eigen::Index n = parent1.size();
    if (parent2.size() != n || lower.size() != n || upper.size() != n) {
        THROW_INVALID_PARAM("SinglePointCrossover::cross", "Parents and bounds must have the same length.");
    }

    Eigen::VectorXd child1 = parent1;
    Eigen::VectorXd child2 = parent2;
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    if (n > 1 && unif(rng) <= prob_) {
        // Cut strictly inside the vector so both children mix both parents.
        std::uniform_int_distribution<Eigen::Index> cutDist(1, n - 1);
        const Eigen::Index cut = cutDist(rng);
        child1.tail(n - cut) = parent2.tail(n - cut);
        child2.tail(n - cut) = parent1.tail(n - cut);
    }
    return {child1.cwiseMax(lower).cwiseMin(upper), child2.cwiseMax(lower).cwiseMin(upper)};
}

} // namespace ionbench
