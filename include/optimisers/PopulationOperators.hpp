#ifndef POPULATION_OPERATORS_HPP
#define POPULATION_OPERATORS_HPP

#include "optimisers/Population.hpp"
#include "optimisers/interfaces/ICrossoverOperator.hpp"
#include "optimisers/interfaces/IMutationOperator.hpp"
#include "benchmarker/interfaces/IObjectiveFunction.hpp"
#include <Eigen/Dense>
#include <optional>
#include <random>

namespace ionbench {

class Benchmarker;

/**
 * @brief Generation-level building blocks shared by the population-based optimisers.
 *
 * Every operator returns or modifies populations of independent Individual values.
 * Randomness comes only from the generator passed in, normally Benchmarker::rng().
 */
class PopulationOperators {
public:
    /**
     * @brief Builds an unevaluated population.
     *
     * Without @p x0 every individual is Benchmarker::sample(). With @p x0 (input space)
     * each individual multiplies x0 by U(0.5, 1.5) per axis in original space and is
     * clipped to the bounds.
     *
     * @throws InvalidParameterException If size < 1 or x0 has the wrong length.
     */
    static Population initialize(Benchmarker& benchmarker,
                                 const std::optional<Eigen::VectorXd>& x0,
                                 int size);

    /**
     * @brief Computes the cost of every individual that does not have one yet.
     */
    static void evaluatePopulation(Population& population, IObjectiveFunction& objective);

    /**
     * @brief Copies of the k lowest-cost individuals, ties in population order.
     *
     * k is clipped to the population size.
     *
     * @throws InvalidParameterException If k < 0 or an individual has no cost.
     */
    static Population getElites(const Population& population, int k);

    /**
     * @brief Binary tournament over two independent permutations.
     *
     * Adjacent pairs in each permutation compete and the cheaper one (the first on a tie)
     * is copied. With an odd population the unpaired member of the first permutation
     * competes against a random member, so the result has the input size.
     *
     * @throws InvalidParameterException If an individual has no cost.
     */
    static Population tournamentSelection(const Population& population, std::mt19937& rng);

    /**
     * @brief Recombines consecutive pairs with @p op. Offspring have no cost; an odd
     *        trailing individual is copied unchanged.
     */
    static Population crossover(const Population& population,
                                const ICrossoverOperator& op,
                                const Eigen::VectorXd& lower,
                                const Eigen::VectorXd& upper,
                                std::mt19937& rng);

    /**
     * @brief Applies @p op to every individual. Individuals that moved lose their cost.
     */
    static Population mutate(const Population& population,
                             const IMutationOperator& op,
                             const Eigen::VectorXd& lower,
                             const Eigen::VectorXd& upper,
                             std::mt19937& rng);

    /**
     * @brief Replaces the elites.size() highest-cost individuals with the elites.
     *
     * Ties between equally bad individuals replace the later one first. The best cost
     * afterwards is never above the best elite cost.
     *
     * @throws InvalidParameterException If there are more elites than individuals or a
     *         cost is missing.
     */
    static void setElites(Population& population, const Population& elites);

    /**
     * @brief The lowest-cost individual, first on a tie.
     * @throws InvalidParameterException If the population is empty or a cost is missing.
     */
    static const Individual& best(const Population& population);

private:
    static void requireCosts(const Population& population, const char* functionName);
};

} // namespace ionbench

#endif // POPULATION_OPERATORS_HPP
