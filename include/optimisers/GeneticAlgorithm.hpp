#ifndef GENETIC_ALGORITHM_HPP
#define GENETIC_ALGORITHM_HPP

#include "optimisers/interfaces/IOptimisationAlgorithm.hpp"
#include "optimisers/interfaces/ICrossoverOperator.hpp"
#include "optimisers/interfaces/IMutationOperator.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ionbench {

/**
 * @brief Generational genetic algorithm with elitism.
 *
 * Each generation saves the elites, applies binary tournament selection, pairwise
 * crossover and mutation, evaluates the new individuals and reinserts the elites in
 * place of the worst ones. The run stops after the configured number of generations
 * or as soon as the benchmarker reports convergence.
 *
 * Crossover and mutation default to SBX and polynomial mutation built from the
 * configured settings; either can be replaced before optimise() is called.
 */
class GeneticAlgorithm : public IOptimisationAlgorithm {
public:
    GeneticAlgorithm() = default;

    /**
     * @brief Configure hyperparameters.
     *
     * @param settings Recognised keys: generations, population_size, elite_fraction,
     *                 eta_cross, crossover_prob, crossover_prob_var, eta_mut,
     *                 mutation_prob_var, report_interval.
     */
    void configure(const std::map<std::string, double>& settings) override;

    OptimisationResult optimise(Benchmarker& benchmarker,
                                const std::optional<Eigen::VectorXd>& initialParameters) override;

    void setCrossoverOperator(std::shared_ptr<ICrossoverOperator> op) { crossover_ = std::move(op); }
    void setMutationOperator(std::shared_ptr<IMutationOperator> op) { mutation_ = std::move(op); }

    int generations() const { return generations_; }
    int populationSize() const { return population_size_; }
    /** @brief max(1, round(population_size * elite_fraction)), at most the population size. */
    int eliteCount() const;

private:
    int    generations_ = 50;            ///< Maximum number of generations
    int    population_size_ = 50;        ///< Individuals per generation
    double elite_fraction_ = 0.05;       ///< Share of the population kept unchanged
    double eta_cross_ = 10.0;            ///< SBX distribution index
    double crossover_prob_ = 0.9;        ///< Probability a pair is recombined
    double crossover_prob_var_ = 0.5;    ///< Probability each variable is recombined
    double eta_mut_ = 20.0;              ///< Polynomial mutation distribution index
    double mutation_prob_var_ = 0.1;     ///< Probability each variable is mutated
    int    report_interval_ = 10;        ///< Generations between progress logs

    std::shared_ptr<ICrossoverOperator> crossover_;
    std::shared_ptr<IMutationOperator> mutation_;
};

} // namespace ionbench

#endif // GENETIC_ALGORITHM_HPP
