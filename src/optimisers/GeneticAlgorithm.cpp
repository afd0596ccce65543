#include "optimisers/GeneticAlgorithm.hpp"
#include "optimisers/PopulationOperators.hpp"
#include "optimisers/operators/PolynomialMutation.hpp"
#include "optimisers/operators/SBXCrossover.hpp"
#include "benchmarker/Benchmarker.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace ionbench {

void GeneticAlgorithm::configure(const std::map<std::string, double>& settings) {
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };

    generations_        = static_cast<int>(get("generations", generations_));
    population_size_    = static_cast<int>(get("population_size", population_size_));
    elite_fraction_     = get("elite_fraction", elite_fraction_);
    eta_cross_          = get("eta_cross", eta_cross_);
    crossover_prob_     = get("crossover_prob", crossover_prob_);
    crossover_prob_var_ = get("crossover_prob_var", crossover_prob_var_);
    eta_mut_            = get("eta_mut", eta_mut_);
    mutation_prob_var_  = get("mutation_prob_var", mutation_prob_var_);
    report_interval_    = static_cast<int>(get("report_interval", report_interval_));

    // Validate parameters
    generations_        = std::max(generations_, 0);
    population_size_    = std::max(population_size_, 2);
    elite_fraction_     = std::clamp(elite_fraction_, 0.0, 1.0);
    eta_cross_          = std::max(eta_cross_, 0.0);
    crossover_prob_     = std::clamp(crossover_prob_, 0.0, 1.0);
    crossover_prob_var_ = std::clamp(crossover_prob_var_, 0.0, 1.0);
    eta_mut_            = std::max(eta_mut_, 0.0);
    mutation_prob_var_  = std::clamp(mutation_prob_var_, 0.0, 1.0);
    report_interval_    = std::max(report_interval_, 1);

    Logger::getInstance().info("GeneticAlgorithm::configure",
        "Configured with generations=" + std::to_string(generations_) +
        ", population_size=" + std::to_string(population_size_) +
        ", elites=" + std::to_string(eliteCount()));
}

int GeneticAlgorithm::eliteCount() const {
    int k = static_cast<int>(std::lround(population_size_ * elite_fraction_));
    return std::min(std::max(k, 1), population_size_);
}

OptimisationResult GeneticAlgorithm::optimise(Benchmarker& benchmarker,
                                              const std::optional<Eigen::VectorXd>& initialParameters) {
    const std::string F_NAME = "GeneticAlgorithm::optimise";
    Logger& logger = Logger::getInstance();
    logger.info(F_NAME, "Starting on '" + benchmarker.name() + "' for " + std::to_string(generations_) +
                        " generations of " + std::to_string(population_size_) + " individuals");

    std::shared_ptr<ICrossoverOperator> crossover = crossover_;
    if (!crossover) {
        crossover = std::make_shared<SBXCrossover>(eta_cross_, crossover_prob_, crossover_prob_var_);
    }
    std::shared_ptr<IMutationOperator> mutation = mutation_;
    if (!mutation) {
        mutation = std::make_shared<PolynomialMutation>(eta_mut_, mutation_prob_var_);
    }

    const auto bounds = benchmarker.inputBounds();
    std::mt19937& rng = benchmarker.rng();

    Population pop = PopulationOperators::initialize(benchmarker, initialParameters, population_size_);
    PopulationOperators::evaluatePopulation(pop, benchmarker);

    OptimisationResult result;
    for (int gen = 1; gen <= generations_; ++gen) {
        Population elites = PopulationOperators::getElites(pop, eliteCount());

        pop = PopulationOperators::tournamentSelection(pop, rng);
        pop = PopulationOperators::crossover(pop, *crossover, bounds.first, bounds.second, rng);
        pop = PopulationOperators::mutate(pop, *mutation, bounds.first, bounds.second, rng);
        PopulationOperators::evaluatePopulation(pop, benchmarker);
        PopulationOperators::setElites(pop, elites);
        result.iterations = gen;

        if (gen % report_interval_ == 0 || gen == generations_) {
            logger.info(F_NAME, "Generation " + std::to_string(gen) + "/" + std::to_string(generations_) +
                                ", Best cost: " + std::to_string(*PopulationOperators::best(pop).cost) +
                                ", Solves: " + std::to_string(benchmarker.tracker().solveCount()));
        }

        if (benchmarker.isConverged()) {
            result.converged = true;
            logger.info(F_NAME, "Converged at generation " + std::to_string(gen));
            break;
        }
    }

    const Individual& best = PopulationOperators::best(pop);
    result.bestParameters = best.x;
    result.bestCost = *best.cost;
    benchmarker.evaluate(best.x);
    return result;
}

} // namespace ionbench
