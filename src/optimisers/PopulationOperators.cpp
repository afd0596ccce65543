#include "optimisers/PopulationOperators.hpp"
#include "benchmarker/Benchmarker.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace ionbench {

void PopulationOperators::requireCosts(const Population& population, const char* functionName) {
    for (std::size_t i = 0; i < population.size(); ++i) {
        if (!population[i].hasCost()) {
            THROW_INVALID_PARAM(functionName, "Individual " + std::to_string(i) + " has not been evaluated.");
        }
    }
}

Population PopulationOperators::initialize(Benchmarker& benchmarker,
                                           const std::optional<Eigen::VectorXd>& x0,
                                           int size) {
    if (size < 1) {
        THROW_INVALID_PARAM("PopulationOperators::initialize", "Population size must be at least 1.");
    }
    Population population;
    population.reserve(size);

    if (!x0) {
        for (int k = 0; k < size; ++k) {
            population.emplace_back(benchmarker.sample());
        }
        return population;
    }

    if (x0->size() != benchmarker.nParameters()) {
        THROW_INVALID_PARAM("PopulationOperators::initialize",
            "Initial point has length " + std::to_string(x0->size()) +
            ", expected " + std::to_string(benchmarker.nParameters()));
    }
    const Eigen::VectorXd centre = benchmarker.inputToOriginal(*x0);
    std::uniform_real_distribution<double> factor(0.5, 1.5);
    for (int k = 0; k < size; ++k) {
        Eigen::VectorXd p = centre;
        for (Eigen::Index i = 0; i < p.size(); ++i) {
            p[i] *= factor(benchmarker.rng());
        }
        population.emplace_back(benchmarker.originalToInput(benchmarker.bounds().clamp(p)));
    }
    return population;
}

void PopulationOperators::evaluatePopulation(Population& population, IObjectiveFunction& objective) {
    for (auto& individual : population) {
        if (!individual.hasCost()) {
            individual.cost = objective.calculate(individual.x);
        }
    }
}

Population PopulationOperators::getElites(const Population& population, int k) {
    if (k < 0) {
        THROW_INVALID_PARAM("PopulationOperators::getElites", "Number of elites must be non-negative.");
    }
    requireCosts(population, "PopulationOperators::getElites");

    std::vector<std::size_t> order(population.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return *population[a].cost < *population[b].cost;
    });

    const std::size_t count = std::min(static_cast<std::size_t>(k), population.size());
    Population elites;
    elites.reserve(count);
    for (std::size_t j = 0; j < count; ++j) {
        elites.push_back(population[order[j]]);
    }
    return elites;
}

Population PopulationOperators::tournamentSelection(const Population& population, std::mt19937& rng) {
    requireCosts(population, "PopulationOperators::tournamentSelection");
    const std::size_t n = population.size();
    Population selected;
    if (n == 0) {
        return selected;
    }
    selected.reserve(n);

    auto winner = [&](std::size_t a, std::size_t b) -> const Individual& {
        return *population[b].cost < *population[a].cost ? population[b] : population[a];
    };

    std::vector<std::size_t> firstPerm;
    for (int pass = 0; pass < 2; ++pass) {
        std::vector<std::size_t> perm(n);
        std::iota(perm.begin(), perm.end(), 0);
        std::shuffle(perm.begin(), perm.end(), rng);
        for (std::size_t j = 0; j + 1 < n; j += 2) {
            selected.push_back(winner(perm[j], perm[j + 1]));
        }
        if (pass == 0) {
            firstPerm = perm;
        }
    }

    if (n % 2 == 1) {
        std::uniform_int_distribution<std::size_t> pick(0, n - 1);
        selected.push_back(winner(firstPerm.back(), pick(rng)));
    }
    return selected;
}

Population PopulationOperators::crossover(const Population& population,
                                          const ICrossoverOperator& op,
                                          const Eigen::VectorXd& lower,
                                          const Eigen::VectorXd& upper,
                                          std::mt19937& rng) {
    Population offspring;
    offspring.reserve(population.size());
    std::size_t j = 0;
    for (; j + 1 < population.size(); j += 2) {
        auto children = op.cross(population[j].x, population[j + 1].x, lower, upper, rng);
        offspring.emplace_back(std::move(children.first));
        offspring.emplace_back(std::move(children.second));
    }
    if (j < population.size()) {
        offspring.push_back(population[j]);
    }
    return offspring;
}

Population PopulationOperators::mutate(const Population& population,
                                       const IMutationOperator& op,
                                       const Eigen::VectorXd& lower,
                                       const Eigen::VectorXd& upper,
                                       std::mt19937& rng) {
    Population mutated;
    mutated.reserve(population.size());
    for (const auto& individual : population) {
        Eigen::VectorXd y = op.mutate(individual.x, lower, upper, rng);
        if (y == individual.x) {
            mutated.push_back(individual);
        } else {
            mutated.emplace_back(std::move(y));
        }
    }
    return mutated;
}

void PopulationOperators::setElites(Population& population, const Population& elites) {
    if (elites.size() > population.size()) {
        THROW_INVALID_PARAM("PopulationOperators::setElites",
            "Cannot insert " + std::to_string(elites.size()) + " elites into a population of " +
            std::to_string(population.size()));
    }
    requireCosts(population, "PopulationOperators::setElites");
    requireCosts(elites, "PopulationOperators::setElites");

    std::vector<std::size_t> order(population.size());
    std::iota(order.begin(), order.end(), 0);
    // Worst first; on equal cost the later index goes first.
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        const double ca = *population[a].cost;
        const double cb = *population[b].cost;
        return ca > cb || (ca == cb && a > b);
    });

    for (std::size_t j = 0; j < elites.size(); ++j) {
        population[order[j]] = elites[j];
    }
}

const Individual& PopulationOperators::best(const Population& population) {
    if (population.empty()) {
        THROW_INVALID_PARAM("PopulationOperators::best", "Population is empty.");
    }
    requireCosts(population, "PopulationOperators::best");
    auto it = std::min_element(population.begin(), population.end(),
        [](const Individual& a, const Individual& b) { return *a.cost < *b.cost; });
    return *it;
}

} // namespace ionbench
