#ifndef POPULATION_HPP
#define POPULATION_HPP

#include <Eigen/Dense>
#include <optional>
#include <utility>
#include <vector>

namespace ionbench {

/**
 * @brief One member of a population: an input-space vector and its cost once known.
 *
 * Value type; copies are independent.
 */
struct Individual {
    Eigen::VectorXd x;
    std::optional<double> cost;

    Individual() = default;
    explicit Individual(Eigen::VectorXd position, std::optional<double> knownCost = std::nullopt)
        : x(std::move(position)), cost(knownCost) {}

    bool hasCost() const { return cost.has_value(); }
};

using Population = std::vector<Individual>;

} // namespace ionbench

#endif // POPULATION_HPP
