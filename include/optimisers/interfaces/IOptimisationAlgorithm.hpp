#ifndef I_OPTIMISATION_ALGORITHM_HPP
#define I_OPTIMISATION_ALGORITHM_HPP

#include <Eigen/Dense>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace ionbench {

class Benchmarker;

/**
 * @brief Structure to hold the results of an optimisation run.
 */
struct OptimisationResult {
    Eigen::VectorXd bestParameters;  ///< Input space.
    double bestCost = std::numeric_limits<double>::infinity();
    int iterations = 0;
    bool converged = false;
};

/**
 * @brief Interface for optimisers run against a Benchmarker.
 */
class IOptimisationAlgorithm {
public:
    virtual ~IOptimisationAlgorithm() = default;

    /**
     * @brief Run the optimisation.
     *
     * @param benchmarker Problem to optimise. Its random generator drives the run.
     * @param initialParameters Optional starting point in input space.
     * @return OptimisationResult Best parameters found and bookkeeping.
     */
    virtual OptimisationResult optimise(Benchmarker& benchmarker,
                                        const std::optional<Eigen::VectorXd>& initialParameters) = 0;

    /**
     * @brief Configure algorithm-specific settings.
     * @param settings Map of setting names to values (e.g., "generations", "population_size").
     */
    virtual void configure(const std::map<std::string, double>& settings) = 0;
};

} // namespace ionbench

#endif // I_OPTIMISATION_ALGORITHM_HPP
