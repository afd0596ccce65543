#ifndef BENCHMARKER_CONFIG_HPP
#define BENCHMARKER_CONFIG_HPP

#include "benchmarker/BoundsChecker.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace ionbench {

/**
 * @brief How Benchmarker::sample draws candidates in original space.
 */
enum class SamplingMode {
    PerturbDefault,          ///< default * U(0.5, 1.5) per parameter.
    UniformWithinBounds,     ///< U(lb, ub) per parameter, falling back to PerturbDefault on unbounded axes.
    LogUniformAroundDefault  ///< default * 10^U(-w, w), or default + U(-60w, 60w) for additive parameters.
};

/**
 * @brief Everything that distinguishes one benchmark problem from another.
 *
 * Problems are built by filling in this struct and handing it to a Benchmarker
 * together with a simulator.
 */
struct BenchmarkerConfig {
    std::string name = "benchmarker";

    /** @brief Default parameters in original space. Also the scale factors. */
    Eigen::VectorXd defaultParams;
    /** @brief Parameters that generated the data. Empty means the defaults. */
    Eigen::VectorXd trueParams;

    /** @brief Reference trace, one value per entry of times. */
    Eigen::VectorXd data;
    /** @brief Time grid passed to the simulator. */
    Eigen::VectorXd times;

    bool useScaleFactors = false;
    /** @brief Per-parameter log flags. Empty means none. */
    std::vector<bool> logTransformParams;

    /** @brief Absolute bounds in original space. Empty vectors mean unbounded. */
    Eigen::VectorXd lowerBounds;
    Eigen::VectorXd upperBounds;

    std::optional<RateBounds> rateBounds;

    /** @brief A search cost below this value counts as converged. */
    double costThreshold = 0.01;

    SamplingMode samplingMode = SamplingMode::PerturbDefault;
    /** @brief Parameters that vary additively under LogUniformAroundDefault. Empty means none. */
    std::vector<bool> additiveParams;
    /** @brief Width w of the parameter space for LogUniformAroundDefault. */
    double parameterSpaceWidth = 1.0;

    /** @brief Relative finite-difference step used by Benchmarker::grad. */
    double gradStep = 1e-5;
};

} // namespace ionbench

#endif // BENCHMARKER_CONFIG_HPP
