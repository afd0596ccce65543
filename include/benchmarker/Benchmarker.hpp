#ifndef BENCHMARKER_HPP
#define BENCHMARKER_HPP

#include "benchmarker/BenchmarkerConfig.hpp"
#include "benchmarker/BoundsChecker.hpp"
#include "benchmarker/CachedEvaluator.hpp"
#include "benchmarker/ParameterTransform.hpp"
#include "benchmarker/Tracker.hpp"
#include "benchmarker/caching/CostCache.hpp"
#include "benchmarker/interfaces/IObjectiveFunction.hpp"
#include "benchmarker/interfaces/ISimulator.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ionbench {

/**
 * @brief Space in which a caller supplies parameter vectors.
 */
enum class ParameterSpace {
    Original,
    Input
};

/**
 * @brief Final performance of one optimisation run, as reported by Benchmarker::evaluate.
 */
struct EvaluationReport {
    int solveCount = 0;
    double cost = 0.0;
    double paramRMSRE = 0.0;
    int identifiedCount = 0;
    int numParameters = 0;
    /** @brief History of the search, before the final evaluation was recorded. */
    TrackerSummary search;
};

/**
 * @brief Public face of a benchmark problem.
 *
 * A Benchmarker owns the transform, bounds, tracker, cache and random generator of one
 * run and hands cost calls to a CachedEvaluator built over them. Optimisers talk to it
 * in input space only.
 *
 * Not thread-safe. Parallel runs each need their own instance. Holds references into
 * its own members, so it can be neither copied nor moved.
 */
class Benchmarker : public IObjectiveFunction {
public:
    /**
     * @brief Builds a benchmarker from a problem configuration.
     *
     * @param config Problem description. Bounds and rate bounds in it are enabled.
     * @param simulator Model producing traces from original-space parameters.
     * @param seed Seed of the random generator used by sample() and the population operators.
     *
     * @throws ConfigurationException If the configuration is inconsistent.
     */
    Benchmarker(BenchmarkerConfig config, std::shared_ptr<ISimulator> simulator, unsigned int seed = 5489u);

    Benchmarker(const Benchmarker&) = delete;
    Benchmarker& operator=(const Benchmarker&) = delete;
    Benchmarker(Benchmarker&&) = delete;
    Benchmarker& operator=(Benchmarker&&) = delete;

    int nParameters() const { return transform_.size(); }
    int numParameters() const override { return nParameters(); }

    /** @brief Same as cost(), for code written against IObjectiveFunction. */
    double calculate(const Eigen::VectorXd& inputParameters) override { return cost(inputParameters); }

    /**
     * @brief RMSE cost of an input-space candidate. Never throws for infeasible
     *        candidates or simulator failures, both give +inf.
     */
    double cost(const Eigen::VectorXd& inputParameters);

    /**
     * @brief Forward finite-difference gradient in input space.
     *
     * Each axis is stepped forwards; if that point is infeasible the step is flipped
     * backwards, and if both are infeasible the step is halved and retried. When no
     * feasible step is found the axis uses the full forward step with bounds ignored.
     * An infeasible centre disables bounds for every axis.
     *
     * @param inputParameters Centre point.
     * @param centreCost Cost at the centre, if already known.
     * @param incrementSolveCounter Whether the simulations count as solves.
     */
    Eigen::VectorXd grad(const Eigen::VectorXd& inputParameters,
                         std::optional<double> centreCost = std::nullopt,
                         bool incrementSolveCounter = true);

    /** @brief One candidate in input space, drawn per the configured SamplingMode. */
    Eigen::VectorXd sample();
    /** @brief n independent candidates in input space. */
    std::vector<Eigen::VectorXd> sample(int n);

    /**
     * @brief True iff the most recent search cost is below the cost threshold.
     *
     * Only cost() and the centre evaluation of grad() count as search costs;
     * evaluate() never changes the outcome.
     */
    bool isConverged() const;

    /** @brief Clears the tracker, the cache and the convergence state. */
    void reset();

    /**
     * @brief Reports the final performance of a candidate without advancing the solve count.
     */
    EvaluationReport evaluate(const Eigen::VectorXd& inputParameters);

    Eigen::VectorXd signedError(const Eigen::VectorXd& inputParameters);
    Eigen::VectorXd squaredError(const Eigen::VectorXd& inputParameters);

    /**
     * @brief Sets and enables absolute bounds.
     *
     * @param space Space of the supplied vectors. Input-space bounds are mapped through
     *        the current transform before being stored in original space.
     */
    void addBounds(const Eigen::VectorXd& lowerBounds, const Eigen::VectorXd& upperBounds,
                   ParameterSpace space = ParameterSpace::Original);
    void clearBounds();
    void setBounded(bool bounded);
    void setRateBounds(RateBounds rateBounds);
    void setRateBounded(bool rateBounded);

    /**
     * @brief Log-transforms the selected parameters.
     * @param which Parameter indices. Empty means every parameter.
     * @throws OutOfRangeException If an index is out of range.
     *
     * Cached costs are keyed on input vectors, so the cache is cleared.
     */
    void logTransform(const std::vector<int>& which = {});
    /** @brief Toggles division by the default parameters. Clears the cache. */
    void setUseScaleFactors(bool useScaleFactors);

    Eigen::VectorXd originalToInput(const Eigen::VectorXd& originalParameters) const;
    Eigen::VectorXd inputToOriginal(const Eigen::VectorXd& inputParameters) const;

    /**
     * @brief Active bounds mapped to input space as (lower, upper). +-inf when unbounded.
     */
    std::pair<Eigen::VectorXd, Eigen::VectorXd> inputBounds() const;

    /**
     * @brief Clips an input-space vector to the bounds in original space and maps it back.
     */
    Eigen::VectorXd clampParameters(const Eigen::VectorXd& inputParameters) const;

    /** @brief Whether a candidate passes the parameter and rate bounds. No side effects. */
    bool isFeasible(const Eigen::VectorXd& inputParameters) const;

    const std::string& name() const { return config_.name; }
    const Eigen::VectorXd& defaultParams() const { return config_.defaultParams; }
    const Eigen::VectorXd& trueParams() const { return trueParams_; }
    const Eigen::VectorXd& data() const { return config_.data; }
    const Eigen::VectorXd& times() const { return config_.times; }
    double costThreshold() const { return config_.costThreshold; }
    void setCostThreshold(double threshold) { config_.costThreshold = threshold; }

    const Tracker& tracker() const { return tracker_; }
    const BoundsChecker& bounds() const { return bounds_; }
    const ParameterTransform& transform() const { return transform_; }
    const CostCache& cache() const { return cache_; }
    CachedEvaluator& evaluator() { return *evaluator_; }

    std::mt19937& rng() { return rng_; }
    void seed(unsigned int seed) { rng_.seed(seed); }

    /** @brief Maximum number of step halvings tried by grad() before ignoring bounds. */
    static constexpr int MAX_STEP_HALVINGS = 10;

private:
    BenchmarkerConfig config_;
    Eigen::VectorXd trueParams_;
    ParameterTransform transform_;
    BoundsChecker bounds_;
    Tracker tracker_;
    CostCache cache_;
    std::unique_ptr<CachedEvaluator> evaluator_;
    std::mt19937 rng_;
    std::optional<double> lastSearchCost_;

    void validateConfig() const;
    void clearCacheAfterTransformChange(const std::string& source);
    Eigen::VectorXd sampleOriginal();
};

} // namespace ionbench

#endif // BENCHMARKER_HPP
