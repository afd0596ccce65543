#ifndef CACHED_EVALUATOR_HPP
#define CACHED_EVALUATOR_HPP

#include "benchmarker/BoundsChecker.hpp"
#include "benchmarker/ParameterTransform.hpp"
#include "benchmarker/Tracker.hpp"
#include "benchmarker/interfaces/ICostCache.hpp"
#include "benchmarker/interfaces/IObjectiveFunction.hpp"
#include "benchmarker/interfaces/ISimulator.hpp"
#include <Eigen/Dense>
#include <memory>

namespace ionbench {

/**
 * @brief Per-call switches for CachedEvaluator::cost.
 */
struct EvaluationOptions {
    /** @brief Count a simulation towards the solve count and store its cost in the cache. */
    bool incrementSolveCounter = true;
    /** @brief Reject candidates outside the parameter or rate bounds. */
    bool checkBounds = true;
    /** @brief Consult the cache before simulating. */
    bool useCache = true;
};

/**
 * @brief Turns an input-space vector into a tracked, memoised RMSE cost.
 *
 * One call walks transform, bound check, cache lookup, simulation and tracker record
 * in that order. Infeasible candidates and simulator failures both come back as +inf;
 * only programming errors (wrong vector length) propagate as exceptions.
 *
 * The evaluator does not own its collaborators. The transform, bounds, tracker and
 * cache must outlive it.
 */
class CachedEvaluator : public IObjectiveFunction {
public:
    CachedEvaluator(std::shared_ptr<ISimulator> simulator,
                    const ParameterTransform& transform,
                    const BoundsChecker& bounds,
                    Tracker& tracker,
                    ICostCache& cache,
                    Eigen::VectorXd trueParams,
                    Eigen::VectorXd data,
                    Eigen::VectorXd times);

    /** @brief cost() with default options. */
    double calculate(const Eigen::VectorXd& inputParameters) override;

    int numParameters() const override { return transform_.size(); }

    /**
     * @brief Cost of one input-space candidate.
     *
     * @throws InvalidParameterException If the vector has the wrong length.
     */
    double cost(const Eigen::VectorXd& inputParameters, const EvaluationOptions& options);

    /**
     * @brief Simulated trace minus data for one candidate.
     *
     * Recorded and solve-counted like an uncached cost call. Infeasible candidates and
     * failed simulations give a vector of +inf.
     */
    Eigen::VectorXd signedError(const Eigen::VectorXd& inputParameters);

    /**
     * @brief Whether the candidate maps to a finite original-space vector inside the
     *        active bounds. Touches neither the tracker nor the cache.
     */
    bool isFeasible(const Eigen::VectorXd& inputParameters) const;

    /** @brief Root-mean-square of trace - data. */
    static double rmse(const Eigen::VectorXd& trace, const Eigen::VectorXd& data);

    const Eigen::VectorXd& trueParams() const { return trueParams_; }
    const Eigen::VectorXd& data() const { return data_; }
    const Eigen::VectorXd& times() const { return times_; }

private:
    std::shared_ptr<ISimulator> simulator_;
    const ParameterTransform& transform_;
    const BoundsChecker& bounds_;
    Tracker& tracker_;
    ICostCache& cache_;
    Eigen::VectorXd trueParams_;
    Eigen::VectorXd data_;
    Eigen::VectorXd times_;

    /** @brief Runs the simulator. Returns false and logs on any failure. */
    bool trySimulate(const Eigen::VectorXd& originalParameters, Eigen::VectorXd& trace);
};

} // namespace ionbench

#endif // CACHED_EVALUATOR_HPP
