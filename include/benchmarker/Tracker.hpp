#ifndef TRACKER_HPP
#define TRACKER_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <limits>
#include <vector>

namespace ionbench {

/**
 * @brief Aggregate statistics over the finite costs recorded by a Tracker.
 */
struct TrackerSummary {
    std::size_t evaluations = 0;       ///< Records of any kind, infeasible ones included.
    std::size_t finiteEvaluations = 0; ///< Records with a finite cost.
    double bestCost = std::numeric_limits<double>::infinity();
    double meanCost = std::numeric_limits<double>::quiet_NaN();
    int solveCount = 0;
};

/**
 * @brief Performance history of one benchmarker.
 *
 * Every cost call appends one record, but only calls that actually ran the simulator
 * advance the solve counter. Cache hits and bound violations are scored without being
 * counted as solves.
 */
class Tracker {
public:
    /**
     * @brief Appends one record.
     *
     * @param trueParams Reference parameters in original space.
     * @param estimatedParams Candidate parameters in original space.
     * @param cost Trace-fit cost. Defaults to +inf, the value recorded when no simulation ran.
     * @param incrementSolveCounter Whether a simulation was attempted for this record.
     *
     * @throws InvalidParameterException If the two vectors differ in length or are empty.
     */
    void update(const Eigen::VectorXd& trueParams,
                const Eigen::VectorXd& estimatedParams,
                double cost = std::numeric_limits<double>::infinity(),
                bool incrementSolveCounter = true);

    /** @brief Clears every record and the solve counter. */
    void reset();

    const std::vector<double>& costs() const { return costs_; }
    const std::vector<double>& paramRMSRE() const { return paramRMSRE_; }
    const std::vector<int>& paramIdentifiedCount() const { return paramIdentifiedCount_; }
    int solveCount() const { return solveCount_; }
    std::size_t size() const { return costs_.size(); }

    /**
     * @brief Most recent recorded cost, or +inf if nothing was recorded.
     */
    double lastCost() const;

    /** @brief Statistics over the history, computed with Boost.Accumulators. */
    TrackerSummary summary() const;

    /** @brief Relative error tolerance under which a parameter counts as identified. */
    static constexpr double IDENTIFIED_TOLERANCE = 0.05;

    /**
     * @brief Root-mean-square of (estimated - true) / true.
     */
    static double rmsre(const Eigen::VectorXd& trueParams, const Eigen::VectorXd& estimatedParams);

    /**
     * @brief Number of parameters whose relative error magnitude is below 0.05.
     */
    static int identifiedCount(const Eigen::VectorXd& trueParams, const Eigen::VectorXd& estimatedParams);

private:
    std::vector<double> costs_;
    std::vector<double> paramRMSRE_;
    std::vector<int> paramIdentifiedCount_;
    int solveCount_ = 0;
};

} // namespace ionbench

#endif // TRACKER_HPP
