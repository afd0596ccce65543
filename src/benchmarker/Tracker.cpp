#include "benchmarker/Tracker.hpp"
#include "exceptions/Exceptions.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>

#include <cmath>
#include <string>

namespace ionbench {

namespace {

void checkPair(const Eigen::VectorXd& trueParams, const Eigen::VectorXd& estimatedParams, const char* functionName) {
    if (trueParams.size() == 0 || trueParams.size() != estimatedParams.size()) {
        THROW_INVALID_PARAM(functionName,
            "Parameter vector size mismatch: expected " + std::to_string(trueParams.size()) +
            ", got " + std::to_string(estimatedParams.size()));
    }
}

} // anonymous namespace

double Tracker::rmsre(const Eigen::VectorXd& trueParams, const Eigen::VectorXd& estimatedParams) {
    checkPair(trueParams, estimatedParams, "Tracker::rmsre");
    Eigen::ArrayXd relErr = (estimatedParams - trueParams).array() / trueParams.array();
    return std::sqrt(relErr.square().mean());
}

int Tracker::identifiedCount(const Eigen::VectorXd& trueParams, const Eigen::VectorXd& estimatedParams) {
    checkPair(trueParams, estimatedParams, "Tracker::identifiedCount");
    Eigen::ArrayXd relErr = ((estimatedParams - trueParams).array() / trueParams.array()).abs();
    return static_cast<int>((relErr < IDENTIFIED_TOLERANCE).count());
}

void Tracker::update(const Eigen::VectorXd& trueParams,
                     const Eigen::VectorXd& estimatedParams,
                     double cost,
                     bool incrementSolveCounter) {
    checkPair(trueParams, estimatedParams, "Tracker::update");
    paramRMSRE_.push_back(rmsre(trueParams, estimatedParams));
    paramIdentifiedCount_.push_back(identifiedCount(trueParams, estimatedParams));
    costs_.push_back(cost);
    if (incrementSolveCounter) {
        ++solveCount_;
    }
}

void Tracker::reset() {
    costs_.clear();
    paramRMSRE_.clear();
    paramIdentifiedCount_.clear();
    solveCount_ = 0;
}

double Tracker::lastCost() const {
    return costs_.empty() ? std::numeric_limits<double>::infinity() : costs_.back();
}

TrackerSummary Tracker::summary() const {
    using namespace boost::accumulators;
    accumulator_set<double, stats<tag::count, tag::mean, tag::min>> acc;
    for (double c : costs_) {
        if (std::isfinite(c)) {
            acc(c);
        }
    }

    TrackerSummary s;
    s.evaluations = costs_.size();
    s.finiteEvaluations = extract::count(acc);
    s.solveCount = solveCount_;
    if (s.finiteEvaluations > 0) {
        s.bestCost = extract::min(acc);
        s.meanCost = extract::mean(acc);
    }
    return s;
}

} // namespace ionbench
