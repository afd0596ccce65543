#include "benchmarker/CachedEvaluator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace ionbench {

namespace {

std::string formatVector(const Eigen::VectorXd& v) {
    std::ostringstream oss;
    oss << v.transpose();
    return "[" + oss.str() + "]";
}

} // anonymous namespace

CachedEvaluator::CachedEvaluator(std::shared_ptr<ISimulator> simulator,
                                 const ParameterTransform& transform,
                                 const BoundsChecker& bounds,
                                 Tracker& tracker,
                                 ICostCache& cache,
                                 Eigen::VectorXd trueParams,
                                 Eigen::VectorXd data,
                                 Eigen::VectorXd times)
    : simulator_(std::move(simulator)),
      transform_(transform),
      bounds_(bounds),
      tracker_(tracker),
      cache_(cache),
      trueParams_(std::move(trueParams)),
      data_(std::move(data)),
      times_(std::move(times))
{
    if (!simulator_) {
        THROW_INVALID_PARAM("CachedEvaluator::CachedEvaluator", "Simulator pointer is null.");
    }
    if (trueParams_.size() != transform_.size()) {
        THROW_CONFIGURATION_ERROR("CachedEvaluator::CachedEvaluator",
            "True parameters have length " + std::to_string(trueParams_.size()) +
            ", expected " + std::to_string(transform_.size()));
    }
    if (data_.size() == 0 || data_.size() != times_.size()) {
        THROW_CONFIGURATION_ERROR("CachedEvaluator::CachedEvaluator",
            "Reference data and time grid must be non-empty and of equal length.");
    }
}

double CachedEvaluator::calculate(const Eigen::VectorXd& inputParameters) {
    return cost(inputParameters, EvaluationOptions{});
}

double CachedEvaluator::rmse(const Eigen::VectorXd& trace, const Eigen::VectorXd& data) {
    return std::sqrt((trace - data).array().square().mean());
}

bool CachedEvaluator::isFeasible(const Eigen::VectorXd& inputParameters) const {
    Eigen::VectorXd original = transform_.toOriginal(inputParameters);
    return original.allFinite() && bounds_.isFeasible(original);
}

bool CachedEvaluator::trySimulate(const Eigen::VectorXd& originalParameters, Eigen::VectorXd& trace) {
    const std::string F_NAME = "CachedEvaluator::trySimulate";
    try {
        trace = simulator_->simulate(originalParameters, times_);
    } catch (const SimulationException& e) {
        Logger::getInstance().warning(F_NAME, std::string("Simulation failed, cost set to inf: ") + e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::getInstance().warning(F_NAME, std::string("Simulator raised an unexpected error, cost set to inf: ") + e.what());
        return false;
    }
    if (trace.size() != data_.size()) {
        Logger::getInstance().warning(F_NAME,
            "Simulator returned " + std::to_string(trace.size()) + " points, expected " +
            std::to_string(data_.size()) + ". Cost set to inf.");
        return false;
    }
    return true;
}

double CachedEvaluator::cost(const Eigen::VectorXd& inputParameters, const EvaluationOptions& options) {
    const std::string F_NAME = "CachedEvaluator::cost";
    const double inf = std::numeric_limits<double>::infinity();
    Logger& logger = Logger::getInstance();

    Eigen::VectorXd original = transform_.toOriginal(inputParameters);

    bool feasible = original.allFinite();
    if (feasible && options.checkBounds) {
        feasible = bounds_.isFeasible(original);
    }
    if (!feasible) {
        if (logger.isEnabled(LogLevel::DEBUG)) {
            logger.debug(F_NAME, "Infeasible candidate " + formatVector(original) + ", cost set to inf.");
        }
        tracker_.update(trueParams_, original, inf, false);
        return inf;
    }

    if (options.useCache) {
        std::optional<double> cached = cache_.get(inputParameters);
        if (cached) {
            if (logger.isEnabled(LogLevel::DEBUG)) {
                logger.debug(F_NAME, "Cache hit, cost " + std::to_string(*cached));
            }
            tracker_.update(trueParams_, original, *cached, false);
            return *cached;
        }
    }

    double result = inf;
    Eigen::VectorXd trace;
    if (trySimulate(original, trace)) {
        result = rmse(trace, data_);
        if (std::isnan(result)) {
            logger.warning(F_NAME, "Simulated trace contains NaN, cost set to inf.");
            result = inf;
        }
    }

    tracker_.update(trueParams_, original, result, options.incrementSolveCounter);
    if (options.useCache && options.incrementSolveCounter) {
        cache_.set(inputParameters, result);
    }
    return result;
}

Eigen::VectorXd CachedEvaluator::signedError(const Eigen::VectorXd& inputParameters) {
    const double inf = std::numeric_limits<double>::infinity();
    Eigen::VectorXd original = transform_.toOriginal(inputParameters);
    Eigen::VectorXd failed = Eigen::VectorXd::Constant(data_.size(), inf);

    if (!original.allFinite() || !bounds_.isFeasible(original)) {
        tracker_.update(trueParams_, original, inf, false);
        return failed;
    }

    Eigen::VectorXd trace;
    if (!trySimulate(original, trace)) {
        tracker_.update(trueParams_, original, inf, true);
        return failed;
    }
    Eigen::VectorXd residuals = trace - data_;
    double fit = rmse(trace, data_);
    tracker_.update(trueParams_, original, std::isnan(fit) ? inf : fit, true);
    return residuals;
}

} // namespace ionbench
