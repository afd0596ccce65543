#include "benchmarker/Benchmarker.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ionbench {

Benchmarker::Benchmarker(BenchmarkerConfig config, std::shared_ptr<ISimulator> simulator, unsigned int seed)
    : config_(std::move(config)),
      trueParams_(config_.trueParams.size() == 0 ? config_.defaultParams : config_.trueParams),
      transform_(config_.defaultParams, config_.useScaleFactors, config_.logTransformParams),
      bounds_(static_cast<int>(config_.defaultParams.size())),
      rng_(seed)
{
    validateConfig();

    if (config_.lowerBounds.size() > 0 || config_.upperBounds.size() > 0) {
        const double inf = std::numeric_limits<double>::infinity();
        Eigen::VectorXd lb = config_.lowerBounds.size() > 0 ? config_.lowerBounds
                                                            : Eigen::VectorXd::Constant(nParameters(), -inf);
        Eigen::VectorXd ub = config_.upperBounds.size() > 0 ? config_.upperBounds
                                                            : Eigen::VectorXd::Constant(nParameters(), inf);
        bounds_.setParameterBounds(lb, ub);
    }
    if (config_.rateBounds) {
        bounds_.setRateBounds(*config_.rateBounds);
    }

    evaluator_ = std::make_unique<CachedEvaluator>(
        std::move(simulator), transform_, bounds_, tracker_, cache_,
        trueParams_, config_.data, config_.times);

    Logger::getInstance().info("Benchmarker::Benchmarker",
        "Initialised '" + config_.name + "' with " + std::to_string(nParameters()) + " parameters and " +
        std::to_string(config_.data.size()) + " data points.");
}

void Benchmarker::validateConfig() const {
    const std::string F_NAME = "Benchmarker::validateConfig";
    if (trueParams_.size() != nParameters()) {
        THROW_CONFIGURATION_ERROR(F_NAME, "True parameters have length " + std::to_string(trueParams_.size()) +
                                          ", expected " + std::to_string(nParameters()));
    }
    if (!config_.additiveParams.empty() && static_cast<int>(config_.additiveParams.size()) != nParameters()) {
        THROW_CONFIGURATION_ERROR(F_NAME, "Expected " + std::to_string(nParameters()) + " additive flags, got " +
                                          std::to_string(config_.additiveParams.size()));
    }
    if (!(config_.parameterSpaceWidth > 0.0)) {
        THROW_CONFIGURATION_ERROR(F_NAME, "Parameter space width must be positive.");
    }
    if (!(config_.gradStep > 0.0)) {
        THROW_CONFIGURATION_ERROR(F_NAME, "Gradient step must be positive.");
    }
    if (std::isnan(config_.costThreshold)) {
        THROW_CONFIGURATION_ERROR(F_NAME, "Cost threshold is NaN.");
    }
}

double Benchmarker::cost(const Eigen::VectorXd& inputParameters) {
    double c = evaluator_->cost(inputParameters, EvaluationOptions{});
    lastSearchCost_ = c;
    return c;
}

Eigen::VectorXd Benchmarker::grad(const Eigen::VectorXd& inputParameters,
                                  std::optional<double> centreCost,
                                  bool incrementSolveCounter) {
    const std::string F_NAME = "Benchmarker::grad";
    const int n = nParameters();
    if (inputParameters.size() != n) {
        THROW_INVALID_PARAM(F_NAME, "Parameter vector size mismatch: expected " + std::to_string(n) +
                                    ", got " + std::to_string(inputParameters.size()));
    }

    EvaluationOptions bounded;
    bounded.incrementSolveCounter = incrementSolveCounter;
    EvaluationOptions unbounded = bounded;
    unbounded.checkBounds = false;

    const bool centreFeasible = evaluator_->isFeasible(inputParameters);
    if (!centreFeasible) {
        Logger::getInstance().debug(F_NAME, "Centre point is infeasible, bounds are ignored for every axis.");
    }

    if (!centreCost) {
        centreCost = evaluator_->cost(inputParameters, centreFeasible ? bounded : unbounded);
        if (incrementSolveCounter) {
            lastSearchCost_ = *centreCost;
        }
    }

    Eigen::VectorXd gradient(n);
    for (int i = 0; i < n; ++i) {
        const double baseStep = config_.gradStep * (inputParameters[i] != 0.0 ? std::abs(inputParameters[i]) : 1.0);
        double h = baseStep;
        const EvaluationOptions* options = &unbounded;

        if (centreFeasible) {
            bool found = false;
            for (int attempt = 0; attempt <= MAX_STEP_HALVINGS; ++attempt) {
                Eigen::VectorXd forward = inputParameters;
                forward[i] += h;
                if (evaluator_->isFeasible(forward)) {
                    found = true;
                    break;
                }
                Eigen::VectorXd backward = inputParameters;
                backward[i] -= h;
                if (evaluator_->isFeasible(backward)) {
                    h = -h;
                    found = true;
                    break;
                }
                h /= 2.0;
            }
            if (found) {
                options = &bounded;
            } else {
                Logger::getInstance().debug(F_NAME,
                    "No feasible step for parameter " + std::to_string(i) + ", bounds ignored for this axis.");
                h = baseStep;
            }
        }

        Eigen::VectorXd perturbed = inputParameters;
        perturbed[i] += h;
        gradient[i] = (evaluator_->cost(perturbed, *options) - *centreCost) / h;
    }
    return gradient;
}

Eigen::VectorXd Benchmarker::sampleOriginal() {
    const int n = nParameters();
    const Eigen::VectorXd& d = config_.defaultParams;
    Eigen::VectorXd p(n);
    std::uniform_real_distribution<double> perturb(0.5, 1.5);

    switch (config_.samplingMode) {
        case SamplingMode::PerturbDefault:
            for (int i = 0; i < n; ++i) {
                p[i] = d[i] * perturb(rng_);
            }
            break;
        case SamplingMode::UniformWithinBounds: {
            Eigen::VectorXd lb = bounds_.lowerBounds();
            Eigen::VectorXd ub = bounds_.upperBounds();
            for (int i = 0; i < n; ++i) {
                if (bounds_.isBounded() && std::isfinite(lb[i]) && std::isfinite(ub[i])) {
                    p[i] = std::uniform_real_distribution<double>(lb[i], ub[i])(rng_);
                } else {
                    p[i] = d[i] * perturb(rng_);
                }
            }
            break;
        }
        case SamplingMode::LogUniformAroundDefault: {
            const double w = config_.parameterSpaceWidth;
            std::uniform_real_distribution<double> additive(-60.0 * w, 60.0 * w);
            std::uniform_real_distribution<double> exponent(-w, w);
            for (int i = 0; i < n; ++i) {
                const bool isAdditive = !config_.additiveParams.empty() && config_.additiveParams[i];
                p[i] = isAdditive ? d[i] + additive(rng_) : d[i] * std::pow(10.0, exponent(rng_));
            }
            break;
        }
    }
    return bounds_.clamp(p);
}

Eigen::VectorXd Benchmarker::sample() {
    return transform_.toInput(sampleOriginal());
}

std::vector<Eigen::VectorXd> Benchmarker::sample(int n) {
    if (n < 0) {
        THROW_INVALID_PARAM("Benchmarker::sample", "Number of samples must be non-negative.");
    }
    std::vector<Eigen::VectorXd> samples;
    samples.reserve(n);
    for (int k = 0; k < n; ++k) {
        samples.push_back(sample());
    }
    return samples;
}

bool Benchmarker::isConverged() const {
    return lastSearchCost_.has_value() && *lastSearchCost_ < config_.costThreshold;
}

void Benchmarker::reset() {
    tracker_.reset();
    cache_.clear();
    lastSearchCost_.reset();
    Logger::getInstance().debug("Benchmarker::reset", "Tracker and cache cleared for '" + config_.name + "'.");
}

EvaluationReport Benchmarker::evaluate(const Eigen::VectorXd& inputParameters) {
    EvaluationReport report;
    report.search = tracker_.summary();
    report.solveCount = tracker_.solveCount();
    report.numParameters = nParameters();

    EvaluationOptions options;
    options.incrementSolveCounter = false;
    report.cost = evaluator_->cost(inputParameters, options);
    report.paramRMSRE = tracker_.paramRMSRE().back();
    report.identifiedCount = tracker_.paramIdentifiedCount().back();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "Final parameters for '" << config_.name << "'\n"
        << "  Number of cost evaluations:      " << report.solveCount << "\n"
        << "  Final cost:                      " << report.cost << "\n"
        << "  Parameter RMSRE:                 " << report.paramRMSRE << "\n"
        << "  Number of identified parameters: " << report.identifiedCount << "\n"
        << "  Total number of parameters:      " << report.numParameters << "\n"
        << "  Best search cost:                " << report.search.bestCost << " over "
        << report.search.finiteEvaluations << "/" << report.search.evaluations << " finite evaluations";
    Logger::getInstance().info("Benchmarker::evaluate", oss.str());
    return report;
}

Eigen::VectorXd Benchmarker::signedError(const Eigen::VectorXd& inputParameters) {
    return evaluator_->signedError(inputParameters);
}

Eigen::VectorXd Benchmarker::squaredError(const Eigen::VectorXd& inputParameters) {
    return evaluator_->signedError(inputParameters).array().square().matrix();
}

void Benchmarker::addBounds(const Eigen::VectorXd& lowerBounds, const Eigen::VectorXd& upperBounds,
                            ParameterSpace space) {
    if (space == ParameterSpace::Original) {
        bounds_.setParameterBounds(lowerBounds, upperBounds);
        return;
    }
    Eigen::VectorXd lo = transform_.toOriginal(lowerBounds);
    Eigen::VectorXd hi = transform_.toOriginal(upperBounds);
    // A negative scale factor reverses the order of a pair.
    bounds_.setParameterBounds(lo.cwiseMin(hi), lo.cwiseMax(hi));
}

void Benchmarker::clearBounds() {
    bounds_.clearParameterBounds();
}

void Benchmarker::setBounded(bool bounded) {
    bounds_.setBounded(bounded);
}

void Benchmarker::setRateBounds(RateBounds rateBounds) {
    bounds_.setRateBounds(std::move(rateBounds));
}

void Benchmarker::setRateBounded(bool rateBounded) {
    bounds_.setRateBounded(rateBounded);
}

void Benchmarker::logTransform(const std::vector<int>& which) {
    std::vector<bool> flags = transform_.logTransformParams();
    if (which.empty()) {
        flags.assign(flags.size(), true);
    }
    for (int i : which) {
        if (i < 0 || i >= nParameters()) {
            THROW_OUT_OF_RANGE("Benchmarker::logTransform",
                "Parameter index " + std::to_string(i) + " out of range [0, " + std::to_string(nParameters()) + ")");
        }
        flags[i] = true;
    }
    transform_.setLogTransformParams(flags);
    clearCacheAfterTransformChange("Benchmarker::logTransform");
}

void Benchmarker::setUseScaleFactors(bool useScaleFactors) {
    transform_.setUseScaleFactors(useScaleFactors);
    clearCacheAfterTransformChange("Benchmarker::setUseScaleFactors");
}

void Benchmarker::clearCacheAfterTransformChange(const std::string& source) {
    cache_.clear();
    Logger::getInstance().debug(source, "Transform changed, cost cache cleared for '" + config_.name + "'.");
}

Eigen::VectorXd Benchmarker::originalToInput(const Eigen::VectorXd& originalParameters) const {
    return transform_.toInput(originalParameters);
}

Eigen::VectorXd Benchmarker::inputToOriginal(const Eigen::VectorXd& inputParameters) const {
    return transform_.toOriginal(inputParameters);
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> Benchmarker::inputBounds() const {
    const double inf = std::numeric_limits<double>::infinity();
    if (!bounds_.isBounded()) {
        return {Eigen::VectorXd::Constant(nParameters(), -inf), Eigen::VectorXd::Constant(nParameters(), inf)};
    }
    return transform_.boundsToInput(bounds_.lowerBounds(), bounds_.upperBounds());
}

Eigen::VectorXd Benchmarker::clampParameters(const Eigen::VectorXd& inputParameters) const {
    return transform_.toInput(bounds_.clamp(transform_.toOriginal(inputParameters)));
}

bool Benchmarker::isFeasible(const Eigen::VectorXd& inputParameters) const {
    return evaluator_->isFeasible(inputParameters);
}

} // namespace ionbench
