#include "benchmarker/ParameterTransform.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace ionbench {

ParameterTransform::ParameterTransform(const Eigen::VectorXd& defaultParams,
                                       bool useScaleFactors,
                                       std::vector<bool> logTransformParams)
    : defaultParams_(defaultParams),
      useScaleFactors_(useScaleFactors),
      logTransformParams_(std::move(logTransformParams))
{
    if (defaultParams_.size() == 0) {
        THROW_CONFIGURATION_ERROR("ParameterTransform::ParameterTransform", "Default parameter vector is empty.");
    }
    if (!defaultParams_.allFinite()) {
        THROW_CONFIGURATION_ERROR("ParameterTransform::ParameterTransform", "Default parameters must be finite.");
    }
    if (logTransformParams_.empty()) {
        logTransformParams_.assign(defaultParams_.size(), false);
    }
    setLogTransformParams(logTransformParams_);
    if (useScaleFactors_) {
        validateScaleFactors();
    }
}

void ParameterTransform::validateScaleFactors() const {
    for (Eigen::Index i = 0; i < defaultParams_.size(); ++i) {
        if (defaultParams_[i] == 0.0) {
            THROW_CONFIGURATION_ERROR("ParameterTransform::validateScaleFactors",
                "Default parameter " + std::to_string(i) + " is zero and cannot be used as a scale factor.");
        }
    }
}

void ParameterTransform::checkLength(const Eigen::VectorXd& v, const char* functionName) const {
    if (v.size() != defaultParams_.size()) {
        THROW_INVALID_PARAM(functionName,
            "Parameter vector size mismatch: expected " + std::to_string(defaultParams_.size()) +
            ", got " + std::to_string(v.size()));
    }
}

void ParameterTransform::setUseScaleFactors(bool useScaleFactors) {
    if (useScaleFactors) {
        validateScaleFactors();
    }
    useScaleFactors_ = useScaleFactors;
}

void ParameterTransform::setLogTransformParams(const std::vector<bool>& logTransformParams) {
    if (static_cast<Eigen::Index>(logTransformParams.size()) != defaultParams_.size()) {
        THROW_CONFIGURATION_ERROR("ParameterTransform::setLogTransformParams",
            "Expected " + std::to_string(defaultParams_.size()) + " log-transform flags, got " +
            std::to_string(logTransformParams.size()));
    }
    logTransformParams_ = logTransformParams;
}

bool ParameterTransform::isIdentity() const {
    return !useScaleFactors_ &&
           std::none_of(logTransformParams_.begin(), logTransformParams_.end(), [](bool b) { return b; });
}

Eigen::VectorXd ParameterTransform::toInput(const Eigen::VectorXd& original) const {
    checkLength(original, "ParameterTransform::toInput");
    Eigen::VectorXd input = original;
    for (Eigen::Index i = 0; i < input.size(); ++i) {
        if (useScaleFactors_) {
            input[i] = input[i] / defaultParams_[i];
        }
        if (logTransformParams_[i]) {
            if (!(input[i] > 0.0)) {
                THROW_DOMAIN_ERROR("ParameterTransform::toInput",
                    "Cannot log-transform parameter " + std::to_string(i) + " with value " +
                    std::to_string(input[i]) + ".");
            }
            input[i] = std::log(input[i]);
        }
    }
    return input;
}

Eigen::VectorXd ParameterTransform::toOriginal(const Eigen::VectorXd& input) const {
    checkLength(input, "ParameterTransform::toOriginal");
    Eigen::VectorXd original = input;
    for (Eigen::Index i = 0; i < original.size(); ++i) {
        if (logTransformParams_[i]) {
            original[i] = std::exp(original[i]);
        }
        if (useScaleFactors_) {
            original[i] = original[i] * defaultParams_[i];
        }
    }
    return original;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> ParameterTransform::boundsToInput(
    const Eigen::VectorXd& lowerBounds, const Eigen::VectorXd& upperBounds) const
{
    checkLength(lowerBounds, "ParameterTransform::boundsToInput");
    checkLength(upperBounds, "ParameterTransform::boundsToInput");

    const double inf = std::numeric_limits<double>::infinity();
    Eigen::VectorXd lower = lowerBounds;
    Eigen::VectorXd upper = upperBounds;
    for (Eigen::Index i = 0; i < lower.size(); ++i) {
        if (useScaleFactors_) {
            lower[i] /= defaultParams_[i];
            upper[i] /= defaultParams_[i];
            if (defaultParams_[i] < 0.0) {
                std::swap(lower[i], upper[i]);
            }
        }
        if (logTransformParams_[i]) {
            if (!(upper[i] > 0.0)) {
                THROW_CONFIGURATION_ERROR("ParameterTransform::boundsToInput",
                    "Upper bound of log-transformed parameter " + std::to_string(i) + " admits no positive value.");
            }
            lower[i] = (lower[i] > 0.0) ? std::log(lower[i]) : -inf;
            upper[i] = std::log(upper[i]);
        }
    }
    return {lower, upper};
}

} // namespace ionbench
