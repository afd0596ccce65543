#include "benchmarker/BoundsChecker.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace ionbench {

BoundsChecker::BoundsChecker(int nParameters)
    : nParameters_(nParameters)
{
    if (nParameters_ <= 0) {
        THROW_INVALID_PARAM("BoundsChecker::BoundsChecker", "Number of parameters must be positive.");
    }
}

void BoundsChecker::checkLength(const Eigen::VectorXd& v, const char* functionName) const {
    if (v.size() != nParameters_) {
        THROW_INVALID_PARAM(functionName,
            "Parameter vector size mismatch: expected " + std::to_string(nParameters_) +
            ", got " + std::to_string(v.size()));
    }
}

void BoundsChecker::setParameterBounds(const Eigen::VectorXd& lowerBounds, const Eigen::VectorXd& upperBounds) {
    checkLength(lowerBounds, "BoundsChecker::setParameterBounds");
    checkLength(upperBounds, "BoundsChecker::setParameterBounds");
    for (int i = 0; i < nParameters_; ++i) {
        if (std::isnan(lowerBounds[i]) || std::isnan(upperBounds[i])) {
            THROW_CONFIGURATION_ERROR("BoundsChecker::setParameterBounds",
                "Bound for parameter " + std::to_string(i) + " is NaN.");
        }
        if (lowerBounds[i] > upperBounds[i]) {
            THROW_CONFIGURATION_ERROR("BoundsChecker::setParameterBounds",
                "Lower bound exceeds upper bound for parameter " + std::to_string(i) + ".");
        }
    }
    lb_ = lowerBounds;
    ub_ = upperBounds;
    bounded_ = true;
}

void BoundsChecker::clearParameterBounds() {
    lb_.resize(0);
    ub_.resize(0);
    bounded_ = false;
}

void BoundsChecker::setBounded(bool bounded) {
    if (bounded && lb_.size() == 0) {
        THROW_CONFIGURATION_ERROR("BoundsChecker::setBounded", "No parameter bounds have been set.");
    }
    bounded_ = bounded;
}

void BoundsChecker::setRateBounds(RateBounds rateBounds) {
    if (rateBounds.rateMin > rateBounds.rateMax) {
        THROW_CONFIGURATION_ERROR("BoundsChecker::setRateBounds", "rateMin exceeds rateMax.");
    }
    if (rateBounds.vLow > rateBounds.vHigh) {
        THROW_CONFIGURATION_ERROR("BoundsChecker::setRateBounds", "vLow exceeds vHigh.");
    }
    if (rateBounds.discretisation < 1) {
        THROW_CONFIGURATION_ERROR("BoundsChecker::setRateBounds", "Voltage sweep needs at least one point.");
    }
    for (const auto& f : rateBounds.functions) {
        if (!f.rate) {
            THROW_CONFIGURATION_ERROR("BoundsChecker::setRateBounds", "Rate function '" + f.name + "' is empty.");
        }
    }
    rateBounds_ = std::move(rateBounds);
    rateBounded_ = true;
}

void BoundsChecker::setRateBounded(bool rateBounded) {
    if (rateBounded && !rateBounds_) {
        THROW_CONFIGURATION_ERROR("BoundsChecker::setRateBounded", "No rate bounds have been set.");
    }
    rateBounded_ = rateBounded;
}

bool BoundsChecker::inParameterBounds(const Eigen::VectorXd& original) const {
    checkLength(original, "BoundsChecker::inParameterBounds");
    if (!bounded_) {
        return true;
    }
    for (int i = 0; i < nParameters_; ++i) {
        if (!(lb_[i] <= original[i] && original[i] <= ub_[i])) {
            return false;
        }
    }
    return true;
}

std::vector<double> BoundsChecker::sweepVoltages() const {
    std::vector<double> voltages;
    if (!rateBounds_) {
        return voltages;
    }
    const int n = rateBounds_->discretisation;
    if (n == 1) {
        voltages.push_back(rateBounds_->vLow);
        return voltages;
    }
    voltages.reserve(n);
    const double step = (rateBounds_->vHigh - rateBounds_->vLow) / (n - 1);
    for (int k = 0; k < n - 1; ++k) {
        voltages.push_back(rateBounds_->vLow + k * step);
    }
    voltages.push_back(rateBounds_->vHigh);
    return voltages;
}

bool BoundsChecker::inRateBounds(const Eigen::VectorXd& original) const {
    checkLength(original, "BoundsChecker::inRateBounds");
    if (!rateBounded_ || !rateBounds_ || rateBounds_->functions.empty()) {
        return true;
    }
    const std::vector<double> sweep = sweepVoltages();
    for (const auto& f : rateBounds_->functions) {
        const std::vector<double>& grid = f.voltages.empty() ? sweep : f.voltages;
        for (double v : grid) {
            const double r = f.rate(original, v);
            if (!(rateBounds_->rateMin <= r && r <= rateBounds_->rateMax)) {
                return false;
            }
        }
    }
    return true;
}

bool BoundsChecker::isFeasible(const Eigen::VectorXd& original) const {
    return inParameterBounds(original) && inRateBounds(original);
}

Eigen::VectorXd BoundsChecker::clamp(const Eigen::VectorXd& original) const {
    checkLength(original, "BoundsChecker::clamp");
    if (!bounded_) {
        return original;
    }
    return original.cwiseMax(lb_).cwiseMin(ub_);
}

Eigen::VectorXd BoundsChecker::lowerBounds() const {
    if (lb_.size() == 0) {
        return Eigen::VectorXd::Constant(nParameters_, -std::numeric_limits<double>::infinity());
    }
    return lb_;
}

Eigen::VectorXd BoundsChecker::upperBounds() const {
    if (ub_.size() == 0) {
        return Eigen::VectorXd::Constant(nParameters_, std::numeric_limits<double>::infinity());
    }
    return ub_;
}

} // namespace ionbench
