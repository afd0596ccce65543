#include "problems/StepProtocol.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ionbench {

void StepProtocol::addStep(double voltage, double duration) {
    if (!(duration > 0.0) || !std::isfinite(duration)) {
        THROW_INVALID_PARAM("StepProtocol::addStep", "Step duration must be positive and finite.");
    }
    if (!std::isfinite(voltage)) {
        THROW_INVALID_PARAM("StepProtocol::addStep", "Step voltage must be finite.");
    }
    steps_.push_back({voltage, duration});
}

double StepProtocol::totalDuration() const {
    double total = 0.0;
    for (const auto& step : steps_) {
        total += step.duration;
    }
    return total;
}

double StepProtocol::voltageAt(double t) const {
    if (steps_.empty()) {
        THROW_OUT_OF_RANGE("StepProtocol::voltageAt", "Protocol has no steps.");
    }
    if (t < 0.0) {
        THROW_OUT_OF_RANGE("StepProtocol::voltageAt", "Time " + std::to_string(t) + " is before the protocol start.");
    }
    double end = 0.0;
    for (const auto& step : steps_) {
        end += step.duration;
        if (t < end) {
            return step.voltage;
        }
    }
    return steps_.back().voltage;
}

double StepProtocol::minVoltage() const {
    if (steps_.empty()) {
        THROW_OUT_OF_RANGE("StepProtocol::minVoltage", "Protocol has no steps.");
    }
    return std::min_element(steps_.begin(), steps_.end(),
        [](const Step& a, const Step& b) { return a.voltage < b.voltage; })->voltage;
}

double StepProtocol::maxVoltage() const {
    if (steps_.empty()) {
        THROW_OUT_OF_RANGE("StepProtocol::maxVoltage", "Protocol has no steps.");
    }
    return std::max_element(steps_.begin(), steps_.end(),
        [](const Step& a, const Step& b) { return a.voltage < b.voltage; })->voltage;
}

std::vector<double> StepProtocol::samplingTimes(double dt) const {
    if (!(dt > 0.0)) {
        THROW_INVALID_PARAM("StepProtocol::samplingTimes", "Sampling interval must be positive.");
    }
    const double tmax = totalDuration();
    std::vector<double> times;
    for (long k = 0; k * dt < tmax; ++k) {
        times.push_back(k * dt);
    }
    return times;
}

StepProtocol StepProtocol::loewe2016() {
    StepProtocol protocol;
    for (int i = 0; i < 13; ++i) {
        protocol.addStep(-80.0, 20.0);
        protocol.addStep(50.0 - 10.0 * i, 400.0);
        protocol.addStep(-110.0, 400.0);
    }
    return protocol;
}

} // namespace ionbench
