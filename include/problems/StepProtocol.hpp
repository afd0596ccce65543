#ifndef STEP_PROTOCOL_HPP
#define STEP_PROTOCOL_HPP

#include <vector>

namespace ionbench {

/**
 * @brief A voltage-clamp protocol made of consecutive constant-voltage steps.
 *
 * Times are in ms and voltages in mV. The protocol starts at t = 0.
 */
class StepProtocol {
public:
    struct Step {
        double voltage;
        double duration;
    };

    StepProtocol() = default;

    /**
     * @brief Appends a step.
     * @throws InvalidParameterException If the duration is not positive or the voltage is not finite.
     */
    void addStep(double voltage, double duration);

    const std::vector<Step>& steps() const { return steps_; }
    bool empty() const { return steps_.empty(); }

    /** @brief Sum of all step durations. */
    double totalDuration() const;

    /**
     * @brief Clamped voltage at time t. The last step holds for t >= totalDuration().
     * @throws OutOfRangeException If t < 0 or the protocol is empty.
     */
    double voltageAt(double t) const;

    double minVoltage() const;
    double maxVoltage() const;

    /**
     * @brief Uniform time grid 0, dt, 2dt, ... strictly below totalDuration().
     */
    std::vector<double> samplingTimes(double dt) const;

    /**
     * @brief The IKr protocol of Loewe et al. 2016.
     *
     * Thirteen sweeps of 20 ms at -80 mV, 400 ms at a test voltage stepping down from
     * 50 mV to -70 mV in 10 mV decrements, and 400 ms at -110 mV.
     */
    static StepProtocol loewe2016();

private:
    std::vector<Step> steps_;
};

} // namespace ionbench

#endif // STEP_PROTOCOL_HPP
