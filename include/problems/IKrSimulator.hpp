#ifndef IKR_SIMULATOR_HPP
#define IKR_SIMULATOR_HPP

#include "benchmarker/interfaces/ISimulator.hpp"
#include "problems/StepProtocol.hpp"
#include "problems/interfaces/IOdeSolverStrategy.hpp"
#include <Eigen/Dense>
#include <memory>

namespace ionbench {

/**
 * @brief Courtemanche 1998 rapid delayed rectifier (IKr) under a step voltage clamp.
 *
 * A single Hodgkin-Huxley gate xr with
 *   alpha = p0 (V + p1) / (1 - exp(-(V + p1) / p2))
 *   beta  = 7.3898e-5 (V - p3) / (exp((V - p3) / p4) - 1)
 *   tau   = p5 / (alpha + beta)
 *   xr_inf = 1 / (1 + exp(-(V + p6) / p7))
 * and the current
 *   IKr = p10 xr (V - E_K) / (1 + exp((V + p8) / p9)),  E_K = 26.713 ln(5.4 / p11).
 *
 * The gate starts at steady state for the first protocol voltage and the ODE is
 * integrated step by step, the voltage being constant within each step.
 */
class IKrSimulator : public ISimulator {
public:
    static constexpr int NUM_PARAMETERS = 12;

    /**
     * @param protocol Voltage protocol. Must not be empty.
     * @param solver Integration strategy; Dopri5 when null.
     * @param absTol Absolute tolerance of the integrator.
     * @param relTol Relative tolerance of the integrator.
     * @throws InvalidParameterException If the protocol is empty or a tolerance is not positive.
     */
    explicit IKrSimulator(StepProtocol protocol,
                          std::shared_ptr<IOdeSolverStrategy> solver = nullptr,
                          double absTol = 1e-7,
                          double relTol = 1e-7);

    /**
     * @brief Current at each time point.
     *
     * @throws SimulationException If the parameters have the wrong length, the times are
     *         not strictly increasing within [0, protocol duration], or the solution is
     *         not finite.
     */
    Eigen::VectorXd simulate(const Eigen::VectorXd& originalParameters,
                             const Eigen::VectorXd& times) override;

    const StepProtocol& protocol() const { return protocol_; }

    static double alpha(const Eigen::VectorXd& p, double V);
    static double beta(const Eigen::VectorXd& p, double V);
    static double steadyState(const Eigen::VectorXd& p, double V);
    static double timeConstant(const Eigen::VectorXd& p, double V);
    static double current(const Eigen::VectorXd& p, double xr, double V);

private:
    StepProtocol protocol_;
    std::shared_ptr<IOdeSolverStrategy> solver_;
    double absTol_;
    double relTol_;
};

} // namespace ionbench

#endif // IKR_SIMULATOR_HPP
