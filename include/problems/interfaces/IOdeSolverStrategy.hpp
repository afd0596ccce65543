#ifndef I_ODE_SOLVER_STRATEGY_HPP
#define I_ODE_SOLVER_STRATEGY_HPP

#include <functional>
#include <vector>

namespace ionbench {

/// Gate state as seen by Boost.Odeint.
using state_type = std::vector<double>;

/// dx/dt = f(x, t), written into the second argument.
using OdeSystem = std::function<void(const state_type&, state_type&, double)>;

/// Called with the state at every requested output time.
using OdeObserver = std::function<void(const state_type&, double)>;

/**
 * @brief Integrator used by the ion-channel simulators for one protocol segment.
 *
 * Implementations must call @p observer exactly once per entry of @p times, in order,
 * including the first entry (the initial time).
 */
class IOdeSolverStrategy {
public:
    virtual ~IOdeSolverStrategy() = default;

    /**
     * @param system Right-hand side of the gating ODE.
     * @param state Initial state on entry, state at times.back() on return.
     * @param times Output times, ascending, starting at the initial time.
     * @param dtHint First step size tried by adaptive steppers.
     * @param observer Output callback.
     * @param absTol Absolute error tolerance.
     * @param relTol Relative error tolerance.
     *
     * @throws SimulationException If integration fails.
     */
    virtual void integrate(const OdeSystem& system,
                           state_type& state,
                           const std::vector<double>& times,
                           double dtHint,
                           const OdeObserver& observer,
                           double absTol,
                           double relTol) const = 0;
};

} // namespace ionbench

#endif // I_ODE_SOLVER_STRATEGY_HPP
