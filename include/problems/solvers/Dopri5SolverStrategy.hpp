#ifndef DOPRI5_SOLVER_STRATEGY_HPP
#define DOPRI5_SOLVER_STRATEGY_HPP

#include "problems/interfaces/IOdeSolverStrategy.hpp"

namespace ionbench {

/**
 * @brief Adaptive Dormand-Prince 5(4) integration with Boost.Odeint.
 */
class Dopri5SolverStrategy : public IOdeSolverStrategy {
public:
    void integrate(const OdeSystem& system,
                   state_type& state,
                   const std::vector<double>& times,
                   double dtHint,
                   const OdeObserver& observer,
                   double absTol,
                   double relTol) const override;
};

} // namespace ionbench

#endif // DOPRI5_SOLVER_STRATEGY_HPP
