#include "problems/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/integrate/integrate_times.hpp>
#include <boost/numeric/odeint/stepper/generation.hpp>
#include <boost/numeric/odeint/stepper/runge_kutta_dopri5.hpp>
#include <string>

namespace ionbench {

namespace odeint = boost::numeric::odeint;

void Dopri5SolverStrategy::integrate(const OdeSystem& system,
                                     state_type& state,
                                     const std::vector<double>& times,
                                     double dtHint,
                                     const OdeObserver& observer,
                                     double absTol,
                                     double relTol) const
{
    const std::string F_NAME = "Dopri5SolverStrategy::integrate";
    if (times.empty()) {
        THROW_SIMULATION_ERROR(F_NAME, "No output time points.");
    }
    if (state.empty()) {
        THROW_SIMULATION_ERROR(F_NAME, "Empty state vector.");
    }
    try {
        auto stepper = odeint::make_controlled<odeint::runge_kutta_dopri5<state_type>>(absTol, relTol);
        odeint::integrate_times(stepper, system, state, times.begin(), times.end(), dtHint, observer);
    } catch (const std::exception& e) {
        THROW_SIMULATION_ERROR(F_NAME, std::string("Boost.Odeint integration failed: ") + e.what());
    }
}

} // namespace ionbench
