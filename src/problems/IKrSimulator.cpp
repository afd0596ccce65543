#include "problems/IKrSimulator.hpp"
#include "problems/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace ionbench {

namespace {

constexpr double BETA_SCALE = 7.3898e-5;
constexpr double RT_OVER_F = 26.713;  // mV, at 310 K
constexpr double K_OUT = 5.4;         // mM
// Below this |x| the removable singularity x / (1 - exp(-x)) is replaced by its limit.
constexpr double SINGULARITY_TOLERANCE = 1e-7;
constexpr double DT_HINT = 0.1;       // ms

} // anonymous namespace

IKrSimulator::IKrSimulator(StepProtocol protocol,
                           std::shared_ptr<IOdeSolverStrategy> solver,
                           double absTol,
                           double relTol)
    : protocol_(std::move(protocol)),
      solver_(solver ? std::move(solver) : std::make_shared<Dopri5SolverStrategy>()),
      absTol_(absTol),
      relTol_(relTol)
{
    if (protocol_.empty()) {
        THROW_INVALID_PARAM("IKrSimulator::IKrSimulator", "Voltage protocol has no steps.");
    }
    if (!(absTol_ > 0.0) || !(relTol_ > 0.0)) {
        THROW_INVALID_PARAM("IKrSimulator::IKrSimulator", "Integrator tolerances must be positive.");
    }
}

double IKrSimulator::alpha(const Eigen::VectorXd& p, double V) {
    const double x = (V + p[1]) / p[2];
    if (std::abs(x) < SINGULARITY_TOLERANCE) {
        return p[0] * p[2];
    }
    return p[0] * (V + p[1]) / (1.0 - std::exp(-x));
}

double IKrSimulator::beta(const Eigen::VectorXd& p, double V) {
    const double x = (V - p[3]) / p[4];
    if (std::abs(x) < SINGULARITY_TOLERANCE) {
        return BETA_SCALE * p[4];
    }
    return BETA_SCALE * (V - p[3]) / (std::exp(x) - 1.0);
}

double IKrSimulator::steadyState(const Eigen::VectorXd& p, double V) {
    return 1.0 / (1.0 + std::exp(-(V + p[6]) / p[7]));
}

double IKrSimulator::timeConstant(const Eigen::VectorXd& p, double V) {
    return p[5] / (alpha(p, V) + beta(p, V));
}

double IKrSimulator::current(const Eigen::VectorXd& p, double xr, double V) {
    const double reversal = RT_OVER_F * std::log(K_OUT / p[11]);
    return p[10] * xr * (V - reversal) / (1.0 + std::exp((V + p[8]) / p[9]));
}

Eigen::VectorXd IKrSimulator::simulate(const Eigen::VectorXd& originalParameters,
                                       const Eigen::VectorXd& times) {
    const std::string F_NAME = "IKrSimulator::simulate";
    if (originalParameters.size() != NUM_PARAMETERS) {
        THROW_SIMULATION_ERROR(F_NAME, "Expected " + std::to_string(NUM_PARAMETERS) +
                                       " parameters, got " + std::to_string(originalParameters.size()));
    }
    const double tmax = protocol_.totalDuration();
    const Eigen::Index n = times.size();
    for (Eigen::Index k = 0; k < n; ++k) {
        if (!(times[k] >= 0.0 && times[k] <= tmax) || (k > 0 && !(times[k] > times[k - 1]))) {
            THROW_SIMULATION_ERROR(F_NAME, "Time points must be strictly increasing within [0, " +
                                           std::to_string(tmax) + "].");
        }
    }

    const Eigen::VectorXd& p = originalParameters;
    Eigen::VectorXd trace(n);
    const auto& steps = protocol_.steps();
    state_type state{steadyState(p, steps.front().voltage)};

    Eigen::Index k = 0;
    double start = 0.0;
    for (std::size_t j = 0; j < steps.size(); ++j) {
        const double V = steps[j].voltage;
        const double end = start + steps[j].duration;
        const bool lastStep = (j + 1 == steps.size());

        // Output slot of each integration time, -1 for the step boundaries.
        std::vector<double> segmentTimes{start};
        std::vector<Eigen::Index> slots{-1};
        if (k < n && times[k] == start) {
            slots[0] = k++;
        }
        while (k < n && (times[k] < end || (lastStep && times[k] <= end))) {
            segmentTimes.push_back(times[k]);
            slots.push_back(k++);
        }
        if (segmentTimes.back() < end) {
            segmentTimes.push_back(end);
            slots.push_back(-1);
        }

        const double xInf = steadyState(p, V);
        const double tau = timeConstant(p, V);
        if (!std::isfinite(xInf) || !std::isfinite(tau) || !(tau > 0.0)) {
            THROW_SIMULATION_ERROR(F_NAME, "Gate kinetics are not defined at " + std::to_string(V) + " mV.");
        }

        auto system = [xInf, tau](const state_type& x, state_type& dxdt, double /* t */) {
            dxdt[0] = (xInf - x[0]) / tau;
        };
        std::size_t call = 0;
        auto observer = [&](const state_type& x, double /* t */) {
            const Eigen::Index slot = slots[call++];
            if (slot >= 0) {
                trace[slot] = current(p, x[0], V);
            }
        };

        solver_->integrate(system, state, segmentTimes, std::min(DT_HINT, steps[j].duration),
                           observer, absTol_, relTol_);
        start = end;
    }

    if (!trace.allFinite()) {
        THROW_SIMULATION_ERROR(F_NAME, "Simulated current is not finite.");
    }
    return trace;
}

} // namespace ionbench
