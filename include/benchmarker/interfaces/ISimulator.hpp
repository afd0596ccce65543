#ifndef I_SIMULATOR_HPP
#define I_SIMULATOR_HPP

#include <Eigen/Dense>

namespace ionbench {

/**
 * @brief Black-box model producing a trace from original-space parameters.
 */
class ISimulator {
public:
    virtual ~ISimulator() = default;

    /**
     * @brief Simulates the model.
     *
     * @param originalParameters Parameters in original space.
     * @param times Time points at which the trace is recorded.
     * @return Eigen::VectorXd The trace, one value per time point.
     *
     * @throws SimulationException If the model cannot be solved for these parameters.
     */
    virtual Eigen::VectorXd simulate(const Eigen::VectorXd& originalParameters,
                                     const Eigen::VectorXd& times) = 0;
};

} // namespace ionbench

#endif // I_SIMULATOR_HPP
