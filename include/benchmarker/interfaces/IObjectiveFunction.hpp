#ifndef I_OBJECTIVE_FUNCTION_HPP
#define I_OBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>

namespace ionbench {

/**
 * @brief Interface for a scalar cost over input-space parameter vectors.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @brief Calculate the cost of an input-space parameter vector.
     *
     * @param inputParameters The parameter vector to evaluate, in input space.
     * @return double The cost. Lower is better; +infinity marks an infeasible
     *         candidate or a failed simulation.
     */
    virtual double calculate(const Eigen::VectorXd& inputParameters) = 0;

    /** @brief Number of parameters expected by calculate(). */
    virtual int numParameters() const = 0;
};

} // namespace ionbench

#endif // I_OBJECTIVE_FUNCTION_HPP
