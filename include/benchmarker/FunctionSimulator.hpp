#ifndef FUNCTION_SIMULATOR_HPP
#define FUNCTION_SIMULATOR_HPP

#include "benchmarker/interfaces/ISimulator.hpp"
#include <functional>

namespace ionbench {

/**
 * @brief ISimulator backed by a callable, for analytic models.
 */
class FunctionSimulator : public ISimulator {
public:
    using ModelFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd&, const Eigen::VectorXd&)>;

    /**
     * @throws InvalidParameterException If the callable is empty.
     */
    explicit FunctionSimulator(ModelFunction model);

    Eigen::VectorXd simulate(const Eigen::VectorXd& originalParameters,
                             const Eigen::VectorXd& times) override;

    /** @brief Number of simulate() calls so far, failed ones included. */
    int callCount() const { return callCount_; }

private:
    ModelFunction model_;
    int callCount_ = 0;
};

} // namespace ionbench

#endif // FUNCTION_SIMULATOR_HPP
