#include "benchmarker/FunctionSimulator.hpp"
#include "exceptions/Exceptions.hpp"

namespace ionbench {

FunctionSimulator::FunctionSimulator(ModelFunction model)
    : model_(std::move(model))
{
    if (!model_) {
        THROW_INVALID_PARAM("FunctionSimulator::FunctionSimulator", "Model function is empty.");
    }
}

Eigen::VectorXd FunctionSimulator::simulate(const Eigen::VectorXd& originalParameters,
                                            const Eigen::VectorXd& times) {
    ++callCount_;
    return model_(originalParameters, times);
}

} // namespace ionbench
