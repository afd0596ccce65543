#ifndef PARAMETER_TRANSFORM_HPP
#define PARAMETER_TRANSFORM_HPP

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace ionbench {

    /**
     * @brief Bijective map between the original parameter space (what the simulator
     *        consumes) and the input space (what an optimiser manipulates).
     *
     * Two independent transforms are combined per parameter:
     * - a global scale factor, dividing each parameter by its default value so that
     *   1.0 means "at default";
     * - a per-parameter natural logarithm.
     *
     * toInput applies scale then log, toOriginal applies exp then unscale. With every
     * flag off the transform is the identity.
     */
    class ParameterTransform {
    public:
        /**
         * @brief Constructs a transform.
         *
         * @param defaultParams Default parameters, used as scale factors. Must be finite.
         * @param useScaleFactors Whether parameters are scaled by their defaults.
         * @param logTransformParams Per-parameter log flags. An empty vector means no
         *        parameter is log-transformed.
         *
         * @throws ConfigurationException If the defaults are empty or non-finite, the log
         *         flags have the wrong length, or a default is zero while scale factors
         *         are enabled.
         */
        ParameterTransform(const Eigen::VectorXd& defaultParams,
                           bool useScaleFactors = false,
                           std::vector<bool> logTransformParams = {});

        /**
         * @brief Maps an original-space vector to input space.
         *
         * @throws InvalidParameterException If the vector length is wrong.
         * @throws TransformDomainException If a log-transformed component is non-positive
         *         after scaling.
         */
        Eigen::VectorXd toInput(const Eigen::VectorXd& original) const;

        /**
         * @brief Maps an input-space vector to original space.
         *
         * Never throws on values: an overflowing exponential yields a non-finite
         * component, which callers treat as an infeasible candidate.
         *
         * @throws InvalidParameterException If the vector length is wrong.
         */
        Eigen::VectorXd toOriginal(const Eigen::VectorXd& input) const;

        /**
         * @brief Maps a pair of bound vectors (entries may be +-inf) from original to
         *        input space, returned as (lower, upper).
         *
         * Components are swapped where a negative default reverses their order under
         * scaling. Lower bounds at or below zero on a log-transformed parameter map to
         * -inf, since every positive value satisfies them.
         *
         * @throws InvalidParameterException If a vector length is wrong.
         * @throws ConfigurationException If an upper bound on a log-transformed parameter
         *         is at or below zero (no feasible value exists).
         */
        std::pair<Eigen::VectorXd, Eigen::VectorXd> boundsToInput(const Eigen::VectorXd& lowerBounds,
                                                                  const Eigen::VectorXd& upperBounds) const;

        void setUseScaleFactors(bool useScaleFactors);

        /**
         * @brief Replaces the per-parameter log flags.
         * @throws ConfigurationException If the flags have the wrong length.
         */
        void setLogTransformParams(const std::vector<bool>& logTransformParams);

        bool usesScaleFactors() const { return useScaleFactors_; }
        const std::vector<bool>& logTransformParams() const { return logTransformParams_; }
        const Eigen::VectorXd& defaultParams() const { return defaultParams_; }
        bool isIdentity() const;
        int size() const { return static_cast<int>(defaultParams_.size()); }

    private:
        Eigen::VectorXd defaultParams_;
        bool useScaleFactors_;
        std::vector<bool> logTransformParams_;

        void validateScaleFactors() const;
        void checkLength(const Eigen::VectorXd& v, const char* functionName) const;
    };

} // namespace ionbench

#endif // PARAMETER_TRANSFORM_HPP
