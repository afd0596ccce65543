#ifndef LOEWE2016_FACTORY_HPP
#define LOEWE2016_FACTORY_HPP

#include "benchmarker/Benchmarker.hpp"
#include "benchmarker/BenchmarkerConfig.hpp"
#include "benchmarker/BoundsChecker.hpp"
#include "problems/IKrSimulator.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ionbench {

    /**
     * @class Loewe2016Factory
     * @brief Builds the IKr benchmark problem of Loewe et al. 2016.
     *
     * The true parameters are the published defaults and the reference data is the
     * simulated current at those defaults, sampled every 0.5 ms, unless a data file
     * is supplied.
     */
    class Loewe2016Factory {
        public:
            /**
             * @brief Problem options. All of them can be set from a settings map.
             */
            struct Options {
                double parameterSpaceWidth = 1.0;  ///< 1 for the narrow space, 2 for the wide one
                bool useStandardBounds = true;     ///< Apply the x10^+-w / +-60w bounds
                bool useRateBounds = true;
                bool useScaleFactors = false;
                bool useStandardLogTransform = false;  ///< Log-transform the multiplicative parameters
                double costThreshold = 0.01;
                std::string dataPath;              ///< Reference data CSV; empty to simulate it

                Options();

                /**
                 * @brief Reads parameter_space_width, bounded, rate_bounded, use_scale_factors,
                 *        log_transform and cost_threshold, keeping defaults for missing keys.
                 * @throws ConfigurationException If parameter_space_width is not positive.
                 */
                static Options fromSettings(const std::map<std::string, double>& settings);
            };

            static constexpr double SAMPLING_INTERVAL = 0.5;  ///< ms
            static constexpr double RATE_MIN = 1.67e-5;       ///< 1/ms
            static constexpr double RATE_MAX = 1e3;           ///< 1/ms

            /** @brief Courtemanche 1998 IKr parameters as reported by Loewe et al. 2016. */
            static Eigen::VectorXd ikrDefaultParameters();

            /** @brief Flags for the parameters that shift voltages and so vary additively. */
            static std::vector<bool> ikrAdditiveParameters();

            /**
             * @brief Bounds default * 10^(+-w) for multiplicative parameters and
             *        default +- 60w for additive ones, as (lower, upper).
             */
            static std::pair<Eigen::VectorXd, Eigen::VectorXd> standardBounds(const Eigen::VectorXd& defaults,
                                                                              const std::vector<bool>& additive,
                                                                              double width);

            /**
             * @brief The two gate rates, each checked at the end of [vLow, vHigh] where it
             *        is largest.
             */
            static std::vector<RateFunction> ikrRateFunctions(double vLow, double vHigh);

            /**
             * @brief Full configuration of the IKr problem.
             *
             * @throws CSVReadException If a data file is given and cannot be read.
             * @throws SimulationException If the reference data cannot be simulated.
             */
            static BenchmarkerConfig createIKrConfig(const Options& options, IKrSimulator& simulator);

            /**
             * @brief Ready-to-use IKr benchmarker.
             */
            static std::unique_ptr<Benchmarker> createIKr(const Options& options = Options(),
                                                          unsigned int seed = 5489u);
    };

} // namespace ionbench

#endif // LOEWE2016_FACTORY_HPP
