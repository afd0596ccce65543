#ifndef BOUNDS_CHECKER_HPP
#define BOUNDS_CHECKER_HPP

#include <Eigen/Dense>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ionbench {

    /**
     * @brief Direction in which a transition rate grows with voltage.
     *
     * Positive rates increase with depolarisation and are largest at the top of the
     * voltage range, negative rates are largest at the bottom.
     */
    enum class RatePolarity {
        POSITIVE,
        NEGATIVE
    };

    /**
     * @brief A rate law evaluated on original-space parameters and a membrane voltage.
     */
    struct RateFunction {
        /** @brief rate(parameters, voltage) in original parameter space. */
        std::function<double(const Eigen::VectorXd&, double)> rate;
        RatePolarity polarity = RatePolarity::POSITIVE;
        std::string name;
        /** @brief Voltages to evaluate this rate at. Empty means the shared sweep. */
        std::vector<double> voltages;

        /**
         * @brief The end of [vLow, vHigh] at which this rate is largest.
         */
        double extremeVoltage(double vLow, double vHigh) const {
            return polarity == RatePolarity::POSITIVE ? vHigh : vLow;
        }
    };

    /**
     * @brief Feasibility constraint on rates derived from the parameters.
     *
     * Every rate must lie in [rateMin, rateMax] at every voltage of its grid.
     */
    struct RateBounds {
        std::vector<RateFunction> functions;
        double rateMin = 1.67e-5;
        double rateMax = 1e3;
        double vLow = -110.0;
        double vHigh = 50.0;
        /** @brief Number of points in the shared sweep over [vLow, vHigh]. */
        int discretisation = 33;
    };

    /**
     * @brief Validates original-space parameter vectors against absolute bounds and
     *        rate bounds.
     *
     * Both kinds of bounds can be replaced or switched off between cost calls; every
     * check reads the current configuration, nothing is memoised.
     */
    class BoundsChecker {
    public:
        /**
         * @param nParameters Length of the vectors being checked.
         */
        explicit BoundsChecker(int nParameters);

        /**
         * @brief Sets absolute bounds in original space and enables them.
         *
         * @throws InvalidParameterException If a vector has the wrong length.
         * @throws ConfigurationException If a bound is NaN or lower > upper.
         */
        void setParameterBounds(const Eigen::VectorXd& lowerBounds, const Eigen::VectorXd& upperBounds);

        /** @brief Drops the absolute bounds altogether. */
        void clearParameterBounds();

        /**
         * @brief Toggles bound checking without discarding the stored bounds.
         * @throws ConfigurationException If enabling with no bounds stored.
         */
        void setBounded(bool bounded);
        bool isBounded() const { return bounded_; }

        /**
         * @brief Sets rate bounds and enables them.
         * @throws ConfigurationException If rateMin > rateMax, vLow > vHigh, a rate function
         *         is empty, or the shared sweep has fewer than one point.
         */
        void setRateBounds(RateBounds rateBounds);
        void setRateBounded(bool rateBounded);
        bool isRateBounded() const { return rateBounded_; }

        /**
         * @brief True iff lb[i] <= p[i] <= ub[i] for every i, or no bounds are active.
         * @throws InvalidParameterException If the vector has the wrong length.
         */
        bool inParameterBounds(const Eigen::VectorXd& original) const;

        /**
         * @brief True iff every rate function lies within [rateMin, rateMax] at every
         *        voltage of its grid, or no rate bounds are active. A NaN rate fails.
         */
        bool inRateBounds(const Eigen::VectorXd& original) const;

        /** @brief Both parameter and rate bounds pass. */
        bool isFeasible(const Eigen::VectorXd& original) const;

        /**
         * @brief Clips every component to [lb, ub]. Identity when unbounded.
         */
        Eigen::VectorXd clamp(const Eigen::VectorXd& original) const;

        /** @brief Lower bounds; -inf everywhere when none are stored. */
        Eigen::VectorXd lowerBounds() const;
        /** @brief Upper bounds; +inf everywhere when none are stored. */
        Eigen::VectorXd upperBounds() const;

        /** @brief Shared voltage sweep over [vLow, vHigh]. */
        std::vector<double> sweepVoltages() const;

        const std::optional<RateBounds>& rateBounds() const { return rateBounds_; }

    private:
        int nParameters_;
        bool bounded_ = false;
        bool rateBounded_ = false;
        Eigen::VectorXd lb_;
        Eigen::VectorXd ub_;
        std::optional<RateBounds> rateBounds_;

        void checkLength(const Eigen::VectorXd& v, const char* functionName) const;
    };

} // namespace ionbench

#endif // BOUNDS_CHECKER_HPP
