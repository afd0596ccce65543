#ifndef SBX_CROSSOVER_HPP
#define SBX_CROSSOVER_HPP

#include "optimisers/interfaces/ICrossoverOperator.hpp"

namespace ionbench {

/**
 * @brief Simulated binary crossover (Deb and Agrawal) with bounds.
 *
 * With probability @c prob a pair is recombined; each variable is then crossed with
 * probability @c probVar. The spread factor distribution is truncated so that offspring
 * stay inside finite bounds. Infinite bounds reduce it to the unbounded form.
 */
class SBXCrossover : public ICrossoverOperator {
public:
    /**
     * @param eta Distribution index. Larger values keep offspring closer to their parents.
     * @param prob Probability that a pair is recombined at all.
     * @param probVar Probability that each variable is recombined.
     * @throws InvalidParameterException If eta < 0 or a probability lies outside [0, 1].
     */
    explicit SBXCrossover(double eta = 15.0, double prob = 0.9, double probVar = 0.5);

    std::pair<Eigen::VectorXd, Eigen::VectorXd> cross(const Eigen::VectorXd& parent1,
                                                      const Eigen::VectorXd& parent2,
                                                      const Eigen::VectorXd& lower,
                                                      const Eigen::VectorXd& upper,
                                                      std::mt19937& rng) const override;

    double eta() const { return eta_; }

private:
    double eta_;
    double prob_;
    double probVar_;

    double spreadFactor(double beta, double u) const;
};

} // namespace ionbench

#endif // SBX_CROSSOVER_HPP
