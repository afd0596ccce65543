#include "optimisers/operators/SBXCrossover.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ionbench {

namespace {

constexpr double SAME_VALUE_TOLERANCE = 1e-14;

void checkOperands(const Eigen::VectorXd& p1, const Eigen::VectorXd& p2,
                   const Eigen::VectorXd& lower, const Eigen::VectorXd& upper, const char* functionName) {
    if (p2.size() != p1.size() || lower.size() != p1.size() || upper.size() != p1.size()) {
        THROW_INVALID_PARAM(functionName, "Parents and bounds must have the same length.");
    }
}

} // anonymous namespace

SBXCrossover::SBXCrossover(double eta, double prob, double probVar)
    : eta_(eta), prob_(prob), probVar_(probVar)
{
    if (eta_ < 0.0) {
        THROW_INVALID_PARAM("SBXCrossover::SBXCrossover", "Distribution index must be non-negative.");
    }
    if (prob_ < 0.0 || prob_ > 1.0 || probVar_ < 0.0 || probVar_ > 1.0) {
        THROW_INVALID_PARAM("SBXCrossover::SBXCrossover", "Probabilities must lie in [0, 1].");
    }
}

// beta is the distance to the nearer bound in units of half the parent gap. An
// infinite beta gives alpha = 2, the unbounded distribution.
double SBXCrossover::spreadFactor(double beta, double u) const {
    const double alpha = 2.0 - std::pow(beta, -(eta_ + 1.0));
    if (u <= 1.0 / alpha) {
        return std::pow(u * alpha, 1.0 / (eta_ + 1.0));
    }
    return std::pow(1.0 / (2.0 - u * alpha), 1.0 / (eta_ + 1.0));
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> SBXCrossover::cross(const Eigen::VectorXd& parent1,
                                                                const Eigen::VectorXd& parent2,
                                                                const Eigen::VectorXd& lower,
                                                                const Eigen::VectorXd& upper,
                                                                std::mt19937& rng) const {
    checkOperands(parent1, parent2, lower, upper, "SBXCrossover::cross");
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    Eigen::VectorXd child1 = parent1;
    Eigen::VectorXd child2 = parent2;
    if (unif(rng) > prob_) {
        return {child1.cwiseMax(lower).cwiseMin(upper), child2.cwiseMax(lower).cwiseMin(upper)};
    }

    for (Eigen::Index i = 0; i < parent1.size(); ++i) {
        if (unif(rng) > probVar_) {
            continue;
        }
        const double y1 = std::clamp(std::min(parent1[i], parent2[i]), lower[i], upper[i]);
        const double y2 = std::clamp(std::max(parent1[i], parent2[i]), lower[i], upper[i]);
        const double gap = y2 - y1;
        if (gap <= SAME_VALUE_TOLERANCE) {
            continue;
        }
        const double u = unif(rng);

        const double betaLow = 1.0 + 2.0 * (y1 - lower[i]) / gap;
        const double c1 = 0.5 * (y1 + y2 - spreadFactor(betaLow, u) * gap);
        const double betaHigh = 1.0 + 2.0 * (upper[i] - y2) / gap;
        const double c2 = 0.5 * (y1 + y2 + spreadFactor(betaHigh, u) * gap);

        const double lo = std::clamp(c1, lower[i], upper[i]);
        const double hi = std::clamp(c2, lower[i], upper[i]);
        if (unif(rng) <= 0.5) {
            child1[i] = hi;
            child2[i] = lo;
        } else {
            child1[i] = lo;
            child2[i] = hi;
        }
    }
    return {child1.cwiseMax(lower).cwiseMin(upper), child2.cwiseMax(lower).cwiseMin(upper)};
}

} // namespace ionbench
