#ifndef COST_CACHE_HPP
#define COST_CACHE_HPP

#include "benchmarker/interfaces/ICostCache.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace ionbench {

/**
 * @brief Unbounded ICostCache keyed on the exact bit pattern of each coordinate.
 *
 * Keys are built with std::hexfloat, so two vectors share an entry only if every
 * coordinate is identical. Numerically close vectors that round differently are
 * distinct entries. Entries live until clear().
 */
class CostCache : public ICostCache {
public:
    CostCache() = default;

    std::optional<double> get(const Eigen::VectorXd& inputParameters) override;
    void set(const Eigen::VectorXd& inputParameters, double cost) override;
    void clear() override;
    std::size_t size() const override;
    std::string createCacheKey(const Eigen::VectorXd& inputParameters) const override;

    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

private:
    /** @brief Key to cached cost. */
    std::unordered_map<std::string, double> cache_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace ionbench

#endif // COST_CACHE_HPP
