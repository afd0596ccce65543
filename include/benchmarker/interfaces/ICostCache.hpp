#ifndef I_COST_CACHE_HPP
#define I_COST_CACHE_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <optional>
#include <string>

namespace ionbench {

/**
 * @brief Interface for memoising costs keyed on exact input-space vectors.
 */
class ICostCache {
public:
    virtual ~ICostCache() = default;

    /** @brief Cached cost for @p inputParameters, if any. */
    virtual std::optional<double> get(const Eigen::VectorXd& inputParameters) = 0;

    /** @brief Stores a cost. An existing entry for the same key is left unchanged. */
    virtual void set(const Eigen::VectorXd& inputParameters, double cost) = 0;

    virtual void clear() = 0;
    virtual std::size_t size() const = 0;

    /** @brief The key under which @p inputParameters is stored. */
    virtual std::string createCacheKey(const Eigen::VectorXd& inputParameters) const = 0;
};

} // namespace ionbench

#endif // I_COST_CACHE_HPP
