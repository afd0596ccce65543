#include "benchmarker/caching/CostCache.hpp"
#include <sstream>

namespace ionbench {

std::string CostCache::createCacheKey(const Eigen::VectorXd& inputParameters) const {
    std::ostringstream oss;
    oss << std::hexfloat;
    for (Eigen::Index i = 0; i < inputParameters.size(); ++i) {
        oss << inputParameters[i];
        if (i < inputParameters.size() - 1) {
            oss << "_";
        }
    }
    return oss.str();
}

std::optional<double> CostCache::get(const Eigen::VectorXd& inputParameters) {
    auto it = cache_.find(createCacheKey(inputParameters));
    if (it == cache_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void CostCache::set(const Eigen::VectorXd& inputParameters, double cost) {
    // Write-once per key: a repeated candidate always reports its first cost.
    cache_.emplace(createCacheKey(inputParameters), cost);
}

void CostCache::clear() {
    cache_.clear();
    hits_ = 0;
    misses_ = 0;
}

std::size_t CostCache::size() const {
    return cache_.size();
}

} // namespace ionbench
