#pragma once

/// @file include/qsae/covariance_cache.hpp
/// @brief Caller-owned cache of optimizer estimates and covariance.
///
/// Entries are keyed by (sorted symbol set, time bucket) where the bucket is
/// `as_of / bucket_ms`.  Symbol order in the request does not matter: a hit
/// is re-indexed to the order the caller asks for.
///
/// Not synchronised; use one cache per thread.  A cache must only be shared
/// between optimizers configured with the same estimators.

#include "qsae/constants.hpp"
#include "qsae/estimators.hpp"
#include "qsae/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qsae::portfolio {

class CovarianceCache {
public:
    /// Cached estimation state for one universe, in the order of `symbols`.
    struct Entry {
        std::vector<std::string>   symbols;
        std::vector<AssetEstimate> estimates;
        Matrix                     correlation;
        Matrix                     covariance;
    };

    explicit CovarianceCache(Timestamp   bucket_ms = constants::DEFAULT_CACHE_BUCKET_MS,
                             std::size_t capacity  = 64);

    /// Look up `symbols` at `as_of`.  On a hit the entry is returned in the
    /// order of `symbols`.
    [[nodiscard]] std::optional<Entry>
    find(const std::vector<std::string>& symbols, Timestamp as_of);

    /// Store `entry` under its symbol set and the bucket of `as_of`.  Entries
    /// from earlier buckets are evicted first; if the cache is still full the
    /// oldest key is dropped.
    void insert(Entry entry, Timestamp as_of);

    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t hits() const noexcept { return hits_; }
    [[nodiscard]] std::size_t misses() const noexcept { return misses_; }
    [[nodiscard]] Timestamp bucket_ms() const noexcept { return bucket_ms_; }

private:
    using Key = std::pair<long long, std::vector<std::string>>;

    [[nodiscard]] long long bucket_of(Timestamp as_of) const noexcept;

    Timestamp              bucket_ms_;
    std::size_t            capacity_;
    std::map<Key, Entry>   entries_;
    std::size_t            hits_   = 0;
    std::size_t            misses_ = 0;
};

}  // namespace qsae::portfolio
