/// @file src/portfolio/covariance_cache.cpp
/// @brief CovarianceCache lookup, re-indexing and eviction.

#include "qsae/covariance_cache.hpp"

#include <algorithm>

namespace qsae::portfolio {

namespace {

std::vector<std::string> sorted_symbols(std::vector<std::string> symbols) {
    std::sort(symbols.begin(), symbols.end());
    return symbols;
}

/// Copy of `entry` permuted into the order of `symbols`.  Both must hold the
/// same symbol set.
CovarianceCache::Entry reorder(const CovarianceCache::Entry&   entry,
                               const std::vector<std::string>& symbols) {
    if (entry.symbols == symbols) return entry;

    const std::size_t n = symbols.size();
    std::vector<Eigen::Index> from(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto it = std::find(entry.symbols.begin(), entry.symbols.end(), symbols[i]);
        from[i] = static_cast<Eigen::Index>(it - entry.symbols.begin());
    }

    CovarianceCache::Entry out;
    out.symbols = symbols;
    out.estimates.reserve(n);
    out.correlation.resize(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
    out.covariance.resize(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));

    for (std::size_t i = 0; i < n; ++i) {
        out.estimates.push_back(entry.estimates[static_cast<std::size_t>(from[i])]);
        for (std::size_t j = 0; j < n; ++j) {
            const auto oi = static_cast<Eigen::Index>(i);
            const auto oj = static_cast<Eigen::Index>(j);
            out.correlation(oi, oj) = entry.correlation(from[i], from[j]);
            out.covariance(oi, oj)  = entry.covariance(from[i], from[j]);
        }
    }
    return out;
}

}  // namespace

CovarianceCache::CovarianceCache(Timestamp bucket_ms, std::size_t capacity)
    : bucket_ms_(bucket_ms > 0 ? bucket_ms : constants::DEFAULT_CACHE_BUCKET_MS)
    , capacity_(std::max<std::size_t>(capacity, 1)) {}

long long CovarianceCache::bucket_of(Timestamp as_of) const noexcept {
    // Floor division so negative timestamps bucket consistently.
    long long b = as_of / bucket_ms_;
    if (as_of % bucket_ms_ < 0) --b;
    return b;
}

std::optional<CovarianceCache::Entry>
CovarianceCache::find(const std::vector<std::string>& symbols, Timestamp as_of) {
    const auto it = entries_.find(Key{bucket_of(as_of), sorted_symbols(symbols)});
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return reorder(it->second, symbols);
}

void CovarianceCache::insert(Entry entry, Timestamp as_of) {
    const long long bucket = bucket_of(as_of);

    std::erase_if(entries_, [bucket](const auto& kv) { return kv.first.first < bucket; });

    Key key{bucket, sorted_symbols(entry.symbols)};
    if (!entries_.contains(key) && entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

void CovarianceCache::clear() noexcept {
    entries_.clear();
    hits_   = 0;
    misses_ = 0;
}

}  // namespace qsae::portfolio
