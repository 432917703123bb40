/* ===================================================================== *
 *  src/ZeroPointCache.cpp
 * ===================================================================== */
#include "sedphot/ZeroPointCache.hpp"
#include "sedphot/Photometry.hpp"

#include <functional>

namespace sedphot {

namespace {

template<typename T>
inline void hash_combine(std::size_t& seed, const T& v)
{
    seed ^= std::hash<T>{}(v) +
            0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // unnamed namespace

std::size_t filter_hash(const FilterCurve& filter)
{
    std::size_t seed = 0xF117E5ULL;
    hash_combine(seed, static_cast<std::size_t>(filter.wave.size()));
    for (Index i = 0; i < filter.wave.size(); ++i) {
        hash_combine(seed, filter.wave[i]);
        hash_combine(seed, i < filter.trans.size() ? filter.trans[i] : 0.0);
    }
    return seed;
}

/* -------- singleton -------------------------------------------------- */
ZeroPointCache& ZeroPointCache::instance()
{
    static ZeroPointCache inst;
    return inst;
}

/* -------- lookup ----------------------------------------------------- */
Real ZeroPointCache::get(const FilterCurve& filter)
{
    const std::size_t key      = filter_hash(filter);
    const Index       n_points = filter.size();
    {
        std::unique_lock lk(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end() && it->second.n_points == n_points) {
            touch_(it);
            return it->second.flux_ab0;
        }
    }

    /* integrate outside any lock */
    const Real value = flux_ab0_at_10pc(filter);

    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        if (it->second.n_points == n_points) {      // another thread got there first
            touch_(it);
            return it->second.flux_ab0;
        }
        erase_(it);                                 // colliding curve
    }
    auto lru_it = lru_.insert(lru_.begin(), key);           // MRU front
    cache_.try_emplace(key, Node{value, n_points, lru_it});
    evict_if_needed_();
    return value;
}

bool ZeroPointCache::contains(const FilterCurve& filter) const
{
    std::shared_lock lk(mtx_);
    auto it = cache_.find(filter_hash(filter));
    return it != cache_.end() && it->second.n_points == filter.size();
}

/* -------- simple helpers -------------------------------------------- */
void ZeroPointCache::set_capacity(std::size_t n)
{
    std::unique_lock lk(mtx_);
    max_entries_ = (n == 0) ? 1 : n;
    evict_if_needed_();
}

void ZeroPointCache::clear()
{
    std::unique_lock lk(mtx_);
    cache_.clear();
    lru_.clear();
}

std::size_t ZeroPointCache::size() const
{
    std::shared_lock lk(mtx_);
    return cache_.size();
}

/* ===================================================================== *
 *            internal L-R-U helpers (private)
 * ===================================================================== */
void ZeroPointCache::touch_(Map::iterator it)
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}

void ZeroPointCache::erase_(Map::iterator it)
{
    lru_.erase(it->second.lru_pos);
    cache_.erase(it);
}

void ZeroPointCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        std::size_t victim = lru_.back();
        lru_.pop_back();
        cache_.erase(victim);
    }
}

} // namespace sedphot
