/* ===================================================================== *
 *  include/sedphot/ZeroPointCache.hpp   ––  AB zero points per filter
 * ===================================================================== */
#pragma once
#include "Spectrum.hpp"

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <list>
#include <mutex>
#include <shared_mutex>

namespace sedphot {

/* content hash of a transmission curve (name ignored) */
std::size_t filter_hash(const FilterCurve& filter);

/*
 * Thread–safe bounded cache of  flux_ab0_at_10pc  values with  L-R-U
 * eviction.  Filters are immutable values, so a key never goes stale.
 *
 *   • Real get(filter)       – computes on miss, then remembers
 *   • bool contains(filter)
 *
 * Keys are 64-bit content hashes.  An entry whose stored sample count differs
 * from the filter being looked up is treated as a miss and replaced.
 */
class ZeroPointCache
{
public:
    static ZeroPointCache& instance();

    Real get(const FilterCurve& filter);
    bool contains(const FilterCurve& filter) const;

    /* ------------ house-keeping ------------------------------------ */
    void set_capacity(std::size_t n);
    void clear();
    std::size_t size() const;

private:
    ZeroPointCache() = default;

    using LruList = std::list<std::size_t>;                 // keys
    struct Node {
        Real              flux_ab0;
        Index             n_points;     // guards against hash collisions
        LruList::iterator lru_pos;
    };
    using Map = ankerl::unordered_dense::map<std::size_t, Node>;

    void touch_(Map::iterator it);
    void erase_(Map::iterator it);
    void evict_if_needed_();

    mutable std::shared_mutex mtx_;
    Map         cache_;
    LruList     lru_;
    std::size_t max_entries_ = 256;
};

} // namespace sedphot
