#include "probing_table.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

ProbingTable::ProbingTable(std::int64_t capacity, double load_border)
    : load_border_(load_border), sz_(0)
{
    if (capacity <= 0)
        throw InvalidArgument("capacity", "Illegal initial capacity : " + std::to_string(capacity));
    // negated form also rejects NaN
    if (!(load_border >= kMinLoadBorder && load_border <= kMaxLoadBorder))
        throw InvalidArgument("loadBorder", "Illegal load border : " + std::to_string(load_border));
    table_.assign(static_cast<std::size_t>(capacity), Slot{});
}

std::optional<ProbingTable::Val> ProbingTable::put(Key k, Val v)
{
    // First pass honours the load border; later passes are forced growths
    // after the probe path came back full.
    for (int attempt = 0; attempt <= kMaxForcedGrowths; ++attempt)
    {
        check_capacity_(sz_ + 1, attempt > 0);
        Val prev = 0;
        switch (insert_no_resize_(k, v, prev))
        {
        case PutResult::Inserted:
            return std::nullopt;
        case PutResult::Updated:
            return prev;
        case PutResult::Full:
            break;
        }
    }
    throw std::length_error("ProbingTable: probe path still full after " +
                            std::to_string(kMaxForcedGrowths) + " forced growths");
}

std::optional<ProbingTable::Val> ProbingTable::get(Key k) const
{
    const std::size_t cap = capacity();
    const Hashes h = hash_(k);
    std::size_t i = h.main % cap;
    for (std::size_t probes = 0; probes < cap; ++probes, i = (i + h.step) % cap)
    {
        const Slot &s = table_[i];
        if (!s.occ)
            return std::nullopt; // empty stop
        if (s.k == k)
            return s.v;
    }
    return std::nullopt;
}

ProbingTable::Hashes ProbingTable::hash_(Key k) const
{
    // |INT32_MIN| is 2^31: widen before negating.
    const std::uint32_t mag = k < 0 ? static_cast<std::uint32_t>(-static_cast<std::int64_t>(k))
                                    : static_cast<std::uint32_t>(k);
    // Secondary hash treats INT32_MIN as INT32_MIN + 1.
    const std::uint32_t mag2 = (k == std::numeric_limits<Key>::min()) ? mag - 1 : mag;

    const std::size_t cap = capacity();
    Hashes h;
    h.main = mag;
    h.step = cap > 1 ? mag2 % (cap - 1) + 1 : 1; // step in [1, cap - 1]
    return h;
}

ProbingTable::PutResult ProbingTable::insert_no_resize_(Key k, Val v, Val &prev)
{
    const std::size_t cap = capacity();
    const Hashes h = hash_(k);
    std::size_t i = h.main % cap;
    for (std::size_t probes = 0; probes < cap; ++probes, i = (i + h.step) % cap)
    {
        Slot &s = table_[i];
        if (!s.occ)
        {
            s = Slot{k, v, true};
            ++sz_;
            return PutResult::Inserted;
        }
        if (s.k == k)
        {
            prev = s.v;
            s.v = v;
            return PutResult::Updated;
        }
    }
    // Step shares a factor with cap: the cycle never reached a free slot.
    return PutResult::Full;
}

void ProbingTable::check_capacity_(std::size_t needed, bool forced)
{
    const std::size_t cap = capacity();
    if (forced)
    {
        resize_(std::max(needed, cap));
        return;
    }
    const double n = static_cast<double>(needed);
    if (n > static_cast<double>(cap) * load_border_)
    {
        if (n > static_cast<double>(cap * kGrowMultiplier) * load_border_)
            resize_(static_cast<std::size_t>(std::ceil(n / load_border_)));
        else
            resize_(cap);
    }
}

void ProbingTable::resize_(std::size_t base)
{
    if (base > std::numeric_limits<std::size_t>::max() / kGrowMultiplier)
        throw std::length_error("ProbingTable: capacity overflow");

    std::vector<Slot> old(base * kGrowMultiplier);
    table_.swap(old);
    sz_ = 0;
    // Reinsert through put(): the step depends on capacity, so slots are never
    // copied raw. A nested resize swaps table_ again; this loop keeps feeding it.
    for (const Slot &s : old)
        if (s.occ)
            put(s.k, s.v);
}
