#pragma once
#include <unordered_map>
#include <cstdint>
#include <string>
#include "workloads.hpp" // for Row, Sink, Dist, time_ns, generators

// --- std::unordered_map ---
inline Row run_hash_stl_ops(std::size_t N, Dist dist, int trial, std::uint64_t seed, bool with_reserve, double load)
{
    Sink s;
    std::unordered_map<std::int32_t, std::int64_t> m;
    if (with_reserve)
        m.reserve(static_cast<std::size_t>(N / load)); // comparable load factor
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) m[k] = (static_cast<std::int64_t>(k) ^ 0xdeadbeefLL);
        for (std::size_t i=0;i<N;++i){
            auto q = (i%2==0) ? keys[i] : miss_key(keys[i]);
            auto it = m.find(q);
            s.eat(it==m.end()? 0x1234ULL : static_cast<std::uint64_t>(it->second));
        } });
    Row r{"hash", "stl", with_reserve ? "put+mixed_get(reserve)" : "put+mixed_get",
          dist_name(dist), "", N, trial, seed, ns, s.acc};
    return r;
}
