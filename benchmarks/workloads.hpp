#pragma once
#include <cstdint>
#include <string>
#include <chrono>
#include <iostream>
#include <vector>

#include "datasets.hpp"
#include "../src/probing_table.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

// timing helper
template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string ds, impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "ds,impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.ds << "," << r.impl << "," << r.workload << "," << r.N << "," << r.dist << ","
              << r.params << "," << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

inline std::int32_t miss_key(std::int32_t k) { return static_cast<std::int32_t>(static_cast<std::uint32_t>(k) ^ 0xabcdefu); }

// ProbingTable: put all keys, then mixed gets (50% successful).
// params records the growth the table went through.
inline Row run_table_ops(std::size_t N, Dist dist, int trial, std::uint64_t seed,
                         std::int64_t capacity, double load)
{
    Sink s;
    ProbingTable t(capacity, load);
    auto keys = gen_keys(N, dist, seed);
    std::uint64_t ns = time_ns([&]
                               {
        for (auto k: keys) t.put(k, static_cast<std::int64_t>(k) ^ 0xdeadbeefLL);
        for (std::size_t i=0;i<N;++i){
            auto q = (i%2==0) ? keys[i] : miss_key(keys[i]);
            auto r = t.get(q);
            s.eat(r ? static_cast<std::uint64_t>(*r) : 0x1234ULL);
        } });
    std::string params = "init=" + std::to_string(capacity) + ";load=" + std::to_string(load) +
                         ";final_cap=" + std::to_string(t.capacity()) + ";size=" + std::to_string(t.size());
    Row r{"hash", "probing_table", "put+mixed_get", dist_name(dist), params, N, trial, seed, ns, s.acc};
    return r;
}
