#pragma once
#include <vector>
#include <random>
#include <cstdint>
#include <cmath>
#include <algorithm>

enum class Dist
{
    Uniform,
    Zipf
};

inline const char *dist_name(Dist d) { return d == Dist::Uniform ? "uniform" : "zipf"; }

// Uniform over the full int32 range, so INT32_MIN and negatives show up.
inline std::vector<std::int32_t>
gen_uniform(std::size_t n, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::int32_t> d;
    std::vector<std::int32_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(d(rng));
    return v;
}

// Zipf(s) over ranks [1..n]; rank k is mapped to a signed key so hot keys
// repeat (exercising overwrite) and spread over both signs.
inline std::vector<std::int32_t>
gen_zipf(std::size_t n, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> cdf(n + 1, 0.0);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= n; ++k)
        cdf[k] /= cdf[n];

    std::vector<std::int32_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double u = U(rng);
        std::size_t k = std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin();
        std::uint32_t mixed = static_cast<std::uint32_t>(k * 2654435761u);
        out.push_back(static_cast<std::int32_t>(mixed));
    }
    return out;
}

inline std::vector<std::int32_t> gen_keys(std::size_t n, Dist dist, std::uint64_t seed)
{
    return (dist == Dist::Uniform) ? gen_uniform(n, seed) : gen_zipf(n, 1.2, seed);
}
