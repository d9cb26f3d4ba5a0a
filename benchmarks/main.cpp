#include <iostream>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include "workloads.hpp"
#include "workloads_stl.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

struct Args
{
    std::vector<std::size_t> sizes{128, 1024, 8192, 65536, 524288, 4194304};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
    std::int64_t capacity = ProbingTable::kDefaultCapacity;
    double load = ProbingTable::kDefaultLoadBorder;
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        { if (i+1<argc){ out = argv[++i]; } };
        if (s == "--trials")
        {
            std::string v;
            next(v);
            a.trials = std::stoi(v);
        }
        else if (s == "--dist")
        {
            std::string v;
            next(v);
            a.dist = (v == "zipf") ? Dist::Zipf : Dist::Uniform;
        }
        else if (s == "--seed")
        {
            std::string v;
            next(v);
            a.seed0 = std::stoull(v);
        }
        else if (s == "--capacity")
        {
            std::string v;
            next(v);
            a.capacity = std::stoll(v);
        }
        else if (s == "--load")
        {
            std::string v;
            next(v);
            a.load = std::stod(v);
        }
        else if (s == "--sizes")
        {
            std::string v;
            next(v);
            a.sizes.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.sizes.push_back(std::stoull(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
        // validate table parameters once, before any output
        ProbingTable check(a.capacity, a.load);
        (void)check;
    }
    catch (const InvalidArgument &e)
    {
        std::fprintf(stderr, "error: %s (%s)\n", e.what(), e.param().c_str());
        return 2;
    }
    catch (const std::logic_error &e)
    {
        // std::stoi and friends on a malformed flag value
        std::fprintf(stderr, "error: bad argument: %s\n", e.what());
        return 2;
    }

    print_metadata();
    std::fprintf(stderr, "# table: capacity=%lld load=%.3f\n", static_cast<long long>(a.capacity), a.load);
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            // ---- Custom ----
            print_row(run_table_ops(N, a.dist, trial, seed, a.capacity, a.load));

            // ---- STL baselines ----
            print_row(run_hash_stl_ops(N, a.dist, trial, seed, false, a.load));
            print_row(run_hash_stl_ops(N, a.dist, trial, seed, true, a.load));

            ++trial;
        }
    }
    return 0;
}
