#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Thrown by ProbingTable's constructor; param() names the rejected argument.
class InvalidArgument : public std::invalid_argument
{
public:
    InvalidArgument(std::string param, const std::string &what)
        : std::invalid_argument(what), param_(std::move(param)) {}

    const std::string &param() const noexcept { return param_; }

private:
    std::string param_;
};

// Open-addressing map int32 -> int64 with double hashing.
// Grows 2x (or straight to the needed size) once size would pass load_border.
// No erase, no iteration, not thread safe.
class ProbingTable
{
public:
    using Key = std::int32_t;
    using Val = std::int64_t;

    static constexpr std::int64_t kDefaultCapacity = 16;
    static constexpr double kDefaultLoadBorder = 0.75;
    static constexpr double kMinLoadBorder = 0.4;
    static constexpr double kMaxLoadBorder = 1.0;
    static constexpr std::size_t kGrowMultiplier = 2;
    // Consecutive forced growths a single put may trigger before giving up.
    static constexpr int kMaxForcedGrowths = 8;

    explicit ProbingTable(std::int64_t capacity = kDefaultCapacity,
                          double load_border = kDefaultLoadBorder);

    // Inserts or overwrites; returns the previous value if the key was present.
    std::optional<Val> put(Key k, Val v);

    std::optional<Val> get(Key k) const;

    std::size_t size() const { return sz_; }
    std::size_t capacity() const { return table_.size(); }
    double load_border() const { return load_border_; }

private:
    struct Slot
    {
        Key k = 0;
        Val v = 0;
        bool occ = false;
    };

    struct Hashes
    {
        std::size_t main;
        std::size_t step;
    };

    enum class PutResult
    {
        Inserted,
        Updated,
        Full
    };

    // Depends on capacity(): must be recomputed after every resize.
    Hashes hash_(Key k) const;

    PutResult insert_no_resize_(Key k, Val v, Val &prev);
    void check_capacity_(std::size_t needed, bool forced);
    void resize_(std::size_t base);

    double load_border_;
    std::size_t sz_;
    std::vector<Slot> table_;
};
