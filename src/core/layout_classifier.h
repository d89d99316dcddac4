#pragma once

#include "layout_types.h"

#include <array>
#include <cstdint>
#include <random>

namespace quilt::core {

// One fair binary outcome per call.
class CoinFlip {
public:
    virtual ~CoinFlip() = default;
    virtual bool flip() = 0;
};

// Draws from a process-wide generator seeded once from std::random_device.
class RandomCoinFlip : public CoinFlip {
public:
    bool flip() override;
};

class SeededCoinFlip : public CoinFlip {
public:
    explicit SeededCoinFlip(uint32_t seed) : engine_(seed) {}
    bool flip() override;

private:
    std::mt19937 engine_;
};

struct LayoutChoice {
    LayoutKind kind = LayoutKind::Layout4A;
    // Only set for 3A: the widest image (sorted index 3) is left out.
    bool drop_widest = false;
};

constexpr double k_all_wide_min_ratio = 2.0;
constexpr double k_three_tall_max_ratio = 0.8;
constexpr double k_one_tall_max_ratio = 1.0;
constexpr double k_one_tall_others_min_ratio = 1.2;
constexpr double k_two_tall_max_ratio = 1.0;
constexpr double k_two_wide_min_ratio = 1.3;

// Ratios must be sorted ascending. The coin is flipped only when the set
// qualifies for 4B, and then exactly once.
LayoutChoice classify_layout(const std::array<double, 4>& ratios, CoinFlip& coin);

} // namespace quilt::core
