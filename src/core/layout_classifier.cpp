#include "layout_classifier.h"

#include <mutex>

namespace quilt::core {

namespace {

std::mt19937& process_engine() {
    static std::mt19937 engine{std::random_device{}()};
    return engine;
}

std::mutex& process_engine_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

bool RandomCoinFlip::flip() {
    std::scoped_lock lock(process_engine_mutex());
    std::bernoulli_distribution coin(0.5);
    return coin(process_engine());
}

bool SeededCoinFlip::flip() {
    std::bernoulli_distribution coin(0.5);
    return coin(engine_);
}

LayoutChoice classify_layout(const std::array<double, 4>& r, CoinFlip& coin) {
    if (r[0] > k_all_wide_min_ratio) {
        return {LayoutKind::Layout4D, false};
    }
    if (r[2] < k_three_tall_max_ratio) {
        return {LayoutKind::Layout3A, true};
    }
    if (r[0] <= k_one_tall_max_ratio && r[1] > k_one_tall_others_min_ratio) {
        return {LayoutKind::Layout4C, false};
    }
    // Half of the qualifying sets get 4B, the rest fall through to 4A.
    if (r[1] <= k_two_tall_max_ratio && r[2] > k_two_wide_min_ratio && coin.flip()) {
        return {LayoutKind::Layout4B, false};
    }
    return {LayoutKind::Layout4A, false};
}

} // namespace quilt::core
