#include "ratio_sort.h"

#include <algorithm>

namespace quilt::core {

bool ratio_less(const Image& a, const Image& b) {
    // a.w / a.h < b.w / b.h without the division
    return static_cast<long long>(a.w) * b.h < static_cast<long long>(b.w) * a.h;
}

void sort_by_ratio(std::vector<Image>& images) {
    std::sort(images.begin(), images.end(), ratio_less);
}

std::vector<double> ratios_of(const std::vector<Image>& images) {
    std::vector<double> ratios;
    ratios.reserve(images.size());
    for (const auto& image : images) {
        ratios.push_back(image.ratio());
    }
    return ratios;
}

} // namespace quilt::core
