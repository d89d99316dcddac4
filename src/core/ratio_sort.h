#pragma once

#include "image.h"

#include <vector>

namespace quilt::core {

bool ratio_less(const Image& a, const Image& b);

// Ascending by w / h. Equal ratios keep no particular order.
void sort_by_ratio(std::vector<Image>& images);

std::vector<double> ratios_of(const std::vector<Image>& images);

} // namespace quilt::core
