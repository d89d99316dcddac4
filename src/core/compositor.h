#pragma once

#include "canvas.h"
#include "image.h"
#include "layout_types.h"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace quilt::core {

constexpr int k_default_jpeg_quality = 75;

// images[i] goes into plan.rects[i]. The canvas is sized to the plan: total
// width by the lowest rectangle plus the trailing padding and border.
bool compose(const LayoutPlan& plan,
             const std::vector<Image>& images,
             const LayoutParameters& params,
             Canvas& out,
             std::string& error);

// Replaces an existing file at path.
bool write_jpeg(const Canvas& canvas, const std::filesystem::path& path, int quality, std::string& error);
bool write_jpeg(const Canvas& canvas, std::ostream& out, int quality, std::string& error);

} // namespace quilt::core
