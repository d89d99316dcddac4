#pragma once

#include "layout_types.h"

#include <array>
#include <string>
#include <vector>

namespace quilt::core {

// Each function expects ratios sorted ascending. The last rectangle of every
// row or column is sized by subtraction so spans add up to total_width exactly.
LayoutPlan layout_4a(const std::array<double, 4>& ratios, const LayoutParameters& params);
LayoutPlan layout_4b(const std::array<double, 4>& ratios, const LayoutParameters& params);
LayoutPlan layout_4c(const std::array<double, 4>& ratios, const LayoutParameters& params);
LayoutPlan layout_4d(const std::array<double, 4>& ratios, const LayoutParameters& params);
LayoutPlan layout_3a(const std::array<double, 3>& ratios, const LayoutParameters& params);

bool compute_layout(LayoutKind kind,
                    const std::vector<double>& ratios,
                    const LayoutParameters& params,
                    LayoutPlan& out,
                    std::string& error);

bool validate_layout_parameters(const LayoutParameters& params, std::string& error);

// Rectangles must be positive, inside the canvas and non-overlapping once
// their borders are included.
bool validate_plan(const LayoutPlan& plan, const LayoutParameters& params, std::string& error);

int plan_canvas_height(const LayoutPlan& plan, const LayoutParameters& params);

const char* layout_kind_name(LayoutKind kind);
bool parse_layout_kind(const std::string& value, LayoutKind& out);
size_t layout_image_count(LayoutKind kind);

} // namespace quilt::core
