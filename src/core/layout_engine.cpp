#include "layout_engine.h"

#include "cli_parse.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace quilt::core {

namespace {

constexpr double k_max_extent = static_cast<double>(std::numeric_limits<int>::max());

// compute_layout rejects inputs whose extent leaves int range; the clamp only
// keeps direct calls to the layout functions well defined.
int round_px(double value) {
    return static_cast<int>(std::lround(std::clamp(value, -k_max_extent, k_max_extent)));
}

// Distance from the canvas edge to the first image area.
int outer_offset(const LayoutParameters& p) {
    return p.padding + p.border_width;
}

// Distance between the image areas of two neighbours.
int gap(const LayoutParameters& p) {
    return p.padding + 2 * p.border_width;
}

Rect border_box(const Rect& r, int border_width) {
    return {r.x - border_width, r.y - border_width, r.w + 2 * border_width, r.h + 2 * border_width};
}

bool rects_intersect(const Rect& a, const Rect& b) {
    return !(a.x + a.w <= b.x || b.x + b.w <= a.x ||
             a.y + a.h <= b.y || b.y + b.h <= a.y);
}

} // namespace

LayoutPlan layout_4a(const std::array<double, 4>& r, const LayoutParameters& p) {
    LayoutPlan plan;
    plan.kind = LayoutKind::Layout4A;
    plan.count = 4;
    auto& rects = plan.rects;

    const int o = outer_offset(p);
    const int g = gap(p);
    const int row_span = p.total_width - 3 * p.padding - 4 * p.border_width;

    // Both rows hold two images that share a height.
    const double h_top = row_span / (r[1] + r[2]);
    const double h_bottom = row_span / (r[3] + r[0]);

    rects[1] = {o, o, round_px(r[1] * h_top), round_px(h_top)};
    rects[2] = {rects[1].x + rects[1].w + g, rects[1].y, row_span - rects[1].w, rects[1].h};

    rects[3] = {o, rects[1].y + rects[1].h + g, round_px(r[3] * h_bottom), round_px(h_bottom)};
    rects[0] = {rects[3].x + rects[3].w + g, rects[3].y, row_span - rects[3].w, rects[3].h};
    return plan;
}

LayoutPlan layout_4b(const std::array<double, 4>& r, const LayoutParameters& p) {
    LayoutPlan plan;
    plan.kind = LayoutKind::Layout4B;
    plan.count = 4;
    auto& rects = plan.rects;

    const int o = outer_offset(p);
    const int g = gap(p);

    // Images 3 and 2 stacked at a common width behave like one picture with
    // this ratio, less the gap between them.
    const double middle_ratio = 1.0 / (1.0 / r[3] + 1.0 / r[2]);
    const double h1 = (p.total_width - 2 * p.padding - 2 * p.border_width + g * (middle_ratio - 2.0))
                      / (r[1] + r[0] + middle_ratio);
    const double h3 = (h1 - g) / (1.0 + r[3] / r[2]);

    rects[1] = {o, o, round_px(r[1] * h1), round_px(h1)};
    rects[3] = {rects[1].x + rects[1].w + g, rects[1].y, round_px(r[3] * h3), round_px(h3)};
    rects[2] = {rects[3].x, rects[3].y + rects[3].h + g, rects[3].w, rects[1].h - rects[3].h - g};
    rects[0] = {rects[2].x + rects[2].w + g,
                rects[1].y,
                p.total_width - rects[1].w - rects[3].w - 4 * p.padding - 6 * p.border_width,
                rects[1].h};
    return plan;
}

LayoutPlan layout_4c(const std::array<double, 4>& r, const LayoutParameters& p) {
    LayoutPlan plan;
    plan.kind = LayoutKind::Layout4C;
    plan.count = 4;
    auto& rects = plan.rects;

    const int o = outer_offset(p);
    const int g = gap(p);

    // The left column (1, 3, 2) shares one width; its effective ratio is the
    // harmonic combination of the three.
    const double inverse_sum = 1.0 / r[3] + 1.0 / r[2] + 1.0 / r[1];
    const double column_ratio = 1.0 / inverse_sum;
    const double h0 = (p.total_width - 2 * p.padding - 2 * p.border_width - g * (1.0 - 2.0 * column_ratio))
                      / (r[0] + column_ratio);
    const double h1 = (h0 - 2 * g) / (r[1] * (1.0 / r[3] + 1.0 / r[2]) + 1.0);
    const double h3 = h1 * r[1] / r[3];
    const double h2 = h0 - h1 - h3 - 2 * g;

    rects[1] = {o, o, round_px(r[1] * h1), round_px(h1)};
    rects[3] = {rects[1].x, rects[1].y + rects[1].h + g, rects[1].w, round_px(h3)};
    rects[2] = {rects[1].x, rects[3].y + rects[3].h + g, rects[1].w, round_px(h2)};
    rects[0] = {rects[1].x + rects[1].w + g,
                rects[1].y,
                p.total_width - rects[1].w - 3 * p.padding - 4 * p.border_width,
                rects[1].h + rects[3].h + rects[2].h + 2 * g};
    return plan;
}

LayoutPlan layout_4d(const std::array<double, 4>& r, const LayoutParameters& p) {
    LayoutPlan plan;
    plan.kind = LayoutKind::Layout4D;
    plan.count = 4;
    auto& rects = plan.rects;

    const int o = outer_offset(p);
    const int g = gap(p);
    const int row_width = p.total_width - 2 * p.padding - 2 * p.border_width;

    constexpr std::array<size_t, 4> k_row_order = {1, 3, 2, 0};
    int y = o;
    for (size_t index : k_row_order) {
        rects[index] = {o, y, row_width, round_px(row_width / r[index])};
        y += rects[index].h + g;
    }
    return plan;
}

LayoutPlan layout_3a(const std::array<double, 3>& r, const LayoutParameters& p) {
    LayoutPlan plan;
    plan.kind = LayoutKind::Layout3A;
    plan.count = 3;
    auto& rects = plan.rects;

    const int o = outer_offset(p);
    const int g = gap(p);
    const int row_span = p.total_width - 4 * p.padding - 6 * p.border_width;
    const double h = row_span / (r[0] + r[1] + r[2]);

    rects[1] = {o, o, round_px(r[1] * h), round_px(h)};
    rects[2] = {rects[1].x + rects[1].w + g, rects[1].y, round_px(r[2] * h), rects[1].h};
    rects[0] = {rects[2].x + rects[2].w + g, rects[1].y, row_span - rects[1].w - rects[2].w, rects[1].h};
    return plan;
}

bool compute_layout(LayoutKind kind,
                    const std::vector<double>& ratios,
                    const LayoutParameters& params,
                    LayoutPlan& out,
                    std::string& error) {
    const size_t expected = layout_image_count(kind);
    if (ratios.size() != expected) {
        error = std::string("layout ") + layout_kind_name(kind) + " needs " + std::to_string(expected)
                + " images, got " + std::to_string(ratios.size());
        return false;
    }
    for (double ratio : ratios) {
        if (!std::isfinite(ratio) || ratio <= 0.0) {
            error = "aspect ratios must be positive and finite";
            return false;
        }
    }
    if (!std::is_sorted(ratios.begin(), ratios.end())) {
        error = "aspect ratios must be sorted ascending";
        return false;
    }

    // Every coordinate and size stays below total_width * (2 + sum of r +
    // sum of 1/r); half the int range keeps x + w and y + h representable too.
    double extent = 2.0;
    for (double ratio : ratios) {
        extent += ratio + 1.0 / ratio;
    }
    extent *= static_cast<double>(params.total_width);
    if (!(extent < k_max_extent / 2.0)) {
        error = "layout size overflows: width " + std::to_string(params.total_width)
                + " is too large for these aspect ratios";
        return false;
    }

    if (kind == LayoutKind::Layout3A) {
        out = layout_3a({ratios[0], ratios[1], ratios[2]}, params);
        return true;
    }
    const std::array<double, 4> r = {ratios[0], ratios[1], ratios[2], ratios[3]};
    switch (kind) {
        case LayoutKind::Layout4A:
            out = layout_4a(r, params);
            return true;
        case LayoutKind::Layout4B:
            out = layout_4b(r, params);
            return true;
        case LayoutKind::Layout4C:
            out = layout_4c(r, params);
            return true;
        case LayoutKind::Layout4D:
            out = layout_4d(r, params);
            return true;
        case LayoutKind::Layout3A:
            break;
    }
    error = "unknown layout";
    return false;
}

bool validate_layout_parameters(const LayoutParameters& params, std::string& error) {
    if (params.total_width <= 0) {
        error = "width must be positive";
        return false;
    }
    if (params.padding < 0) {
        error = "padding must not be negative";
        return false;
    }
    if (params.border_width < 0) {
        error = "border width must not be negative";
        return false;
    }
    // Three columns (4B, 3A) need room for four paddings and six border strokes.
    const long long frame = 4LL * params.padding + 6LL * params.border_width;
    if (frame >= params.total_width) {
        error = "width " + std::to_string(params.total_width) + " leaves no room for images with padding "
                + std::to_string(params.padding) + " and border width " + std::to_string(params.border_width);
        return false;
    }
    return true;
}

bool validate_plan(const LayoutPlan& plan, const LayoutParameters& params, std::string& error) {
    if (plan.count != layout_image_count(plan.kind)) {
        error = "plan holds " + std::to_string(plan.count) + " rectangles for layout "
                + layout_kind_name(plan.kind);
        return false;
    }
    for (size_t i = 0; i < plan.count; ++i) {
        const Rect& rect = plan.rects[i];
        if (rect.w <= 0 || rect.h <= 0) {
            error = "image " + std::to_string(i) + " has an empty rectangle; width "
                    + std::to_string(params.total_width) + " is too small";
            return false;
        }
        const Rect outer = border_box(rect, params.border_width);
        if (outer.x < 0 || outer.y < 0 || outer.x + outer.w > params.total_width) {
            error = "image " + std::to_string(i) + " is outside the canvas";
            return false;
        }
    }
    for (size_t i = 0; i < plan.count; ++i) {
        for (size_t j = i + 1; j < plan.count; ++j) {
            if (rects_intersect(border_box(plan.rects[i], params.border_width),
                                border_box(plan.rects[j], params.border_width))) {
                error = "images " + std::to_string(i) + " and " + std::to_string(j) + " overlap";
                return false;
            }
        }
    }
    return true;
}

int plan_canvas_height(const LayoutPlan& plan, const LayoutParameters& params) {
    int bottom = 0;
    for (size_t i = 0; i < plan.count; ++i) {
        bottom = std::max(bottom, plan.rects[i].y + plan.rects[i].h);
    }
    return bottom + params.padding + params.border_width;
}

const char* layout_kind_name(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Layout4A:
            return "4a";
        case LayoutKind::Layout4B:
            return "4b";
        case LayoutKind::Layout4C:
            return "4c";
        case LayoutKind::Layout4D:
            return "4d";
        case LayoutKind::Layout3A:
            return "3a";
    }
    return "?";
}

bool parse_layout_kind(const std::string& value, LayoutKind& out) {
    const std::string lower = to_lower_copy(value);
    constexpr std::array<LayoutKind, 5> k_kinds = {
        LayoutKind::Layout4A, LayoutKind::Layout4B, LayoutKind::Layout4C,
        LayoutKind::Layout4D, LayoutKind::Layout3A,
    };
    for (LayoutKind kind : k_kinds) {
        if (lower == layout_kind_name(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

size_t layout_image_count(LayoutKind kind) {
    return kind == LayoutKind::Layout3A ? 3 : 4;
}

} // namespace quilt::core
