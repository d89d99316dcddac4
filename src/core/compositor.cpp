#include "compositor.h"

#include "layout_engine.h"

#include <system_error>
#include <utility>

#include <stb_image_write.h>

namespace quilt::core {

namespace fs = std::filesystem;

namespace {

constexpr int k_min_jpeg_quality = 1;
constexpr int k_max_jpeg_quality = 100;

bool check_quality(int quality, std::string& error) {
    if (quality < k_min_jpeg_quality || quality > k_max_jpeg_quality) {
        error = "JPEG quality must be between 1 and 100, got " + std::to_string(quality);
        return false;
    }
    return true;
}

} // namespace

bool compose(const LayoutPlan& plan,
             const std::vector<Image>& images,
             const LayoutParameters& params,
             Canvas& out,
             std::string& error) {
    if (images.size() != plan.count) {
        error = "layout " + std::string(layout_kind_name(plan.kind)) + " has " + std::to_string(plan.count)
                + " rectangles for " + std::to_string(images.size()) + " images";
        return false;
    }
    if (!validate_plan(plan, params, error)) {
        return false;
    }

    Canvas canvas;
    if (!create_canvas(params.total_width, plan_canvas_height(plan, params), params.background_color, canvas, error)) {
        return false;
    }

    const int b = params.border_width;
    for (size_t i = 0; i < plan.count; ++i) {
        const Rect& r = plan.rects[i];
        if (b > 0) {
            fill_rect(canvas, r.x - b, r.y - b, r.w + 2 * b, r.h + 2 * b, params.border_color);
        }
        if (!draw_resampled(canvas, images[i], r, error)) {
            return false;
        }
    }

    out = std::move(canvas);
    return true;
}

bool write_jpeg(const Canvas& canvas, const fs::path& path, int quality, std::string& error) {
    if (!check_quality(quality, error)) {
        return false;
    }
    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!fs::remove(path, ec) || ec) {
            error = "failed to replace '" + path.string() + "': " + ec.message();
            return false;
        }
    }
    if (stbi_write_jpg(path.string().c_str(), canvas.width, canvas.height, k_num_channels,
                       canvas.pixels.data(), quality) == 0) {
        error = "failed to write JPEG '" + path.string() + "'";
        return false;
    }
    return true;
}

bool write_jpeg(const Canvas& canvas, std::ostream& out, int quality, std::string& error) {
    if (!check_quality(quality, error)) {
        return false;
    }
    auto write_callback = [](void* context, void* data, int size) {
        auto* stream = static_cast<std::ostream*>(context);
        stream->write(static_cast<char*>(data), size);
    };
    if (stbi_write_jpg_to_func(write_callback, &out, canvas.width, canvas.height, k_num_channels,
                               canvas.pixels.data(), quality) == 0) {
        error = "failed to encode JPEG";
        return false;
    }
    out.flush();
    if (!out) {
        error = "failed to write JPEG stream";
        return false;
    }
    return true;
}

} // namespace quilt::core
