#include "canvas.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace quilt::core {

namespace {

constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr float MAX_CHANNEL_VALUE = 255.0f;

struct Tap {
    int index = 0;
    float weight = 0.0f;
};

// Source taps for one destination pixel along one axis.
struct Contribution {
    size_t first = 0;
    size_t count = 0;
};

struct AxisFilter {
    std::vector<Contribution> pixels;
    std::vector<Tap> taps;
};

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

AxisFilter build_axis_filter(int src_size, int dst_size) {
    AxisFilter filter;
    filter.pixels.resize(static_cast<size_t>(dst_size));
    const double scale = static_cast<double>(src_size) / static_cast<double>(dst_size);

    for (int d = 0; d < dst_size; ++d) {
        Contribution& c = filter.pixels[static_cast<size_t>(d)];
        c.first = filter.taps.size();
        if (scale > 1.0) {
            // Box filter: every source pixel weighted by how much of it the
            // destination pixel covers.
            const double start = d * scale;
            const double end = std::min(static_cast<double>(src_size), (d + 1) * scale);
            int s = static_cast<int>(std::floor(start));
            const int last = std::min(src_size - 1, static_cast<int>(std::ceil(end)) - 1);
            for (; s <= last; ++s) {
                const double covered = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
                if (covered > 0.0) {
                    filter.taps.push_back({s, static_cast<float>(covered / scale)});
                }
            }
        } else {
            const double center = std::clamp((d + 0.5) * scale - 0.5, 0.0, static_cast<double>(src_size - 1));
            const int left = static_cast<int>(std::floor(center));
            const int right = std::min(left + 1, src_size - 1);
            const auto frac = static_cast<float>(center - left);
            filter.taps.push_back({left, 1.0f - frac});
            if (right != left && frac > 0.0f) {
                filter.taps.push_back({right, frac});
            }
        }
        c.count = filter.taps.size() - c.first;
    }
    return filter;
}

unsigned char to_channel(float value) {
    return static_cast<unsigned char>(std::lround(std::clamp(value, 0.0f, MAX_CHANNEL_VALUE)));
}

} // namespace

bool create_canvas(int width, int height, const Color& background, Canvas& out, std::string& error) {
    if (width <= 0 || height <= 0) {
        error = "invalid canvas size " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixel_count)
        || !checked_mul_size_t(pixel_count, k_num_channels, byte_count)) {
        error = "canvas size is too large";
        return false;
    }
    out.width = width;
    out.height = height;
    out.pixels.resize(byte_count);
    fill_rect(out, 0, 0, width, height, background);
    return true;
}

void fill_rect(Canvas& canvas, int x, int y, int w, int h, const Color& color) {
    const int left = std::max(0, x);
    const int top = std::max(0, y);
    const int right = std::min(canvas.width, x + w);
    const int bottom = std::min(canvas.height, y + h);
    for (int py = top; py < bottom; ++py) {
        size_t offset = ((static_cast<size_t>(py) * static_cast<size_t>(canvas.width)) + static_cast<size_t>(left))
                        * k_num_channels;
        for (int px = left; px < right; ++px) {
            canvas.pixels[offset + CHANNEL_R] = color[0];
            canvas.pixels[offset + CHANNEL_G] = color[1];
            canvas.pixels[offset + CHANNEL_B] = color[2];
            canvas.pixels[offset + CHANNEL_A] = color[3];
            offset += k_num_channels;
        }
    }
}

bool draw_resampled(Canvas& canvas, const Image& source, const Rect& dest, std::string& error) {
    if (source.w <= 0 || source.h <= 0
        || source.pixels.size() < static_cast<size_t>(source.w) * static_cast<size_t>(source.h) * k_num_channels) {
        error = "source image '" + source.name + "' has no pixels";
        return false;
    }
    if (dest.w <= 0 || dest.h <= 0) {
        error = "empty destination for '" + source.name + "'";
        return false;
    }

    const AxisFilter horizontal = build_axis_filter(source.w, dest.w);
    const AxisFilter vertical = build_axis_filter(source.h, dest.h);

    // Horizontal pass into premultiplied floats, dest.w x source.h.
    std::vector<float> rows(static_cast<size_t>(dest.w) * static_cast<size_t>(source.h) * k_num_channels);
    for (int sy = 0; sy < source.h; ++sy) {
        const unsigned char* src_row = source.pixels.data()
                                       + static_cast<size_t>(sy) * static_cast<size_t>(source.w) * k_num_channels;
        float* out_row = rows.data() + static_cast<size_t>(sy) * static_cast<size_t>(dest.w) * k_num_channels;
        for (int dx = 0; dx < dest.w; ++dx) {
            const Contribution& c = horizontal.pixels[static_cast<size_t>(dx)];
            float r = 0.0f;
            float g = 0.0f;
            float b = 0.0f;
            float a = 0.0f;
            for (size_t t = c.first; t < c.first + c.count; ++t) {
                const Tap& tap = horizontal.taps[t];
                const unsigned char* px = src_row + static_cast<size_t>(tap.index) * k_num_channels;
                const float alpha = px[CHANNEL_A] / MAX_CHANNEL_VALUE;
                r += tap.weight * px[CHANNEL_R] * alpha;
                g += tap.weight * px[CHANNEL_G] * alpha;
                b += tap.weight * px[CHANNEL_B] * alpha;
                a += tap.weight * alpha;
            }
            float* out = out_row + static_cast<size_t>(dx) * k_num_channels;
            out[CHANNEL_R] = r;
            out[CHANNEL_G] = g;
            out[CHANNEL_B] = b;
            out[CHANNEL_A] = a;
        }
    }

    // Vertical pass, blended straight onto the canvas.
    for (int dy = 0; dy < dest.h; ++dy) {
        const int py = dest.y + dy;
        if (py < 0 || py >= canvas.height) {
            continue;
        }
        const Contribution& c = vertical.pixels[static_cast<size_t>(dy)];
        for (int dx = 0; dx < dest.w; ++dx) {
            const int px = dest.x + dx;
            if (px < 0 || px >= canvas.width) {
                continue;
            }
            float r = 0.0f;
            float g = 0.0f;
            float b = 0.0f;
            float a = 0.0f;
            for (size_t t = c.first; t < c.first + c.count; ++t) {
                const Tap& tap = vertical.taps[t];
                const float* in = rows.data()
                                  + ((static_cast<size_t>(tap.index) * static_cast<size_t>(dest.w))
                                     + static_cast<size_t>(dx)) * k_num_channels;
                r += tap.weight * in[CHANNEL_R];
                g += tap.weight * in[CHANNEL_G];
                b += tap.weight * in[CHANNEL_B];
                a += tap.weight * in[CHANNEL_A];
            }
            a = std::clamp(a, 0.0f, 1.0f);

            const size_t offset = ((static_cast<size_t>(py) * static_cast<size_t>(canvas.width))
                                   + static_cast<size_t>(px)) * k_num_channels;
            unsigned char* dst = canvas.pixels.data() + offset;
            const float keep = 1.0f - a;
            dst[CHANNEL_R] = to_channel(r + dst[CHANNEL_R] * keep);
            dst[CHANNEL_G] = to_channel(g + dst[CHANNEL_G] * keep);
            dst[CHANNEL_B] = to_channel(b + dst[CHANNEL_B] * keep);
            dst[CHANNEL_A] = to_channel(MAX_CHANNEL_VALUE * a + dst[CHANNEL_A] * keep);
        }
    }
    return true;
}

} // namespace quilt::core
