#pragma once

#include "image.h"
#include "layout_types.h"

#include <string>
#include <vector>

namespace quilt::core {

struct Canvas {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;
};

bool create_canvas(int width, int height, const Color& background, Canvas& out, std::string& error);

// Both drawing calls clip to the canvas.
void fill_rect(Canvas& canvas, int x, int y, int w, int h, const Color& color);

// Scales the whole source into the destination rectangle. Shrinking averages
// every covered source pixel, enlarging interpolates bilinearly. Source alpha
// is blended over what the canvas already holds.
bool draw_resampled(Canvas& canvas, const Image& source, const Rect& dest, std::string& error);

} // namespace quilt::core
