#pragma once

#include <array>
#include <cstddef>

namespace quilt::core {

using Color = std::array<unsigned char, 4>;

constexpr Color k_default_background_color = {0xFF, 0xFF, 0xFF, 0xFF};
constexpr Color k_default_border_color = {0x80, 0x80, 0x80, 0xFF};
constexpr int k_default_total_width = 196;
constexpr int k_default_padding = 2;
constexpr int k_default_border_width = 1;

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
};

// Index order of the sorted images, 0 = narrowest.
//
//   4A          4B            4C            4D        3A
//   +-+---+     +-+---+-+     +-+-------+   +-----+   +-+---+-+
//   |1| 2 |     | | 3 | |     |1|       |   |  1  |   | |   | |
//   +-+-+-+     |1+---+0|     +-+       |   +-----+   |1| 2 |0|
//   | 3 |0|     | | 2 | |     |3|   0   |   |  3  |   | |   | |
//   +---+-+     +-+---+-+     +-+       |   +-----+   +-+---+-+
//                             |2|       |   |  2  |
//                             +-+-------+   +-----+
//                                           |  0  |
//                                           +-----+
enum class LayoutKind { Layout4A, Layout4B, Layout4C, Layout4D, Layout3A };

struct LayoutParameters {
    int total_width = k_default_total_width;
    int padding = k_default_padding;
    int border_width = k_default_border_width;
    Color background_color = k_default_background_color;
    Color border_color = k_default_border_color;
};

struct LayoutPlan {
    LayoutKind kind = LayoutKind::Layout4A;
    size_t count = 0;
    std::array<Rect, 4> rects{};
};

} // namespace quilt::core
