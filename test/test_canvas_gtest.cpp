#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <stb_image.h>

#include "core/canvas.h"
#include "core/compositor.h"
#include "core/layout_engine.h"

using namespace quilt::core;

namespace {

Image solid_image(int w, int h, const Color& color) {
    Image image;
    image.name = "solid";
    image.w = w;
    image.h = h;
    image.pixels.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * k_num_channels);
    for (size_t i = 0; i < image.pixels.size(); i += k_num_channels) {
        image.pixels[i + 0] = color[0];
        image.pixels[i + 1] = color[1];
        image.pixels[i + 2] = color[2];
        image.pixels[i + 3] = color[3];
    }
    return image;
}

Color pixel_at(const Canvas& canvas, int x, int y) {
    const size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(canvas.width) + static_cast<size_t>(x))
                          * k_num_channels;
    return {canvas.pixels[offset], canvas.pixels[offset + 1], canvas.pixels[offset + 2], canvas.pixels[offset + 3]};
}

constexpr Color k_red = {255, 0, 0, 255};
constexpr Color k_blue = {0, 0, 255, 255};
constexpr Color k_white = {255, 255, 255, 255};
constexpr Color k_black = {0, 0, 0, 255};

} // namespace

class CanvasTest : public ::testing::Test {
protected:
    Canvas canvas;

    void SetUp() override {
        std::string error;
        ASSERT_TRUE(create_canvas(20, 10, k_white, canvas, error)) << error;
    }
};

TEST_F(CanvasTest, CreateFillsBackground) {
    EXPECT_EQ(canvas.pixels.size(), 20u * 10u * 4u);
    EXPECT_EQ(pixel_at(canvas, 0, 0), k_white);
    EXPECT_EQ(pixel_at(canvas, 19, 9), k_white);
}

TEST_F(CanvasTest, CreateRejectsEmptySize) {
    Canvas other;
    std::string error;
    EXPECT_FALSE(create_canvas(0, 10, k_white, other, error));
    EXPECT_FALSE(create_canvas(10, -1, k_white, other, error));
}

TEST_F(CanvasTest, FillRectClipsToCanvas) {
    fill_rect(canvas, -5, -5, 8, 8, k_red);
    EXPECT_EQ(pixel_at(canvas, 0, 0), k_red);
    EXPECT_EQ(pixel_at(canvas, 2, 2), k_red);
    EXPECT_EQ(pixel_at(canvas, 3, 3), k_white);

    fill_rect(canvas, 18, 8, 10, 10, k_blue);
    EXPECT_EQ(pixel_at(canvas, 19, 9), k_blue);
    EXPECT_EQ(pixel_at(canvas, 17, 9), k_white);
}

TEST_F(CanvasTest, ShrinkingSolidImageKeepsColor) {
    const Image source = solid_image(64, 32, k_blue);
    std::string error;
    ASSERT_TRUE(draw_resampled(canvas, source, {2, 2, 7, 5}, error)) << error;
    EXPECT_EQ(pixel_at(canvas, 2, 2), k_blue);
    EXPECT_EQ(pixel_at(canvas, 8, 6), k_blue);
    EXPECT_EQ(pixel_at(canvas, 9, 6), k_white);
    EXPECT_EQ(pixel_at(canvas, 8, 7), k_white);
}

TEST_F(CanvasTest, EnlargingSolidImageKeepsColor) {
    const Image source = solid_image(2, 1, k_red);
    std::string error;
    ASSERT_TRUE(draw_resampled(canvas, source, {0, 0, 20, 10}, error)) << error;
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 20; ++x) {
            ASSERT_EQ(pixel_at(canvas, x, y), k_red) << "at " << x << "," << y;
        }
    }
}

TEST_F(CanvasTest, ShrinkingAveragesCoveredPixels) {
    // 2x1 source, black then white, squeezed into one pixel.
    Image source = solid_image(2, 1, k_black);
    source.pixels[4] = 255;
    source.pixels[5] = 255;
    source.pixels[6] = 255;
    std::string error;
    ASSERT_TRUE(draw_resampled(canvas, source, {0, 0, 1, 1}, error)) << error;
    const Color mixed = pixel_at(canvas, 0, 0);
    EXPECT_NEAR(mixed[0], 128, 1);
    EXPECT_NEAR(mixed[1], 128, 1);
    EXPECT_NEAR(mixed[2], 128, 1);
}

TEST_F(CanvasTest, EnlargingInterpolates) {
    Image source = solid_image(2, 1, k_black);
    source.pixels[4] = 255;
    source.pixels[5] = 255;
    source.pixels[6] = 255;
    std::string error;
    ASSERT_TRUE(draw_resampled(canvas, source, {0, 0, 8, 1}, error)) << error;
    // Ends keep the source colors, the middle ramps between them.
    EXPECT_EQ(pixel_at(canvas, 0, 0)[0], 0);
    EXPECT_EQ(pixel_at(canvas, 7, 0)[0], 255);
    EXPECT_GT(pixel_at(canvas, 4, 0)[0], pixel_at(canvas, 3, 0)[0]);
    EXPECT_GT(pixel_at(canvas, 3, 0)[0], 0);
    EXPECT_LT(pixel_at(canvas, 4, 0)[0], 255);
}

TEST_F(CanvasTest, TransparentSourceBlendsOverCanvas) {
    const Image source = solid_image(4, 4, {0, 0, 0, 0});
    std::string error;
    ASSERT_TRUE(draw_resampled(canvas, source, {0, 0, 4, 4}, error)) << error;
    EXPECT_EQ(pixel_at(canvas, 1, 1), k_white);

    const Image half = solid_image(4, 4, {0, 0, 0, 128});
    ASSERT_TRUE(draw_resampled(canvas, half, {0, 0, 4, 4}, error)) << error;
    EXPECT_NEAR(pixel_at(canvas, 1, 1)[0], 127, 1);
}

TEST_F(CanvasTest, DrawRejectsEmptySource) {
    Image empty;
    empty.name = "empty";
    std::string error;
    EXPECT_FALSE(draw_resampled(canvas, empty, {0, 0, 4, 4}, error));
    EXPECT_NE(error.find("empty"), std::string::npos);
}

TEST(CompositorTest, DrawsBorderAroundEachImage) {
    LayoutParameters params;
    params.background_color = k_white;
    params.border_color = k_black;
    const LayoutPlan plan = layout_4d({2.1, 2.3, 2.6, 3.0}, params);
    const std::vector<Image> images = {
        solid_image(210, 100, k_red),
        solid_image(230, 100, k_red),
        solid_image(260, 100, k_red),
        solid_image(300, 100, k_red),
    };

    Canvas canvas;
    std::string error;
    ASSERT_TRUE(compose(plan, images, params, canvas, error)) << error;
    EXPECT_EQ(canvas.width, 196);
    EXPECT_EQ(canvas.height, 327);

    const Rect& top = plan.rects[1];
    EXPECT_EQ(pixel_at(canvas, 0, 0), k_white) << "padding";
    EXPECT_EQ(pixel_at(canvas, top.x - 1, top.y - 1), k_black) << "border corner";
    EXPECT_EQ(pixel_at(canvas, top.x + top.w, top.y + 5), k_black) << "right border";
    EXPECT_EQ(pixel_at(canvas, top.x, top.y), k_red);
    EXPECT_EQ(pixel_at(canvas, top.x + top.w - 1, top.y + top.h - 1), k_red);
    EXPECT_EQ(pixel_at(canvas, 195, 10), k_white);
    EXPECT_EQ(pixel_at(canvas, 10, canvas.height - 1), k_white);
}

TEST(CompositorTest, RejectsMismatchedImageCount) {
    LayoutParameters params;
    const LayoutPlan plan = layout_3a({0.3, 0.4, 0.5}, params);
    const std::vector<Image> images(4, solid_image(10, 20, k_red));
    Canvas canvas;
    std::string error;
    EXPECT_FALSE(compose(plan, images, params, canvas, error));
}

TEST(CompositorTest, WriteJpegRejectsBadQuality) {
    Canvas canvas;
    std::string error;
    ASSERT_TRUE(create_canvas(4, 4, k_white, canvas, error)) << error;
    std::ostringstream sink;
    EXPECT_FALSE(write_jpeg(canvas, sink, 0, error));
    EXPECT_FALSE(write_jpeg(canvas, sink, 101, error));
    EXPECT_TRUE(write_jpeg(canvas, sink, 75, error)) << error;
    const std::string bytes = sink.str();
    ASSERT_GE(bytes.size(), 3u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xFF);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0xD8);
}

TEST(CompositorTest, WriteJpegToStreamDecodes) {
    LayoutParameters params;
    const LayoutPlan plan = layout_4d({2.1, 2.3, 2.6, 3.0}, params);
    const std::vector<Image> images(4, solid_image(60, 25, k_blue));
    Canvas canvas;
    std::string error;
    ASSERT_TRUE(compose(plan, images, params, canvas, error)) << error;

    std::ostringstream sink;
    ASSERT_TRUE(write_jpeg(canvas, sink, 90, error)) << error;
    const std::string bytes = sink.str();
    ASSERT_FALSE(bytes.empty());

    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* decoded = stbi_load_from_memory(reinterpret_cast<const unsigned char*>(bytes.data()),
                                                   static_cast<int>(bytes.size()), &w, &h, &channels, 3);
    ASSERT_NE(decoded, nullptr) << stbi_failure_reason();
    EXPECT_EQ(w, canvas.width);
    EXPECT_EQ(h, canvas.height);

    const Rect& first = plan.rects[1];
    const size_t offset = (static_cast<size_t>(first.y + first.h / 2) * static_cast<size_t>(w)
                           + static_cast<size_t>(first.x + first.w / 2)) * 3;
    EXPECT_LT(std::abs(static_cast<int>(decoded[offset + 2]) - 255), 40) << "image area keeps its color";
    EXPECT_LT(static_cast<int>(decoded[offset + 0]), 40);
    stbi_image_free(decoded);
}
