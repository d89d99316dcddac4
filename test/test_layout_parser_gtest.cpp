#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "core/layout_engine.h"
#include "core/layout_parser.h"

using namespace quilt::core;

namespace {

const char* k_sample_document =
    "canvas 196,80\n"
    "layout 4b\n"
    "params 196,2,1 #ffffff #808080\n"
    "image \"tall.jpg\" 148,3 45,74\n"
    "image \"portrait.jpg\" 3,3 74,74\n"
    "image \"landscape.jpg\" 81,32 63,45\n"
    "image \"wide.jpg\" 81,3 63,25\n";

} // namespace

TEST(LayoutParserTest, ParsesDocument) {
    std::istringstream in(k_sample_document);
    LayoutDocument doc;
    std::string error;
    ASSERT_TRUE(parse_layout_document(in, doc, error)) << error;

    EXPECT_EQ(doc.canvas_width, 196);
    EXPECT_EQ(doc.canvas_height, 80);
    EXPECT_EQ(doc.kind, LayoutKind::Layout4B);
    EXPECT_EQ(doc.params.padding, 2);
    EXPECT_EQ(doc.params.border_width, 1);
    EXPECT_EQ(doc.params.border_color, (Color{0x80, 0x80, 0x80, 0xFF}));
    ASSERT_EQ(doc.images.size(), 4u);
    EXPECT_EQ(doc.images[0].path, "tall.jpg");
    EXPECT_EQ(doc.images[2].rect, (Rect{81, 32, 63, 45}));

    LayoutPlan plan;
    ASSERT_TRUE(plan_from_document(doc, plan, error)) << error;
    EXPECT_EQ(plan.count, 4u);
    EXPECT_EQ(plan.rects[3], (Rect{81, 3, 63, 25}));
}

TEST(LayoutParserTest, WrittenPlanReadsBack) {
    LayoutParameters params;
    const LayoutPlan plan = layout_4c({0.6, 1.25, 1.5, 1.7778}, params);

    LayoutDocument doc;
    doc.canvas_width = params.total_width;
    doc.canvas_height = plan_canvas_height(plan, params);
    doc.kind = plan.kind;
    doc.has_kind = true;
    doc.params = params;
    doc.has_params = true;
    const char* names[] = {"a \"quoted\".png", "b\\c.png", "c.gif", "d.jpg"};
    for (size_t i = 0; i < plan.count; ++i) {
        doc.images.push_back({names[i], plan.rects[i]});
    }

    std::ostringstream out;
    write_layout_document(out, doc);

    std::istringstream in(out.str());
    LayoutDocument parsed;
    std::string error;
    ASSERT_TRUE(parse_layout_document(in, parsed, error)) << error << "\n" << out.str();
    EXPECT_EQ(parsed.images[0].path, "a \"quoted\".png");
    EXPECT_EQ(parsed.images[1].path, "b\\c.png");

    LayoutPlan rebuilt;
    ASSERT_TRUE(plan_from_document(parsed, rebuilt, error)) << error;
    EXPECT_EQ(rebuilt.kind, plan.kind);
    for (size_t i = 0; i < plan.count; ++i) {
        EXPECT_EQ(rebuilt.rects[i], plan.rects[i]) << "image " << i;
    }
}

TEST(LayoutParserTest, RejectsMalformedLines) {
    PlacedImage placed;
    std::string error;
    EXPECT_FALSE(parse_image_line("image tall.jpg 1,2 3,4", placed, error));
    EXPECT_FALSE(parse_image_line("image \"tall.jpg 1,2 3,4", placed, error));
    EXPECT_FALSE(parse_image_line("image \"tall.jpg\" 1,2", placed, error));
    EXPECT_FALSE(parse_image_line("image \"tall.jpg\" 1,2 0,4", placed, error));
    EXPECT_TRUE(parse_image_line("image \"tall.jpg\" 1,2 3,4", placed, error)) << error;

    int w = 0;
    int h = 0;
    EXPECT_FALSE(parse_canvas_line("canvas 10", w, h));
    EXPECT_FALSE(parse_canvas_line("canvas 10,0", w, h));
    EXPECT_TRUE(parse_canvas_line("canvas 10,20", w, h));

    LayoutKind kind = LayoutKind::Layout4A;
    EXPECT_FALSE(parse_layout_line("layout 6z", kind));
    EXPECT_TRUE(parse_layout_line("layout 3a", kind));
    EXPECT_EQ(kind, LayoutKind::Layout3A);

    LayoutParameters params;
    EXPECT_FALSE(parse_params_line("params 196,2 #fff #000", params, error));
    EXPECT_FALSE(parse_params_line("params 196,2,1 #fff", params, error));
    EXPECT_FALSE(parse_params_line("params 196,2,1 #fff nope", params, error));
    EXPECT_TRUE(parse_params_line("params 300,4,2 #000 10,20,30", params, error)) << error;
    EXPECT_EQ(params.total_width, 300);
    EXPECT_EQ(params.border_color, (Color{10, 20, 30, 255}));
}

TEST(LayoutParserTest, RejectsInconsistentDocuments) {
    auto parse = [](const std::string& text, LayoutDocument& doc, std::string& error) {
        std::istringstream in(text);
        return parse_layout_document(in, doc, error);
    };
    LayoutDocument doc;
    std::string error;

    EXPECT_FALSE(parse("layout 4a\nparams 196,2,1 #fff #888\n", doc, error)) << "missing canvas";
    EXPECT_FALSE(parse("canvas 196,80\nparams 196,2,1 #fff #888\n", doc, error)) << "missing layout";
    EXPECT_FALSE(parse("canvas 196,80\nlayout 4a\n", doc, error)) << "missing params";
    EXPECT_FALSE(parse("canvas 196,80\nlayout 4a\nlayout 4b\nparams 196,2,1 #fff #888\n", doc, error));
    EXPECT_FALSE(parse("canvas 200,80\nlayout 4a\nparams 196,2,1 #fff #888\n", doc, error)) << "width mismatch";
    EXPECT_FALSE(parse("canvas 196,80\nlayout 4a\nparams 196,2,1 #fff #888\nsprite \"x\" 1,1 1,1\n", doc, error));
    EXPECT_NE(error.find("Unknown line"), std::string::npos);

    // Three image lines for a four-image layout.
    std::string text = k_sample_document;
    text = text.substr(0, text.rfind("image"));
    ASSERT_TRUE(parse(text, doc, error)) << error;
    LayoutPlan plan;
    EXPECT_FALSE(plan_from_document(doc, plan, error));

    // Canvas height that does not match the images.
    std::string tall = k_sample_document;
    tall.replace(tall.find("196,80"), 6, "196,99");
    ASSERT_TRUE(parse(tall, doc, error)) << error;
    EXPECT_FALSE(plan_from_document(doc, plan, error));
    EXPECT_NE(error.find("canvas height"), std::string::npos) << error;
}

TEST(LayoutParserTest, SkipsBlankAndCommentLines) {
    std::istringstream in(std::string("# from quiltlayout\n\n") + k_sample_document);
    LayoutDocument doc;
    std::string error;
    EXPECT_TRUE(parse_layout_document(in, doc, error)) << error;
}

TEST(LayoutParserTest, QualityLineIsOptionalAndCarried) {
    std::istringstream plain(k_sample_document);
    LayoutDocument doc;
    std::string error;
    ASSERT_TRUE(parse_layout_document(plain, doc, error)) << error;
    EXPECT_FALSE(doc.has_quality);

    std::string text = k_sample_document;
    text.insert(text.find("image"), "quality 90\n");
    std::istringstream with_quality(text);
    ASSERT_TRUE(parse_layout_document(with_quality, doc, error)) << error;
    ASSERT_TRUE(doc.has_quality);
    EXPECT_EQ(doc.quality, 90);

    std::ostringstream out;
    write_layout_document(out, doc);
    EXPECT_NE(out.str().find("\nquality 90\n"), std::string::npos) << out.str();

    int quality = 0;
    EXPECT_FALSE(parse_quality_line("quality 0", quality));
    EXPECT_FALSE(parse_quality_line("quality 101", quality));
    EXPECT_FALSE(parse_quality_line("quality 80 extra", quality));
    EXPECT_TRUE(parse_quality_line("quality 100", quality));
    EXPECT_EQ(quality, 100);

    std::string twice = text;
    twice.insert(twice.find("image"), "quality 60\n");
    std::istringstream duplicate(twice);
    EXPECT_FALSE(parse_layout_document(duplicate, doc, error));
    EXPECT_NE(error.find("Duplicate quality"), std::string::npos) << error;
}
