#pragma once

#include "layout_types.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace quilt::core {

struct PlacedImage {
    std::string path;
    Rect rect;
};

// Text form of a plan, as written by quiltlayout and read by quiltpack:
//
//   canvas 196,150
//   layout 4c
//   params 196,2,1 #ffffff #808080
//   quality 75
//   image "a.jpg" 3,3 40,60
//
// image lines are in sorted order (narrowest first). The quality line is
// optional; without it the reader picks the JPEG quality.
struct LayoutDocument {
    int canvas_width = 0;
    int canvas_height = 0;
    LayoutKind kind = LayoutKind::Layout4A;
    bool has_kind = false;
    LayoutParameters params;
    bool has_params = false;
    int quality = 0;
    bool has_quality = false;
    std::vector<PlacedImage> images;
};

bool parse_image_line(const std::string& line, PlacedImage& out, std::string& error);
bool parse_canvas_line(const std::string& line, int& width, int& height);
bool parse_layout_line(const std::string& line, LayoutKind& kind);
bool parse_params_line(const std::string& line, LayoutParameters& params, std::string& error);
bool parse_quality_line(const std::string& line, int& quality);
bool parse_layout_document(std::istream& in, LayoutDocument& out, std::string& error);

void write_layout_document(std::ostream& out, const LayoutDocument& doc);

// Rebuilds the plan the document was written from; image count must match
// the layout kind.
bool plan_from_document(const LayoutDocument& doc, LayoutPlan& out, std::string& error);

} // namespace quilt::core
