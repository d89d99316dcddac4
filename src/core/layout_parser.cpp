#include "layout_parser.h"

#include "cli_parse.h"
#include "layout_engine.h"

#include <cctype>
#include <sstream>
#include <utility>

namespace quilt::core {

namespace {

constexpr int k_min_quality = 1;
constexpr int k_max_quality = 100;

bool split_triple(const std::string& token, int& a, int& b, int& c) {
    const size_t first = token.find(',');
    if (first == std::string::npos || first == 0) {
        return false;
    }
    return parse_int(token.substr(0, first), a) && parse_pair(token.substr(first + 1), b, c);
}

} // namespace

bool parse_image_line(const std::string& line, PlacedImage& out, std::string& error) {
    const std::string prefix = "image";
    if (!line.starts_with(prefix)) {
        error = "line must start with 'image'";
        return false;
    }

    size_t pos = prefix.size();
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
        ++pos;
    }

    std::string path;
    if (pos >= line.size() || line[pos] != '"') {
        error = "image path must be quoted";
        return false;
    }
    if (!parse_quoted(line, pos, path, error)) {
        return false;
    }

    std::vector<std::string> tokens;
    std::istringstream tail(line.substr(pos));
    std::string token;
    while (tail >> token) {
        tokens.push_back(token);
    }

    constexpr size_t IMAGE_TOKENS = 2;
    if (tokens.size() != IMAGE_TOKENS) {
        error = "image line must contain position and size";
        return false;
    }

    PlacedImage parsed;
    parsed.path = path;
    if (!parse_pair(tokens[0], parsed.rect.x, parsed.rect.y) || !parse_pair(tokens[1], parsed.rect.w, parsed.rect.h)) {
        error = "invalid position or size pair";
        return false;
    }
    if (parsed.rect.x < 0 || parsed.rect.y < 0 || parsed.rect.w <= 0 || parsed.rect.h <= 0) {
        error = "invalid image bounds for '" + path + "'";
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool parse_canvas_line(const std::string& line, int& width, int& height) {
    std::istringstream iss(line);
    std::string tag;
    std::string size_token;
    std::string extra;

    if (!(iss >> tag >> size_token)) {
        return false;
    }
    if (tag != "canvas") {
        return false;
    }
    if (!parse_pair(size_token, width, height)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    return width > 0 && height > 0;
}

bool parse_layout_line(const std::string& line, LayoutKind& kind) {
    std::istringstream iss(line);
    std::string tag;
    std::string value;
    std::string extra;

    if (!(iss >> tag >> value)) {
        return false;
    }
    if (tag != "layout") {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    return parse_layout_kind(value, kind);
}

bool parse_params_line(const std::string& line, LayoutParameters& params, std::string& error) {
    std::istringstream iss(line);
    std::string tag;
    std::string sizes;
    std::string background;
    std::string border;
    std::string extra;

    if (!(iss >> tag >> sizes >> background >> border) || tag != "params") {
        error = "params line must be 'params W,P,B BACKGROUND BORDER'";
        return false;
    }
    if (iss >> extra) {
        error = "unexpected token '" + extra + "' in params line";
        return false;
    }

    LayoutParameters parsed;
    if (!split_triple(sizes, parsed.total_width, parsed.padding, parsed.border_width)) {
        error = "invalid width,padding,border triple '" + sizes + "'";
        return false;
    }
    if (!parse_color(background, parsed.background_color)) {
        error = "invalid background color '" + background + "'";
        return false;
    }
    if (!parse_color(border, parsed.border_color)) {
        error = "invalid border color '" + border + "'";
        return false;
    }
    if (!validate_layout_parameters(parsed, error)) {
        return false;
    }

    params = parsed;
    return true;
}

bool parse_quality_line(const std::string& line, int& quality) {
    std::istringstream iss(line);
    std::string tag;
    std::string value;
    std::string extra;

    if (!(iss >> tag >> value) || tag != "quality") {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    int parsed = 0;
    if (!parse_positive_int(value, parsed) || parsed < k_min_quality || parsed > k_max_quality) {
        return false;
    }
    quality = parsed;
    return true;
}

bool parse_layout_document(std::istream& in, LayoutDocument& out, std::string& error) {
    LayoutDocument parsed;
    std::string line;

    while (std::getline(in, line)) {
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.starts_with("canvas")) {
            if (!parse_canvas_line(line, parsed.canvas_width, parsed.canvas_height)) {
                error = "Invalid canvas line: " + line;
                return false;
            }
        } else if (line.starts_with("layout")) {
            if (parsed.has_kind) {
                error = "Duplicate layout line";
                return false;
            }
            if (!parse_layout_line(line, parsed.kind)) {
                error = "Invalid layout line: " + line;
                return false;
            }
            parsed.has_kind = true;
        } else if (line.starts_with("params")) {
            if (parsed.has_params) {
                error = "Duplicate params line";
                return false;
            }
            std::string params_error;
            if (!parse_params_line(line, parsed.params, params_error)) {
                error = "Invalid params line: " + params_error;
                return false;
            }
            parsed.has_params = true;
        } else if (line.starts_with("quality")) {
            if (parsed.has_quality) {
                error = "Duplicate quality line";
                return false;
            }
            if (!parse_quality_line(line, parsed.quality)) {
                error = "Invalid quality line: " + line;
                return false;
            }
            parsed.has_quality = true;
        } else if (line.starts_with("image")) {
            PlacedImage placed;
            std::string image_error;
            if (!parse_image_line(line, placed, image_error)) {
                error = "Invalid image line: " + image_error;
                return false;
            }
            parsed.images.push_back(std::move(placed));
        } else {
            error = "Unknown line: " + line;
            return false;
        }
    }

    if (parsed.canvas_width <= 0 || parsed.canvas_height <= 0) {
        error = "Invalid canvas size";
        return false;
    }
    if (!parsed.has_kind) {
        error = "Missing layout line";
        return false;
    }
    if (!parsed.has_params) {
        error = "Missing params line";
        return false;
    }
    if (parsed.canvas_width != parsed.params.total_width) {
        error = "Canvas width " + std::to_string(parsed.canvas_width) + " does not match params width "
                + std::to_string(parsed.params.total_width);
        return false;
    }

    out = std::move(parsed);
    return true;
}

void write_layout_document(std::ostream& out, const LayoutDocument& doc) {
    out << "canvas " << doc.canvas_width << "," << doc.canvas_height << "\n";
    out << "layout " << layout_kind_name(doc.kind) << "\n";
    out << "params " << doc.params.total_width << "," << doc.params.padding << "," << doc.params.border_width
        << " " << format_color(doc.params.background_color) << " " << format_color(doc.params.border_color) << "\n";
    if (doc.has_quality) {
        out << "quality " << doc.quality << "\n";
    }
    for (const auto& image : doc.images) {
        out << "image " << to_quoted(image.path) << " "
            << image.rect.x << "," << image.rect.y << " "
            << image.rect.w << "," << image.rect.h << "\n";
    }
}

bool plan_from_document(const LayoutDocument& doc, LayoutPlan& out, std::string& error) {
    const size_t expected = layout_image_count(doc.kind);
    if (doc.images.size() != expected) {
        error = "layout " + std::string(layout_kind_name(doc.kind)) + " needs " + std::to_string(expected)
                + " image lines, got " + std::to_string(doc.images.size());
        return false;
    }
    LayoutPlan plan;
    plan.kind = doc.kind;
    plan.count = expected;
    for (size_t i = 0; i < expected; ++i) {
        plan.rects[i] = doc.images[i].rect;
    }
    if (!validate_plan(plan, doc.params, error)) {
        return false;
    }
    const int height = plan_canvas_height(plan, doc.params);
    if (height != doc.canvas_height) {
        error = "canvas height " + std::to_string(doc.canvas_height) + " does not match images (expected "
                + std::to_string(height) + ")";
        return false;
    }
    out = plan;
    return true;
}

} // namespace quilt::core
