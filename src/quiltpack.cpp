// quiltpack.cpp
// MIT License (c) 2026 Pedro

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#ifndef _O_BINARY
#define _O_BINARY 0x8000
#endif
#ifndef _fileno
#define _fileno fileno
#endif
#ifndef _setmode
#define _setmode setmode
#endif
#endif
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/cli_parse.h"
#include "core/compositor.h"
#include "core/image.h"
#include "core/layout_parser.h"

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage: quiltpack [OPTIONS]\n"
              << "\n"
              << "Read layout text from stdin and write the JPEG collage to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --output PATH          Write to PATH instead of stdout (replaced if present)\n"
              << "  --quality N            JPEG quality 1-100; overrides the layout's quality line\n"
              << "                         (default: " << quilt::core::k_default_jpeg_quality << ")\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string output_path;
    std::optional<int> quality_flag;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--quality" && i + 1 < argc) {
            std::string value = argv[++i];
            int parsed = 0;
            if (!quilt::core::parse_positive_int(value, parsed) || parsed > 100) {
                std::cerr << "Invalid quality: " << value << "\n";
                return 1;
            }
            quality_flag = parsed;
        } else {
            print_usage();
            return 1;
        }
    }

    quilt::core::LayoutDocument doc;
    std::string error;
    if (!quilt::core::parse_layout_document(std::cin, doc, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    quilt::core::LayoutPlan plan;
    if (!quilt::core::plan_from_document(doc, plan, error)) {
        std::cerr << "Invalid layout: " << error << "\n";
        return 1;
    }

    int quality = quilt::core::k_default_jpeg_quality;
    if (quality_flag) {
        quality = *quality_flag;
    } else if (doc.has_quality) {
        quality = doc.quality;
    }

    std::vector<quilt::core::Image> images;
    images.reserve(doc.images.size());
    for (const auto& placed : doc.images) {
        quilt::core::Image image;
        quilt::core::DecodeError kind = quilt::core::DecodeError::None;
        if (!quilt::core::decode_image_file(fs::path(placed.path), quilt::core::DecoderRegistry::builtin(),
                                            image, kind, error)) {
            std::cerr << "Failed to load: " << error << "\n";
            return 1;
        }
        images.push_back(std::move(image));
    }

    quilt::core::Canvas canvas;
    if (!quilt::core::compose(plan, images, doc.params, canvas, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    images.clear();

    if (!output_path.empty()) {
        if (!quilt::core::write_jpeg(canvas, fs::path(output_path), quality, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        return 0;
    }

#ifdef _WIN32
    if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
        std::cerr << "Failed to set stdout to binary mode\n";
        return 1;
    }
#endif

    if (!quilt::core::write_jpeg(canvas, std::cout, quality, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    return 0;
}
