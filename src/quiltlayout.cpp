// quiltlayout.cpp
// MIT License (c) 2026 Pedro

#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/cli_options.h"
#include "core/cli_parse.h"
#include "core/image.h"
#include "core/layout_classifier.h"
#include "core/layout_engine.h"
#include "core/layout_parser.h"
#include "core/ratio_sort.h"

namespace fs = std::filesystem;

namespace {

using quilt::core::FlagResult;

void print_usage() {
    std::cout << "Usage: quiltlayout [OPTIONS] IMAGE...\n"
              << "\n"
              << "Pick a collage layout for four images and print it as text on stdout.\n"
              << "Only image headers are read.\n"
              << "\n"
              << "Options:\n";
    quilt::core::print_layout_flags_usage();
    std::cout << "  --seed N                 Seed the layout coin flip for repeatable output\n"
              << "  --help, -h               Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    quilt::core::LayoutFlags flags;
    std::vector<std::string> inputs;
    bool has_seed = false;
    uint32_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string error;
        const FlagResult shared = quilt::core::parse_layout_flag(argc, argv, i, flags, error);
        if (shared == FlagResult::Invalid) {
            std::cerr << error << "\n";
            return 1;
        }
        if (shared == FlagResult::Consumed) {
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--seed" && i + 1 < argc) {
            std::string value = argv[++i];
            int parsed = 0;
            if (!quilt::core::parse_non_negative_int(value, parsed)) {
                std::cerr << "Invalid seed value: " << value << "\n";
                return 1;
            }
            seed = static_cast<uint32_t>(parsed);
            has_seed = true;
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    quilt::core::BuildOptions options;
    std::string error;
    if (!quilt::core::resolve_build_options(flags, options, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    // Dimensions are all the layout needs; pixels stay on disk.
    std::vector<quilt::core::Image> images;
    for (const auto& input : inputs) {
        quilt::core::Image image;
        image.name = input;
        if (!quilt::core::read_image_size(fs::path(input), image.w, image.h, error)) {
            std::cerr << "Warning: skipping " << input << ": " << error << "\n";
            continue;
        }
        images.push_back(std::move(image));
    }
    if (images.size() < 4) {
        std::cerr << "Error: need at least 4 images, got " << images.size() << "\n";
        return 1;
    }

    quilt::core::sort_by_ratio(images);
    images.resize(4);
    std::vector<double> ratios = quilt::core::ratios_of(images);

    std::unique_ptr<quilt::core::CoinFlip> coin;
    if (has_seed) {
        coin = std::make_unique<quilt::core::SeededCoinFlip>(seed);
    } else {
        coin = std::make_unique<quilt::core::RandomCoinFlip>();
    }
    const quilt::core::LayoutChoice choice =
        quilt::core::classify_layout({ratios[0], ratios[1], ratios[2], ratios[3]}, *coin);
    if (choice.drop_widest) {
        images.pop_back();
        ratios.pop_back();
    }

    quilt::core::LayoutPlan plan;
    if (!quilt::core::compute_layout(choice.kind, ratios, options.layout, plan, error)
        || !quilt::core::validate_plan(plan, options.layout, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    quilt::core::LayoutDocument doc;
    doc.canvas_width = options.layout.total_width;
    doc.canvas_height = quilt::core::plan_canvas_height(plan, options.layout);
    doc.kind = plan.kind;
    doc.has_kind = true;
    doc.params = options.layout;
    doc.has_params = true;
    doc.quality = options.jpeg_quality;
    doc.has_quality = true;
    for (size_t i = 0; i < plan.count; ++i) {
        doc.images.push_back({images[i].name, plan.rects[i]});
    }
    quilt::core::write_layout_document(std::cout, doc);
    return 0;
}
