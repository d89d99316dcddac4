// quiltmake.cpp
// MIT License (c) 2026 Pedro

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/archive_input.h"
#include "core/cli_options.h"
#include "core/cli_parse.h"
#include "core/layout_engine.h"
#include "core/thumbnail_builder.h"

namespace fs = std::filesystem;

namespace {

using quilt::core::AddImageResult;
using quilt::core::BuildReport;
using quilt::core::FlagResult;
using quilt::core::ThumbnailBuilder;

void print_usage() {
    std::cout << "Usage: quiltmake [OPTIONS] OUTPUT IMAGE...\n"
              << "\n"
              << "Compose four images into one JPEG collage. The layout is picked from\n"
              << "their aspect ratios; images that cannot be decoded are skipped.\n"
              << "\n"
              << "Options:\n";
    quilt::core::print_layout_flags_usage();
    std::cout << "  --archive PATH           Also read images from a tar or zip archive\n"
              << "  --seed N                 Seed the layout coin flip for repeatable output\n"
              << "  --allow-fewer            Exit quietly without output when fewer than four images load\n"
              << "  --verbose                Print the chosen layout\n"
              << "  --help, -h               Show this help message\n";
}

void report_skipped(const std::string& source, const AddImageResult& result) {
    std::cerr << "Warning: skipping " << source << " (" << quilt::core::decode_error_name(result.kind)
              << "): " << result.error << "\n";
}

} // namespace

int main(int argc, char** argv) {
    quilt::core::LayoutFlags flags;
    std::vector<std::string> archives;
    std::vector<std::string> positional;
    bool has_seed = false;
    uint32_t seed = 0;
    bool allow_fewer = false;
    bool verbose = false;

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
        } else if (arg == "--archive" && i + 1 < argc) {
            archives.emplace_back(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            std::string value = argv[++i];
            int parsed = 0;
            if (!quilt::core::parse_non_negative_int(value, parsed)) {
                std::cerr << "Invalid seed value: " << value << "\n";
                return 1;
            }
            seed = static_cast<uint32_t>(parsed);
            has_seed = true;
        } else if (arg == "--allow-fewer") {
            allow_fewer = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }
    const fs::path output = positional.front();

    quilt::core::BuildOptions options;
    std::string error;
    if (!quilt::core::resolve_build_options(flags, options, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (allow_fewer) {
        options.insufficient_images = quilt::core::InsufficientImagesPolicy::Silent;
    }

    std::unique_ptr<quilt::core::CoinFlip> coin;
    if (has_seed) {
        coin = std::make_unique<quilt::core::SeededCoinFlip>(seed);
    } else {
        coin = std::make_unique<quilt::core::RandomCoinFlip>();
    }
    ThumbnailBuilder builder(options, std::move(coin));

    for (size_t i = 1; i < positional.size(); ++i) {
        AddImageResult result;
        if (!builder.add_image(fs::path(positional[i]), &result)) {
            report_skipped(positional[i], result);
        }
    }

    for (const auto& archive_path : archives) {
        std::vector<quilt::core::ArchiveMember> members;
        if (!quilt::core::read_archive_members(archive_path, members, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        for (const auto& member : members) {
            AddImageResult result;
            if (!builder.add_encoded_image(member.bytes, member.name, &result)) {
                report_skipped(archive_path + ":" + member.name, result);
            }
        }
    }

    const size_t loaded = builder.image_count();
    BuildReport report;
    if (!builder.make_thumbnail(output, &report)) {
        std::cerr << "Error: " << report.error << "\n";
        return 1;
    }
    if (!report.wrote_output) {
        if (verbose) {
            std::cerr << "Only " << loaded << " image(s) loaded; nothing written\n";
        }
        return 0;
    }
    if (verbose) {
        std::cerr << "Layout " << quilt::core::layout_kind_name(report.plan.kind) << ", "
                  << report.canvas_width << "x" << report.canvas_height << " -> " << output.string() << "\n";
    }
    return 0;
}
