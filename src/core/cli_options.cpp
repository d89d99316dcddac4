#include "cli_options.h"

#include "cli_parse.h"
#include "layout_engine.h"

#include <iostream>
#include <system_error>
#include <vector>

namespace quilt::core {

namespace fs = std::filesystem;

namespace {

constexpr int k_min_quality = 1;
constexpr int k_max_quality = 100;

bool load_profiles(const LayoutFlags& flags, std::vector<ProfileDefinition>& out, std::string& error) {
    if (!flags.profiles_config_path.empty()) {
        return load_profiles_config_from_file(flags.profiles_config_path, out, error);
    }
    for (const auto& candidate : default_profiles_config_paths()) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }
        if (!load_profiles_config_from_file(candidate, out, error)) {
            error = candidate.string() + ": " + error;
            return false;
        }
        return true;
    }
    out.clear();
    return true;
}

} // namespace

FlagResult parse_layout_flag(int argc, char** argv, int& i, LayoutFlags& flags, std::string& error) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--profile" && has_value) {
        flags.profile_name = argv[++i];
        return FlagResult::Consumed;
    }
    if (arg == "--profiles-config" && has_value) {
        flags.profiles_config_path = argv[++i];
        return FlagResult::Consumed;
    }
    if (arg == "--width" && has_value) {
        const std::string value = argv[++i];
        int parsed = 0;
        if (!parse_positive_int(value, parsed)) {
            error = "Invalid width value: " + value;
            return FlagResult::Invalid;
        }
        flags.width = parsed;
        return FlagResult::Consumed;
    }
    if (arg == "--padding" && has_value) {
        const std::string value = argv[++i];
        int parsed = 0;
        if (!parse_non_negative_int(value, parsed)) {
            error = "Invalid padding value: " + value;
            return FlagResult::Invalid;
        }
        flags.padding = parsed;
        return FlagResult::Consumed;
    }
    if (arg == "--border-width" && has_value) {
        const std::string value = argv[++i];
        int parsed = 0;
        if (!parse_non_negative_int(value, parsed)) {
            error = "Invalid border width value: " + value;
            return FlagResult::Invalid;
        }
        flags.border_width = parsed;
        return FlagResult::Consumed;
    }
    if ((arg == "--background" || arg == "--border-color") && has_value) {
        const std::string value = argv[++i];
        Color parsed{};
        if (!parse_color(value, parsed)) {
            error = "Invalid color: " + value + " (expected #rrggbb, #rgb, 0xrrggbb or R,G,B)";
            return FlagResult::Invalid;
        }
        if (arg == "--background") {
            flags.background = parsed;
        } else {
            flags.border_color = parsed;
        }
        return FlagResult::Consumed;
    }
    if (arg == "--quality" && has_value) {
        const std::string value = argv[++i];
        int parsed = 0;
        if (!parse_positive_int(value, parsed) || parsed < k_min_quality || parsed > k_max_quality) {
            error = "Invalid quality value: " + value;
            return FlagResult::Invalid;
        }
        flags.quality = parsed;
        return FlagResult::Consumed;
    }
    return FlagResult::NotMatched;
}

bool resolve_build_options(const LayoutFlags& flags, BuildOptions& out, std::string& error) {
    BuildOptions options;
    std::vector<ProfileDefinition> profiles;
    if (!load_profiles(flags, profiles, error)) {
        return false;
    }

    const std::string name = flags.profile_name.empty() ? k_default_profile_name : flags.profile_name;
    if (const ProfileDefinition* profile = find_profile(profiles, name)) {
        apply_profile(*profile, options);
    } else if (!flags.profile_name.empty()) {
        error = "unknown profile '" + flags.profile_name + "'";
        return false;
    }

    if (flags.width) {
        options.layout.total_width = *flags.width;
    }
    if (flags.padding) {
        options.layout.padding = *flags.padding;
    }
    if (flags.border_width) {
        options.layout.border_width = *flags.border_width;
    }
    if (flags.background) {
        options.layout.background_color = *flags.background;
    }
    if (flags.border_color) {
        options.layout.border_color = *flags.border_color;
    }
    if (flags.quality) {
        options.jpeg_quality = *flags.quality;
    }

    if (!validate_layout_parameters(options.layout, error)) {
        return false;
    }
    out = options;
    return true;
}

void print_layout_flags_usage() {
    std::cout << "  --profile NAME           Use a profile from the profiles config\n"
              << "  --profiles-config PATH   Read profiles from PATH instead of " << k_profiles_config_filename << "\n"
              << "  --width N                Total collage width in pixels (default: " << k_default_total_width << ")\n"
              << "  --padding N              Gap between images and around the edge (default: " << k_default_padding << ")\n"
              << "  --border-width N         Border drawn around each image (default: " << k_default_border_width << ")\n"
              << "  --background COLOR       Background color (default: " << format_color(k_default_background_color) << ")\n"
              << "  --border-color COLOR     Border color (default: " << format_color(k_default_border_color) << ")\n"
              << "  --quality N              JPEG quality 1-100 (default: " << k_default_jpeg_quality << ")\n";
}

} // namespace quilt::core
