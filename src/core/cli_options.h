#pragma once

#include "profiles.h"
#include "thumbnail_builder.h"

#include <optional>
#include <string>

namespace quilt::core {

// Profile selection and the layout flags shared by quiltmake and quiltlayout.
struct LayoutFlags {
    std::string profile_name;
    std::string profiles_config_path;
    std::optional<int> width;
    std::optional<int> padding;
    std::optional<int> border_width;
    std::optional<Color> background;
    std::optional<Color> border_color;
    std::optional<int> quality;
};

enum class FlagResult { NotMatched, Consumed, Invalid };

// Consumes argv[i] (and its value) when it is one of the shared flags.
FlagResult parse_layout_flag(int argc, char** argv, int& i, LayoutFlags& flags, std::string& error);

// Built-in defaults, then the selected profile, then explicit flags.
bool resolve_build_options(const LayoutFlags& flags, BuildOptions& out, std::string& error);

void print_layout_flags_usage();

} // namespace quilt::core
