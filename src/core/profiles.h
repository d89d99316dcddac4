#pragma once

#include "layout_types.h"
#include "thumbnail_builder.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifndef QUILT_GLOBAL_PROFILE_CONFIG
#define QUILT_GLOBAL_PROFILE_CONFIG "/usr/local/share/quilt/quiltprofiles.cfg"
#endif

namespace quilt::core {

constexpr const char* k_profiles_config_filename = "quiltprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/quilt/quiltprofiles.cfg";
constexpr const char* k_global_profiles_config_path = QUILT_GLOBAL_PROFILE_CONFIG;
constexpr const char k_default_profile_name[] = "default";

// Unset fields leave the built-in defaults alone.
struct ProfileDefinition {
    std::string name;
    std::optional<int> width;
    std::optional<int> padding;
    std::optional<int> border_width;
    std::optional<Color> background;
    std::optional<Color> border_color;
    std::optional<int> quality;
    std::optional<InsufficientImagesPolicy> insufficient_images;
};

bool parse_insufficient_images_policy(const std::string& value, InsufficientImagesPolicy& out, std::string& error);

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);
bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// Working directory, then the user config, then the global one.
std::vector<std::filesystem::path> default_profiles_config_paths();

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

void apply_profile(const ProfileDefinition& profile, BuildOptions& options);

} // namespace quilt::core
