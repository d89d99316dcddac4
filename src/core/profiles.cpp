#include "profiles.h"

#include "cli_parse.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace quilt::core {

namespace fs = std::filesystem;

namespace {

constexpr int k_min_quality = 1;
constexpr int k_max_quality = 100;

} // namespace

bool parse_insufficient_images_policy(const std::string& value, InsufficientImagesPolicy& out, std::string& error) {
    std::string lower = to_lower_copy(value);
    if (lower == "error" || lower == "strict") {
        out = InsufficientImagesPolicy::Strict;
        return true;
    }
    if (lower == "ignore" || lower == "silent") {
        out = InsufficientImagesPolicy::Silent;
        return true;
    }
    error = "invalid insufficient_images '" + value + "'";
    return false;
}

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate profile '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            ProfileDefinition def;
            def.name = name;
            current = def;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        std::string lower_key = to_lower_copy(key);
        if (lower_key == "width") {
            int parsed_width = 0;
            if (!parse_positive_int(value, parsed_width)) {
                error = "invalid width '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->width = parsed_width;
        } else if (lower_key == "padding") {
            int parsed_padding = 0;
            if (!parse_non_negative_int(value, parsed_padding)) {
                error = "invalid padding '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->padding = parsed_padding;
        } else if (lower_key == "border_width") {
            int parsed_border = 0;
            if (!parse_non_negative_int(value, parsed_border)) {
                error = "invalid border_width '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->border_width = parsed_border;
        } else if (lower_key == "background" || lower_key == "bg_color") {
            Color parsed_color{};
            if (!parse_color(value, parsed_color)) {
                error = "invalid background '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->background = parsed_color;
        } else if (lower_key == "border_color") {
            Color parsed_color{};
            if (!parse_color(value, parsed_color)) {
                error = "invalid border_color '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->border_color = parsed_color;
        } else if (lower_key == "quality") {
            int parsed_quality = 0;
            if (!parse_positive_int(value, parsed_quality) || parsed_quality < k_min_quality
                || parsed_quality > k_max_quality) {
                error = "invalid quality '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->quality = parsed_quality;
        } else if (lower_key == "insufficient_images") {
            InsufficientImagesPolicy parsed_policy = InsufficientImagesPolicy::Strict;
            if (!parse_insufficient_images_policy(value, parsed_policy, error)) {
                error += " at line " + std::to_string(line_number);
                return false;
            }
            current->insufficient_images = parsed_policy;
        } else {
            error = "unknown key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> default_profiles_config_paths() {
    std::vector<fs::path> paths;
    paths.emplace_back(k_profiles_config_filename);
    if (auto user_path = resolve_user_profiles_config_path()) {
        paths.push_back(*user_path);
    }
    paths.emplace_back(k_global_profiles_config_path);
    return paths;
}

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    for (const auto& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

void apply_profile(const ProfileDefinition& profile, BuildOptions& options) {
    if (profile.width) {
        options.layout.total_width = *profile.width;
    }
    if (profile.padding) {
        options.layout.padding = *profile.padding;
    }
    if (profile.border_width) {
        options.layout.border_width = *profile.border_width;
    }
    if (profile.background) {
        options.layout.background_color = *profile.background;
    }
    if (profile.border_color) {
        options.layout.border_color = *profile.border_color;
    }
    if (profile.quality) {
        options.jpeg_quality = *profile.quality;
    }
    if (profile.insufficient_images) {
        options.insufficient_images = *profile.insufficient_images;
    }
}

} // namespace quilt::core
