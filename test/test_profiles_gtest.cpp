#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/cli_parse.h"
#include "core/profiles.h"

using namespace quilt::core;

namespace {

bool parse_text(const std::string& text, std::vector<ProfileDefinition>& out, std::string& error) {
    std::istringstream in(text);
    return parse_profiles_config(in, out, error);
}

} // namespace

TEST(ProfilesTest, ParsesProfileSections) {
    const std::string text =
        "# comment\n"
        "; another comment\n"
        "[profile default]\n"
        "width = 240\n"
        "padding = 3\n"
        "border_width = 0\n"
        "background = #000\n"
        "border_color = 0x102030\n"
        "quality = 90\n"
        "insufficient_images = ignore\n"
        "\n"
        "[profile plain]\n"
        "padding=0\n";
    std::vector<ProfileDefinition> profiles;
    std::string error;
    ASSERT_TRUE(parse_text(text, profiles, error)) << error;
    ASSERT_EQ(profiles.size(), 2u);

    const ProfileDefinition* def = find_profile(profiles, "default");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->width.value_or(0), 240);
    EXPECT_EQ(def->padding.value_or(-1), 3);
    EXPECT_EQ(def->border_width.value_or(-1), 0);
    EXPECT_EQ(def->background.value_or(Color{}), (Color{0, 0, 0, 255}));
    EXPECT_EQ(def->border_color.value_or(Color{}), (Color{0x10, 0x20, 0x30, 255}));
    EXPECT_EQ(def->quality.value_or(0), 90);
    EXPECT_EQ(def->insufficient_images.value_or(InsufficientImagesPolicy::Strict), InsufficientImagesPolicy::Silent);

    const ProfileDefinition* plain = find_profile(profiles, "plain");
    ASSERT_NE(plain, nullptr);
    EXPECT_EQ(plain->padding.value_or(-1), 0);
    EXPECT_FALSE(plain->width.has_value());
    EXPECT_EQ(find_profile(profiles, "missing"), nullptr);
}

TEST(ProfilesTest, ApplyOnlyOverridesSetFields) {
    ProfileDefinition profile;
    profile.name = "wide";
    profile.width = 400;
    profile.quality = 60;

    BuildOptions options;
    apply_profile(profile, options);
    EXPECT_EQ(options.layout.total_width, 400);
    EXPECT_EQ(options.jpeg_quality, 60);
    EXPECT_EQ(options.layout.padding, k_default_padding);
    EXPECT_EQ(options.layout.border_width, k_default_border_width);
    EXPECT_EQ(options.layout.background_color, k_default_background_color);
    EXPECT_EQ(options.insufficient_images, InsufficientImagesPolicy::Strict);
}

TEST(ProfilesTest, ReportsErrorsWithLineNumbers) {
    std::vector<ProfileDefinition> profiles;
    std::string error;

    EXPECT_FALSE(parse_text("width = 10\n", profiles, error));
    EXPECT_NE(error.find("outside of profile"), std::string::npos) << error;

    EXPECT_FALSE(parse_text("[profile a]\n[profile a]\n", profiles, error));
    EXPECT_NE(error.find("duplicate profile"), std::string::npos) << error;

    EXPECT_FALSE(parse_text("[profile a]\ncolour = red\n", profiles, error));
    EXPECT_NE(error.find("line 2"), std::string::npos) << error;

    EXPECT_FALSE(parse_text("[profile a]\nbackground = #12345\n", profiles, error));
    EXPECT_FALSE(parse_text("[profile a]\nwidth = -4\n", profiles, error));
    EXPECT_FALSE(parse_text("[profile a]\nquality = 101\n", profiles, error));
    EXPECT_FALSE(parse_text("[profile a]\ninsufficient_images = maybe\n", profiles, error));
    EXPECT_FALSE(parse_text("[section a]\n", profiles, error));
    EXPECT_FALSE(parse_text("[profile]\n", profiles, error));
    EXPECT_FALSE(parse_text("# nothing here\n", profiles, error));
    EXPECT_NE(error.find("no profiles"), std::string::npos) << error;
}

TEST(ProfilesTest, MissingFileIsAnError) {
    std::vector<ProfileDefinition> profiles;
    std::string error;
    EXPECT_FALSE(load_profiles_config_from_file("/nonexistent/quiltprofiles.cfg", profiles, error));
    EXPECT_NE(error.find("failed to open"), std::string::npos);
}

TEST(ProfilesTest, DefaultSearchPathStartsInWorkingDirectory) {
    const auto paths = default_profiles_config_paths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), std::filesystem::path(k_profiles_config_filename));
    EXPECT_EQ(paths.back(), std::filesystem::path(k_global_profiles_config_path));
}

TEST(ColorParseTest, AcceptsSupportedForms) {
    Color color{};
    ASSERT_TRUE(parse_color("#808080", color));
    EXPECT_EQ(color, (Color{0x80, 0x80, 0x80, 255}));
    ASSERT_TRUE(parse_color("#fA0", color));
    EXPECT_EQ(color, (Color{0xFF, 0xAA, 0x00, 255}));
    ASSERT_TRUE(parse_color("0xffffff", color));
    EXPECT_EQ(color, (Color{255, 255, 255, 255}));
    ASSERT_TRUE(parse_color("12, 34, 56", color));
    EXPECT_EQ(color, (Color{12, 34, 56, 255}));
    EXPECT_EQ(format_color(Color{0x12, 0xab, 0x00, 255}), "#12ab00");
}

TEST(ColorParseTest, RejectsMalformedColors) {
    Color color{};
    EXPECT_FALSE(parse_color("", color));
    EXPECT_FALSE(parse_color("#12", color));
    EXPECT_FALSE(parse_color("#gggggg", color));
    EXPECT_FALSE(parse_color("1,2", color));
    EXPECT_FALSE(parse_color("1,2,3,4", color));
    EXPECT_FALSE(parse_color("1,256,3", color));
    EXPECT_FALSE(parse_color("white", color));
}
