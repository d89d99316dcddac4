#pragma once

#include "compositor.h"
#include "image.h"
#include "layout_classifier.h"
#include "layout_types.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace quilt::core {

enum class InsufficientImagesPolicy {
    // make_thumbnail fails with BuildError::InsufficientImages.
    Strict,
    // make_thumbnail succeeds without writing anything.
    Silent,
};

enum class BuildError { None, InsufficientImages, InvalidParameters, LayoutFailed, EncodeFailed };

const char* build_error_name(BuildError kind);

struct BuildOptions {
    LayoutParameters layout;
    int jpeg_quality = k_default_jpeg_quality;
    InsufficientImagesPolicy insufficient_images = InsufficientImagesPolicy::Strict;
};

struct AddImageResult {
    DecodeError kind = DecodeError::None;
    std::string error;
};

struct BuildReport {
    BuildError kind = BuildError::None;
    std::string error;
    bool wrote_output = false;
    LayoutPlan plan;
    int canvas_width = 0;
    int canvas_height = 0;
};

// Collects decoded images and turns the first four-plus of them into one
// collage. A builder is single use per batch: every make_thumbnail call ends
// by releasing all images, whether it wrote a file or not.
class ThumbnailBuilder {
public:
    explicit ThumbnailBuilder(BuildOptions options = {});
    ThumbnailBuilder(BuildOptions options, std::unique_ptr<CoinFlip> coin);

    // A file that cannot be read or decoded is skipped; the batch goes on.
    bool add_image(const std::filesystem::path& path, AddImageResult* result = nullptr);
    bool add_encoded_image(const std::vector<unsigned char>& bytes,
                           const std::string& name,
                           AddImageResult* result = nullptr);
    bool add_image(Image image, AddImageResult* result = nullptr);

    bool make_thumbnail(const std::filesystem::path& destination, BuildReport* report = nullptr);

    // Drops every collected image. Safe to call any number of times.
    void clear();

    [[nodiscard]] size_t image_count() const { return images_.size(); }
    [[nodiscard]] const BuildOptions& options() const { return options_; }

    void set_decoder_registry(const DecoderRegistry* registry) { registry_ = registry; }

private:
    bool build(const std::filesystem::path& destination, BuildReport& report);

    BuildOptions options_;
    std::unique_ptr<CoinFlip> coin_;
    const DecoderRegistry* registry_ = &DecoderRegistry::builtin();
    std::vector<Image> images_;
};

} // namespace quilt::core
