#include "thumbnail_builder.h"

#include "layout_engine.h"
#include "ratio_sort.h"

#include <utility>

namespace quilt::core {

namespace {

constexpr size_t k_required_images = 4;

void store_result(AddImageResult* result, DecodeError kind, const std::string& error) {
    if (result) {
        result->kind = kind;
        result->error = error;
    }
}

} // namespace

const char* build_error_name(BuildError kind) {
    switch (kind) {
        case BuildError::None:
            return "none";
        case BuildError::InsufficientImages:
            return "insufficient images";
        case BuildError::InvalidParameters:
            return "invalid parameters";
        case BuildError::LayoutFailed:
            return "layout failed";
        case BuildError::EncodeFailed:
            return "encode failed";
    }
    return "unknown";
}

ThumbnailBuilder::ThumbnailBuilder(BuildOptions options)
    : ThumbnailBuilder(std::move(options), std::make_unique<RandomCoinFlip>()) {}

ThumbnailBuilder::ThumbnailBuilder(BuildOptions options, std::unique_ptr<CoinFlip> coin)
    : options_(std::move(options)), coin_(std::move(coin)) {
    if (!coin_) {
        coin_ = std::make_unique<RandomCoinFlip>();
    }
}

bool ThumbnailBuilder::add_image(const std::filesystem::path& path, AddImageResult* result) {
    Image image;
    DecodeError kind = DecodeError::None;
    std::string error;
    if (!decode_image_file(path, *registry_, image, kind, error)) {
        store_result(result, kind, error);
        return false;
    }
    return add_image(std::move(image), result);
}

bool ThumbnailBuilder::add_encoded_image(const std::vector<unsigned char>& bytes,
                                         const std::string& name,
                                         AddImageResult* result) {
    Image image;
    DecodeError kind = DecodeError::None;
    std::string error;
    if (!registry_->decode(bytes.data(), bytes.size(), name, image, kind, error)) {
        store_result(result, kind, error);
        return false;
    }
    return add_image(std::move(image), result);
}

bool ThumbnailBuilder::add_image(Image image, AddImageResult* result) {
    std::string error;
    if (!validate_image(image, error)) {
        store_result(result, DecodeError::InvalidImage, (image.name.empty() ? "image" : image.name) + ": " + error);
        return false;
    }
    images_.push_back(std::move(image));
    store_result(result, DecodeError::None, {});
    return true;
}

void ThumbnailBuilder::clear() {
    images_.clear();
    images_.shrink_to_fit();
}

bool ThumbnailBuilder::make_thumbnail(const std::filesystem::path& destination, BuildReport* report) {
    BuildReport local;
    BuildReport& out = report ? *report : local;
    out = BuildReport{};

    const bool ok = build(destination, out);
    clear();
    return ok;
}

bool ThumbnailBuilder::build(const std::filesystem::path& destination, BuildReport& report) {
    if (images_.size() < k_required_images) {
        if (options_.insufficient_images == InsufficientImagesPolicy::Silent) {
            return true;
        }
        report.kind = BuildError::InsufficientImages;
        report.error = "need at least " + std::to_string(k_required_images) + " images, got "
                       + std::to_string(images_.size());
        return false;
    }
    if (!validate_layout_parameters(options_.layout, report.error)) {
        report.kind = BuildError::InvalidParameters;
        return false;
    }

    // With more than four images the four narrowest take part.
    sort_by_ratio(images_);
    std::vector<Image> batch;
    batch.reserve(k_required_images);
    for (size_t i = 0; i < k_required_images; ++i) {
        batch.push_back(std::move(images_[i]));
    }

    const std::vector<double> sorted = ratios_of(batch);
    const LayoutChoice choice = classify_layout({sorted[0], sorted[1], sorted[2], sorted[3]}, *coin_);
    std::vector<double> ratios = sorted;
    if (choice.drop_widest) {
        batch.pop_back();
        ratios.pop_back();
    }

    if (!compute_layout(choice.kind, ratios, options_.layout, report.plan, report.error)) {
        report.kind = BuildError::LayoutFailed;
        return false;
    }

    Canvas canvas;
    if (!compose(report.plan, batch, options_.layout, canvas, report.error)) {
        report.kind = BuildError::LayoutFailed;
        return false;
    }
    report.canvas_width = canvas.width;
    report.canvas_height = canvas.height;

    if (!write_jpeg(canvas, destination, options_.jpeg_quality, report.error)) {
        report.kind = BuildError::EncodeFailed;
        return false;
    }
    report.wrote_output = true;
    return true;
}

} // namespace quilt::core
