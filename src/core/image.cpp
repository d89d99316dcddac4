#include "image.h"

#include "cli_parse.h"

#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

#include <stb_image.h>

namespace quilt::core {

namespace fs = std::filesystem;

namespace {

constexpr uintmax_t k_max_image_file_size = 256u * 1024u * 1024u;
constexpr int k_max_image_dimension = 32768;

constexpr std::array<unsigned char, 3> k_jpeg_signature = {0xFF, 0xD8, 0xFF};
constexpr std::array<unsigned char, 8> k_png_signature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

bool starts_with_bytes(const unsigned char* data, size_t size, const unsigned char* prefix, size_t prefix_size) {
    return size >= prefix_size && std::memcmp(data, prefix, prefix_size) == 0;
}

bool decode_with_stb(const unsigned char* data, size_t size, Image& out, std::string& error) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "input is too large";
        return false;
    }
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* decoded = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, k_num_channels);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        error = reason ? reason : "decode failed";
        return false;
    }

    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (w <= 0 || h <= 0
        || !checked_mul_size_t(static_cast<size_t>(w), static_cast<size_t>(h), pixel_count)
        || !checked_mul_size_t(pixel_count, k_num_channels, byte_count)) {
        stbi_image_free(decoded);
        error = "invalid image dimensions";
        return false;
    }

    out.w = w;
    out.h = h;
    out.pixels.assign(decoded, decoded + byte_count);
    stbi_image_free(decoded);
    return true;
}

} // namespace

const char* image_format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg:
            return "jpeg";
        case ImageFormat::Png:
            return "png";
        case ImageFormat::Gif:
            return "gif";
        case ImageFormat::Unknown:
            break;
    }
    return "unknown";
}

const char* decode_error_name(DecodeError kind) {
    switch (kind) {
        case DecodeError::None:
            return "none";
        case DecodeError::UnsupportedFormat:
            return "unsupported format";
        case DecodeError::InvalidImage:
            return "invalid image";
        case DecodeError::ReadFailed:
            return "read failed";
    }
    return "unknown";
}

ImageFormat sniff_image_format(const unsigned char* data, size_t size) {
    if (data == nullptr) {
        return ImageFormat::Unknown;
    }
    if (starts_with_bytes(data, size, k_jpeg_signature.data(), k_jpeg_signature.size())) {
        return ImageFormat::Jpeg;
    }
    if (starts_with_bytes(data, size, k_png_signature.data(), k_png_signature.size())) {
        return ImageFormat::Png;
    }
    if (size >= 6 && std::memcmp(data, "GIF8", 4) == 0 && (data[4] == '7' || data[4] == '9') && data[5] == 'a') {
        return ImageFormat::Gif;
    }
    return ImageFormat::Unknown;
}

ImageFormat format_from_extension(const std::string& path_hint) {
    std::string ext = to_lower_copy(fs::path(path_hint).extension().string());
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".jpe") {
        return ImageFormat::Jpeg;
    }
    if (ext == ".png") {
        return ImageFormat::Png;
    }
    if (ext == ".gif") {
        return ImageFormat::Gif;
    }
    return ImageFormat::Unknown;
}

bool validate_image_size(int w, int h, std::string& error) {
    if (w <= 0 || h <= 0) {
        error = "image has zero width or height";
        return false;
    }
    if (w > k_max_image_dimension || h > k_max_image_dimension) {
        error = "image dimensions exceed " + std::to_string(k_max_image_dimension) + " pixels";
        return false;
    }
    return true;
}

bool validate_image(const Image& image, std::string& error) {
    if (!validate_image_size(image.w, image.h, error)) {
        return false;
    }
    const double ratio = image.ratio();
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        error = "image aspect ratio is undefined";
        return false;
    }
    const size_t expected = static_cast<size_t>(image.w) * static_cast<size_t>(image.h) * k_num_channels;
    if (image.pixels.size() != expected) {
        error = "pixel buffer does not match image dimensions";
        return false;
    }
    return true;
}

void DecoderRegistry::register_decoder(ImageFormat format, DecodeFn fn) {
    for (auto& entry : decoders_) {
        if (entry.first == format) {
            entry.second = fn;
            return;
        }
    }
    decoders_.emplace_back(format, fn);
}

bool DecoderRegistry::supports(ImageFormat format) const {
    return find(format) != nullptr;
}

DecodeFn DecoderRegistry::find(ImageFormat format) const {
    for (const auto& entry : decoders_) {
        if (entry.first == format) {
            return entry.second;
        }
    }
    return nullptr;
}

bool DecoderRegistry::decode(const unsigned char* data,
                             size_t size,
                             const std::string& path_hint,
                             Image& out,
                             DecodeError& kind,
                             std::string& error) const {
    ImageFormat format = sniff_image_format(data, size);
    if (format == ImageFormat::Unknown) {
        format = format_from_extension(path_hint);
    }
    DecodeFn fn = find(format);
    if (fn == nullptr) {
        kind = DecodeError::UnsupportedFormat;
        error = "unrecognized image format: " + path_hint;
        return false;
    }

    Image decoded;
    decoded.name = path_hint;
    std::string decode_error;
    if (!fn(data, size, decoded, decode_error)) {
        kind = DecodeError::InvalidImage;
        error = "failed to decode " + std::string(image_format_name(format)) + " '" + path_hint + "': " + decode_error;
        return false;
    }
    if (!validate_image(decoded, decode_error)) {
        kind = DecodeError::InvalidImage;
        error = path_hint + ": " + decode_error;
        return false;
    }

    kind = DecodeError::None;
    out = std::move(decoded);
    return true;
}

const DecoderRegistry& DecoderRegistry::builtin() {
    static const DecoderRegistry registry = [] {
        DecoderRegistry r;
        r.register_decoder(ImageFormat::Jpeg, &decode_with_stb);
        r.register_decoder(ImageFormat::Png, &decode_with_stb);
        r.register_decoder(ImageFormat::Gif, &decode_with_stb);
        return r;
    }();
    return registry;
}

bool read_file_bytes(const fs::path& path, std::vector<unsigned char>& out, std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        error = "not a regular file: " + path.string();
        return false;
    }
    const uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        error = "failed to stat '" + path.string() + "': " + ec.message();
        return false;
    }
    if (size > k_max_image_file_size) {
        error = "file is too large: " + path.string();
        return false;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        error = "failed to read '" + path.string() + "'";
        return false;
    }
    return true;
}

bool decode_image_file(const fs::path& path,
                       const DecoderRegistry& registry,
                       Image& out,
                       DecodeError& kind,
                       std::string& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        kind = DecodeError::ReadFailed;
        return false;
    }
    return registry.decode(bytes.data(), bytes.size(), path.string(), out, kind, error);
}

bool read_image_size(const fs::path& path, int& width, int& height, std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        error = "not a regular file: " + path.string();
        return false;
    }

    std::array<unsigned char, k_png_signature.size()> head{};
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    input.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    const size_t head_size = static_cast<size_t>(input.gcount());
    input.close();

    ImageFormat format = sniff_image_format(head.data(), head_size);
    if (format == ImageFormat::Unknown) {
        format = format_from_extension(path.string());
    }
    if (format == ImageFormat::Unknown) {
        error = "unrecognized image format: " + path.string();
        return false;
    }

    int w = 0;
    int h = 0;
    int channels = 0;
    if (!stbi_info(path.string().c_str(), &w, &h, &channels)) {
        error = "failed to read image header: " + path.string();
        return false;
    }
    if (!validate_image_size(w, h, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    width = w;
    height = h;
    return true;
}

} // namespace quilt::core
