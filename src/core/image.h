#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace quilt::core {

constexpr int k_num_channels = 4;

// Decoded source picture. Pixels are RGBA8, row major, w * h * 4 bytes.
struct Image {
    std::string name;
    int w = 0;
    int h = 0;
    std::vector<unsigned char> pixels;

    [[nodiscard]] double ratio() const {
        return static_cast<double>(w) / static_cast<double>(h);
    }
};

enum class ImageFormat { Unknown, Jpeg, Png, Gif };

enum class DecodeError { None, UnsupportedFormat, InvalidImage, ReadFailed };

const char* image_format_name(ImageFormat format);
const char* decode_error_name(DecodeError kind);

ImageFormat sniff_image_format(const unsigned char* data, size_t size);
ImageFormat format_from_extension(const std::string& path_hint);

// Both sides positive and within the decoder's dimension cap.
bool validate_image_size(int w, int h, std::string& error);

// Rejects images whose aspect ratio would be zero, infinite or undefined.
bool validate_image(const Image& image, std::string& error);

using DecodeFn = bool (*)(const unsigned char* data, size_t size, Image& out, std::string& error);

class DecoderRegistry {
public:
    void register_decoder(ImageFormat format, DecodeFn fn);
    [[nodiscard]] bool supports(ImageFormat format) const;

    // The content signature selects the decoder; path_hint is consulted only
    // when the signature is not recognized.
    bool decode(const unsigned char* data,
                size_t size,
                const std::string& path_hint,
                Image& out,
                DecodeError& kind,
                std::string& error) const;

    // JPEG, PNG and GIF through stb_image.
    static const DecoderRegistry& builtin();

private:
    DecodeFn find(ImageFormat format) const;

    std::vector<std::pair<ImageFormat, DecodeFn>> decoders_;
};

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error);

bool decode_image_file(const std::filesystem::path& path,
                       const DecoderRegistry& registry,
                       Image& out,
                       DecodeError& kind,
                       std::string& error);

// Reads only the header and applies the size limits decoding applies.
bool read_image_size(const std::filesystem::path& path, int& width, int& height, std::string& error);

} // namespace quilt::core
