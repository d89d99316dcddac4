#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <limits>
#include <sstream>

namespace quilt::core {

namespace {

constexpr int k_max_channel_value = 255;
constexpr int k_hex_short_len = 3;
constexpr int k_hex_long_len = 6;
constexpr int k_hex_base = 16;

bool parse_hex_digits(std::string_view digits, std::array<unsigned char, 4>& out) {
    if (digits.size() != k_hex_short_len && digits.size() != k_hex_long_len) {
        return false;
    }
    unsigned int parsed = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed, k_hex_base);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return false;
    }
    if (digits.size() == k_hex_short_len) {
        // #abc expands to #aabbcc
        const unsigned int r = (parsed >> 8) & 0xF;
        const unsigned int g = (parsed >> 4) & 0xF;
        const unsigned int b = parsed & 0xF;
        out = {static_cast<unsigned char>(r * 17), static_cast<unsigned char>(g * 17),
               static_cast<unsigned char>(b * 17), static_cast<unsigned char>(k_max_channel_value)};
        return true;
    }
    out = {static_cast<unsigned char>((parsed >> 16) & 0xFF), static_cast<unsigned char>((parsed >> 8) & 0xFF),
           static_cast<unsigned char>(parsed & 0xFF), static_cast<unsigned char>(k_max_channel_value)};
    return true;
}

} // namespace

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed < 0 || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_int(const std::string& token, int& out) {
    if (token.empty()) {
        return false;
    }
    std::istringstream iss(token);
    int value = 0;
    char extra = '\0';
    if (!(iss >> value)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    out = value;
    return true;
}

bool parse_pair(const std::string& token, int& a, int& b) {
    size_t comma = token.find(',');
    if (comma == std::string::npos || comma == 0 || comma + 1 >= token.size()) {
        return false;
    }
    if (token.find(',', comma + 1) != std::string::npos) {
        return false;
    }
    return parse_int(token.substr(0, comma), a) && parse_int(token.substr(comma + 1), b);
}

bool parse_color(const std::string& value, std::array<unsigned char, 4>& out) {
    const std::string trimmed = trim_copy(value);
    if (trimmed.empty()) {
        return false;
    }
    if (trimmed.front() == '#') {
        return parse_hex_digits(std::string_view(trimmed).substr(1), out);
    }
    if (trimmed.size() > 2 && trimmed[0] == '0' && (trimmed[1] == 'x' || trimmed[1] == 'X')) {
        return parse_hex_digits(std::string_view(trimmed).substr(2), out);
    }

    constexpr int REQUIRED_CHANNELS = 3;
    std::array<int, REQUIRED_CHANNELS> parts = {0, 0, 0};
    int part_count = 0;
    size_t start = 0;
    while (start <= trimmed.size()) {
        size_t comma = trimmed.find(',', start);
        size_t end = (comma == std::string::npos) ? trimmed.size() : comma;
        if (end == start || part_count >= REQUIRED_CHANNELS) {
            return false;
        }

        int channel = 0;
        if (!parse_int(trim_copy(trimmed.substr(start, end - start)), channel)
            || channel < 0 || channel > k_max_channel_value) {
            return false;
        }
        parts[part_count++] = channel;

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    if (part_count != REQUIRED_CHANNELS) {
        return false;
    }

    out[0] = static_cast<unsigned char>(parts[0]);
    out[1] = static_cast<unsigned char>(parts[1]);
    out[2] = static_cast<unsigned char>(parts[2]);
    out[3] = static_cast<unsigned char>(k_max_channel_value);
    return true;
}

std::string format_color(const std::array<unsigned char, 4>& color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", color[0], color[1], color[2]);
    return buffer;
}

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error) {
    if (pos >= input.size() || input[pos] != '"') {
        error = "expected opening quote";
        return false;
    }

    ++pos;
    out.clear();

    while (pos < input.size()) {
        char c = input[pos++];
        if (c == '\\') {
            if (pos >= input.size()) {
                error = "unterminated escape sequence";
                return false;
            }
            char escaped = input[pos++];
            if (escaped == '"' || escaped == '\\') {
                out.push_back(escaped);
            } else {
                out.push_back('\\');
                out.push_back(escaped);
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }

    error = "unterminated quoted string";
    return false;
}

std::string to_quoted(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\' ) {
            result += '\\';
        }
        result += c;
    }
    result += "\"";
    return result;
}

} // namespace quilt::core
