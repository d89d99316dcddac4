#pragma once

#include <array>
#include <string>
#include <string_view>

namespace quilt::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);

bool parse_int(const std::string& token, int& out);
bool parse_pair(const std::string& token, int& a, int& b);

// Accepts "#rgb", "#rrggbb", "0xrrggbb" and "R,G,B". Alpha is always opaque.
bool parse_color(const std::string& value, std::array<unsigned char, 4>& out);
std::string format_color(const std::array<unsigned char, 4>& color);

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_quoted(const std::string& s);

} // namespace quilt::core
