#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxchord {

std::string trim(const std::string& text);
std::string to_lower(std::string text);

// Number of UTF-8 code points (malformed bytes count as one each)
std::size_t utf8_length(const std::string& text);

// Cuts to at most max_chars code points without splitting a sequence
std::string truncate_utf8(const std::string& text, std::size_t max_chars);

// Short single-line excerpt for log output
std::string preview(const std::string& text, std::size_t max_chars = 50);

std::string base64_encode(const std::vector<uint8_t>& data);

} // namespace voxchord
