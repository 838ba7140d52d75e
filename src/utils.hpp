#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string base64_encode(const char* data, std::size_t size);
std::string base64_encode(const std::vector<char>& data);
// Throws std::invalid_argument on malformed input.
std::vector<char> base64_decode(const std::string& encoded);

// True when `text` is well formed UTF-8 (no overlongs, surrogates or values past U+10FFFF).
bool is_valid_utf8(const std::string& text);

// Compact human readable size ("512b", "1.5M", "10G").
std::string format_size(uint64_t bytes);

// Lexically normalised absolute form of `path`, anchored at `base` when relative.
std::filesystem::path absolute_normalized(const std::filesystem::path& path,
                                          const std::filesystem::path& base);
