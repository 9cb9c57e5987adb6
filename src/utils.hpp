#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
// Inverse of hex_from_bytes. nullopt on odd length or a non-hex digit.
std::optional<std::string> bytes_from_hex(const std::string& hex);
bool is_valid_utf8(const std::string& text);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
std::vector<std::string> split_list(const std::string& value, char separator = ',');
bool contains_icase(const std::string& haystack, const std::string& needle);

// "JPG", ".jpg" and ".JPG" all become ".jpg". Empty stays empty.
std::string normalize_extension(const std::string& ext);

// "10MB" -> 10485760. Binary multiples; unparseable input yields 0.
uint64_t parse_size_string(const std::string& text);
std::optional<uint64_t> try_parse_size(const std::string& text);
std::string format_size(uint64_t bytes);

// File size, or the recursive total for a directory. Never throws; 0 on failure.
uint64_t path_size(const std::filesystem::path& path);

// True when path is dir itself or lies somewhere beneath it.
bool path_is_within(const std::string& path, const std::string& dir);
