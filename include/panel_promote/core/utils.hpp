#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace panel_promote::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash / encoding utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);
std::string base64_encode(const std::vector<uint8_t>& data);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool is_valid_utf8(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string zero_pad(int value, int width);

} // namespace panel_promote::core
