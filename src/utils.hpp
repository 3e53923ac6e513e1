#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(std::string_view data);

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);
// Truncates and overwrites; never creates a backup.
bool write_text_file(const std::filesystem::path& path, const std::string& text, std::string& error);
