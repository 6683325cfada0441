/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace binstruct::fs_utils {
std::filesystem::path executable_dir();

// Regular files under `root`, sorted. With `extensions` empty every file is
// taken, otherwise only those whose extension (".json", ...) is listed.
std::vector<std::filesystem::path> collect_inputs(
    const std::filesystem::path& root,
    const std::vector<std::string>& extensions = {}
);
bool has_extension(const std::filesystem::path& path, std::string_view ext);

std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
std::string read_text_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void ensure_dir(const std::filesystem::path& dir);
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);
}  // namespace binstruct::fs_utils
