#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

// "..txt" -> "txt"
std::string sanitize_extension(const std::string& extension);

// every file or directory below root whose name ends in "." + extension,
// extension given without the leading dot
std::vector<std::filesystem::path> search_for_files(const std::filesystem::path& root, const std::string& extension);

// "<index>: <path> " or "<path> ", no newline
std::string format_found(std::size_t index, const std::filesystem::path& file_path, bool with_index);

// prints every match of extension below root, returns how many were printed
std::size_t write_found_files(std::ostream& out, const std::filesystem::path& root, const std::string& extension,
                              bool with_index);
