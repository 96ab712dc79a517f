#pragma once

#include <string>
#include <filesystem>

// folder for extracted files has the same name as archive without its format suffix,
// e.g. "release-1.0.tar.gz" -> "release-1.0".
// Unknown suffixes fall back to replacing .extension with _extension
std::filesystem::path folder_for_unpacked_file(const std::filesystem::path file_name);

// convert path to archive-relative form by stripping root folder.
// Result uses forward slashes and has no leading "./" or "/".
// If file_name is not in root folder, return file_name
std::string path_to_relative(const std::filesystem::path file_name, const std::filesystem::path root);

// random alphanumeric string of given length
std::string random_suffix(const int len);

// <directory>/<stem>.<random>.<extension>, not checked for existence
std::filesystem::path temporary_file_path(const std::filesystem::path directory, const std::string &stem, const std::string &extension);
