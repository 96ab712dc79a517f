#pragma once

#include <cstdint>
#include <optional>
#include <filesystem>

#include "./archive.hpp"

// name of the single tar entry stored inside every .tar.7z archive
#define SEVEN_Z_TAR_FILENAME "swiss_army_archive_seven7_temp.tar"
// on-disk bridging files get a random part between stem and extension
#define SEVEN_Z_TEMP_STEM "swiss_army_archive_seven7_temp"

// compresses tar_file into a new 7z archive as entry SEVEN_Z_TAR_FILENAME with the given mtime
std::optional<archive_error_t> sevenz_compress_file(const std::filesystem::path &tar_file, const std::filesystem::path &output_path, int64_t mtime);

// extracts the 7z archive into output_directory, the SEVEN_Z_TAR_FILENAME entry is written to tar_file instead
std::optional<archive_error_t> sevenz_extract(const std::filesystem::path &input_path, const std::filesystem::path &output_directory, const std::filesystem::path &tar_file);
