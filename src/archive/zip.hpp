#pragma once

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>
#include <functional>
#include <filesystem>

#include "./archive.hpp"

// unix permissions stored for every zip entry
#define ZIP_ENTRY_PERMISSIONS 0755

struct zip_entry_info_t {
    std::string name;
    bool is_file;
};

// Writes deflate compressed entries directly into the output file
class ZipWriter {
public:
    static std::variant<std::unique_ptr<ZipWriter>, archive_error_t> create(const std::filesystem::path &output_path);

    // reads the whole source file into memory and stores it as one entry
    std::optional<archive_error_t> append_file(const std::string &archive_path, const std::filesystem::path &file_path);
    std::optional<archive_error_t> finish();

private:
    ZipWriter(const std::filesystem::path &output_path_);

    write_archive_t writer;
    std::filesystem::path output_path;
};

// names and types of all entries, in archive order
std::variant<std::vector<zip_entry_info_t>, archive_error_t> read_zip_index(const std::filesystem::path &input_path);

// Writes plain file entries to output_directory/<name>, creating parent directories.
// Other entry types are skipped. on_entry is called for every entry before it is processed.
std::optional<archive_error_t> write_zip_files(
    const std::filesystem::path &input_path,
    const std::filesystem::path &output_directory,
    const std::function<void(const std::string &)> &on_entry);

// libarchive extraction of the whole zip file (directories, permissions, everything)
std::optional<archive_error_t> extract_zip(const std::filesystem::path &input_path, const std::filesystem::path &output_directory);
